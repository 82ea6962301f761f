#pragma once

#include "promptline/core/common.hpp"
#include "promptline/core/errors.hpp"
#include <algorithm>
#include <functional>
#include <mutex>

namespace promptline {

// Opaque subscription token; only good for Unsubscribe
class ObserverHandle {
public:
    ObserverHandle() = default;

    uint64_t id() const noexcept { return id_; }
    bool IsValid() const noexcept { return id_ != 0; }

    bool operator==(const ObserverHandle& other) const noexcept { return id_ == other.id_; }
    bool operator!=(const ObserverHandle& other) const noexcept { return id_ != other.id_; }

private:
    template<typename Event>
    friend class Notifier;

    explicit ObserverHandle(uint64_t id) : id_(id) {}

    uint64_t id_ = 0;
};

template<typename Event>
class IObserver {
public:
    virtual ~IObserver() = default;
    virtual void OnEvent(const Event& event) = 0;
};

template<typename Event>
class FunctionObserver : public IObserver<Event> {
public:
    explicit FunctionObserver(std::function<void(const Event&)> callback) : callback_(std::move(callback)) {}

    void OnEvent(const Event& event) override { callback_(event); }

private:
    std::function<void(const Event&)> callback_;
};

struct PublishOutcome {
    size_t delivered = 0;
    std::vector<ObserverError> errors;

    bool Succeeded() const noexcept { return errors.empty(); }
};

// One-to-many broadcast of `Event`. Delivery order is subscription order. Each
// Publish works on the subscriber snapshot taken when it starts, so
// Subscribe/Unsubscribe never wait for a delivery in progress. Nothing is
// buffered: late subscribers never see earlier events.
template<typename Event>
class Notifier {
public:
    Notifier() = default;
    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    ObserverHandle Subscribe(std::shared_ptr<IObserver<Event>> observer) {
        if (!observer) {
            throw InvalidArgumentError("Notifier", "observer cannot be null");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const auto id = ++next_id_;
        subscriptions_.push_back({id, std::move(observer)});
        return ObserverHandle(id);
    }

    ObserverHandle Subscribe(std::function<void(const Event&)> callback) {
        if (!callback) {
            throw InvalidArgumentError("Notifier", "observer callback cannot be empty");
        }
        return Subscribe(std::make_shared<FunctionObserver<Event>>(std::move(callback)));
    }

    // No-op for a handle that is already gone
    bool Unsubscribe(const ObserverHandle& handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                               [&handle](const Subscription& subscription) { return subscription.id == handle.id(); });
        if (it == subscriptions_.end()) {
            return false;
        }
        subscriptions_.erase(it);
        return true;
    }

    // A failing observer is logged and reported in the outcome; delivery to
    // the rest continues
    PublishOutcome Publish(const Event& event) const {
        std::vector<Subscription> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = subscriptions_;
        }

        PublishOutcome outcome;
        for (const auto& subscription: snapshot) {
            try {
                subscription.observer->OnEvent(event);
                outcome.delivered++;
            } catch (const std::exception& e) {
                outcome.errors.emplace_back(subscription.id, e.what());
            } catch (...) {
                outcome.errors.emplace_back(subscription.id, "non-standard exception");
            }
        }

        for (const auto& error: outcome.errors) {
            std::cerr << error.what() << '\n';
        }
        return outcome;
    }

    size_t GetSubscriberCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_.size();
    }

private:
    struct Subscription {
        uint64_t id;
        std::shared_ptr<IObserver<Event>> observer;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t next_id_ = 0;
};

}// namespace promptline
