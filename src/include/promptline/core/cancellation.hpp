#pragma once

#include "promptline/core/common.hpp"
#include "promptline/core/errors.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <system_error>
#include <thread>

namespace promptline {

// Cancellation signal plus optional deadline, shared by copies of the token.
// A default-constructed token never expires and Cancel() on it has no effect.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    static CancellationToken Cancellable();
    static CancellationToken WithTimeout(std::chrono::milliseconds timeout);
    static CancellationToken WithDeadline(Clock::time_point deadline);

    // Same cancel flag, deadline tightened to now + timeout. A zero timeout
    // returns the token unchanged.
    CancellationToken Restrict(std::chrono::milliseconds timeout) const;

    void Cancel() const noexcept;
    bool IsCancelled() const noexcept;
    bool IsExpired() const noexcept;
    bool CanExpire() const noexcept { return cancelled_ != nullptr || deadline_.has_value(); }
    const std::optional<Clock::time_point>& deadline() const noexcept { return deadline_; }

    void ThrowIfExpired(const std::string& component, const std::string& operation) const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

constexpr auto CANCELLATION_POLL_INTERVAL = std::chrono::milliseconds(5);
constexpr size_t MAX_DEADLINE_WORKERS = 64;

namespace detail {
std::atomic<size_t>& DeadlineWorkerCount();
}// namespace detail

// Workers started by RunWithDeadline that have not returned yet, abandoned
// ones included
size_t GetOutstandingWorkerCount();

// Runs `fn` so that the caller gives up with TimeoutError once `token`
// expires. Tokens that cannot expire run `fn` inline. Otherwise `fn` runs on a
// detached thread and must own everything it touches; a timed-out call is
// abandoned and its eventual outcome discarded. An abandoned call keeps its
// thread until `fn` returns, so a backend that hangs holds one thread per
// call. Once MAX_DEADLINE_WORKERS workers are outstanding, further calls fail
// with TimeoutError without starting.
template<typename Fn>
auto RunWithDeadline(const std::string& component, const std::string& operation, const CancellationToken& token,
                     Fn fn) -> decltype(fn()) {
    using ResultType = decltype(fn());

    token.ThrowIfExpired(component, operation);
    if (!token.CanExpire()) {
        return fn();
    }

    auto& workers = detail::DeadlineWorkerCount();
    if (workers.fetch_add(1) >= MAX_DEADLINE_WORKERS) {
        workers.fetch_sub(1);
        throw TimeoutError(component, fmt::format("{} not started, {} earlier calls are still running past their deadline",
                                                  operation, MAX_DEADLINE_WORKERS));
    }

    auto promise = std::make_shared<std::promise<ResultType>>();
    auto future = promise->get_future();
    try {
        std::thread([promise, fn = std::move(fn)]() mutable {
            std::optional<ResultType> value;
            std::exception_ptr error;
            try {
                value.emplace(fn());
            } catch (...) {
                error = std::current_exception();
            }
            // released before the caller can observe the outcome
            detail::DeadlineWorkerCount().fetch_sub(1);
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(*value));
            }
        }).detach();
    } catch (const std::system_error&) {
        workers.fetch_sub(1);
        throw;
    }

    while (true) {
        auto slice = std::chrono::duration_cast<CancellationToken::Clock::duration>(CANCELLATION_POLL_INTERVAL);
        if (token.deadline().has_value()) {
            const auto remaining = *token.deadline() - CancellationToken::Clock::now();
            slice = std::max(CancellationToken::Clock::duration::zero(), std::min(slice, remaining));
        }
        if (future.wait_for(slice) == std::future_status::ready) {
            return future.get();
        }
        token.ThrowIfExpired(component, operation);
    }
}

}// namespace promptline
