#include "promptline/core/cancellation.hpp"

namespace promptline {

namespace detail {

std::atomic<size_t>& DeadlineWorkerCount() {
    static std::atomic<size_t> count{0};
    return count;
}

}// namespace detail

size_t GetOutstandingWorkerCount() {
    return detail::DeadlineWorkerCount().load();
}

CancellationToken CancellationToken::Cancellable() {
    CancellationToken token;
    token.cancelled_ = std::make_shared<std::atomic<bool>>(false);
    return token;
}

CancellationToken CancellationToken::WithTimeout(std::chrono::milliseconds timeout) {
    return WithDeadline(Clock::now() + timeout);
}

CancellationToken CancellationToken::WithDeadline(Clock::time_point deadline) {
    auto token = Cancellable();
    token.deadline_ = deadline;
    return token;
}

CancellationToken CancellationToken::Restrict(std::chrono::milliseconds timeout) const {
    if (timeout.count() <= 0) {
        return *this;
    }
    auto restricted = *this;
    if (!restricted.cancelled_) {
        restricted.cancelled_ = std::make_shared<std::atomic<bool>>(false);
    }
    const auto candidate = Clock::now() + timeout;
    if (!restricted.deadline_.has_value() || candidate < *restricted.deadline_) {
        restricted.deadline_ = candidate;
    }
    return restricted;
}

void CancellationToken::Cancel() const noexcept {
    if (cancelled_) {
        cancelled_->store(true);
    }
}

bool CancellationToken::IsCancelled() const noexcept {
    return cancelled_ && cancelled_->load();
}

bool CancellationToken::IsExpired() const noexcept {
    if (IsCancelled()) {
        return true;
    }
    return deadline_.has_value() && Clock::now() >= *deadline_;
}

void CancellationToken::ThrowIfExpired(const std::string& component, const std::string& operation) const {
    if (IsCancelled()) {
        throw TimeoutError(component, fmt::format("{} was cancelled", operation));
    }
    if (deadline_.has_value() && Clock::now() >= *deadline_) {
        throw TimeoutError(component, fmt::format("{} exceeded its deadline", operation));
    }
}

}// namespace promptline
