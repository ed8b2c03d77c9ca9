/**
 * @file cancellation.cpp
 * @brief Cancellation and interruptible wait implementation for CanvaSDK C++
 */

#include "canvasdk/cancellation.hpp"
#include "canvasdk/errors.hpp"
#include <thread>

namespace canvasdk {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
}

void CallContext::throw_if_cancelled() const {
    if (cancelled()) {
        throw CancellationError();
    }
}

std::optional<std::chrono::milliseconds> CallContext::remaining(SteadyTimePoint now) const {
    if (!deadline.has_value()) {
        return std::nullopt;
    }
    if (*deadline <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now);
}

CallContext CallContext::with_deadline(SteadyTimePoint until) const {
    CallContext copy = *this;
    if (!copy.deadline.has_value() || until < *copy.deadline) {
        copy.deadline = until;
    }
    return copy;
}

void interruptible_sleep(std::chrono::milliseconds duration, const CallContext& ctx) {
    if (duration.count() <= 0) {
        ctx.throw_if_cancelled();
        return;
    }
    if (ctx.cancel == nullptr) {
        std::this_thread::sleep_for(duration);
        return;
    }
    if (ctx.cancel->wait_for(duration)) {
        throw CancellationError();
    }
}

SteadyTimePoint steady_now() {
    return std::chrono::steady_clock::now();
}

} // namespace canvasdk
