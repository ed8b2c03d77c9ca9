/**
 * @file cancellation.hpp
 * @brief Cancellation tokens, deadlines and interruptible waits for CanvaSDK C++
 */

#ifndef CANVASDK_CANCELLATION_HPP
#define CANVASDK_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace canvasdk {

using SteadyTimePoint = std::chrono::steady_clock::time_point;
using SteadyClock = std::function<SteadyTimePoint()>;

/**
 * Caller-owned cancellation signal.
 *
 * cancel() wakes every thread blocked in wait_for().
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * Block for up to the given duration
     * @param duration Maximum wait
     * @return true if cancelled before or during the wait
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

/**
 * Per-call cancellation and deadline, threaded through every blocking wait
 */
struct CallContext {
    const CancellationToken* cancel = nullptr;
    std::optional<SteadyTimePoint> deadline;

    bool cancelled() const { return cancel != nullptr && cancel->is_cancelled(); }

    /**
     * Throw CancellationError if the token has fired
     */
    void throw_if_cancelled() const;

    /**
     * Time left before the deadline, or nullopt when unbounded
     */
    std::optional<std::chrono::milliseconds> remaining(SteadyTimePoint now) const;

    /**
     * Copy of this context whose deadline is the earlier of the current one and `until`
     */
    CallContext with_deadline(SteadyTimePoint until) const;
};

/**
 * Blocking wait used for backoff and polling.
 * Implementations throw CancellationError when the context is cancelled mid-wait.
 */
using SleepFunction = std::function<void(std::chrono::milliseconds, const CallContext&)>;

/**
 * Default SleepFunction: waits on the context's token, or sleeps when there is none
 */
void interruptible_sleep(std::chrono::milliseconds duration, const CallContext& ctx);

SteadyTimePoint steady_now();

} // namespace canvasdk

#endif // CANVASDK_CANCELLATION_HPP
