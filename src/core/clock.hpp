#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief One-shot cancellation flag that sleeping threads can wait on
 *
 * cancel() wakes every thread currently blocked in wait_until(), so a
 * periodic task stops at its next sleep checkpoint instead of finishing
 * the full period first.
 */
class CancellationToken {
private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool cancelled{false};

public:
    /**
     * @brief Request cancellation and wake all waiters
     */
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            cancelled = true;
        }
        cv.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mtx);
        return cancelled;
    }

    /**
     * @brief Block until the deadline passes or cancellation is requested
     * @param deadline Absolute wake time
     * @return true if cancelled, false if the deadline was reached
     */
    template<typename Clock, typename Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_until(lock, deadline, [this] { return cancelled; });
    }
};

/**
 * @brief Periodic tick source for the sensor update loops
 *
 * Keeps the next wake time anchored to the start time plus multiples of
 * the period so repeated ticks do not drift. When a tick overruns its
 * period (a slow upstream fetch) the schedule restarts from now rather
 * than firing a burst of catch-up ticks.
 */
struct PeriodicClock {
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds period;
    clock::time_point next;

    /**
     * @brief Construct a new Periodic Clock
     * @param p Period between clock ticks
     */
    explicit PeriodicClock(std::chrono::nanoseconds p)
        : period(p), next(clock::now() + p) {}

    /**
     * @brief Sleep until the next scheduled tick or until cancelled
     * @param token Cancellation token checked while sleeping
     * @return true if the tick is due, false if cancellation was requested
     */
    bool wait_next(CancellationToken& token) {
        if (token.wait_until(next)) {
            return false;
        }
        next += period;
        auto now = clock::now();
        if (next <= now) {
            next = now + period;
        }
        return true;
    }

    std::chrono::nanoseconds get_period() const {
        return period;
    }

    /**
     * @brief Get time until next scheduled wake
     */
    std::chrono::nanoseconds time_to_next() const {
        auto now = clock::now();
        if (next <= now) {
            return std::chrono::nanoseconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(next - now);
    }
};
