/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation helpers built on std::stop_token.
 *
 * std::stop_source is the cancellation handle shared between a caller and
 * an experiment run. These helpers add the pieces the standard library does
 * not provide directly: an interruptible sleep, a "cancel after delay"
 * timer, and a source linked to an upstream token.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace autotune {

/**
 * @brief Sleep for @p duration unless @p stop fires first.
 *
 * @return true if the full duration elapsed, false if interrupted.
 */
bool interruptible_sleep(Duration duration, std::stop_token stop);

/**
 * @brief Requests stop on a source once a delay has elapsed.
 *
 * The timer thread is a std::jthread; destroying (or cancel()-ing) the
 * object before the delay elapses disarms it without touching the target.
 */
class DelayedCancellation {
public:
    DelayedCancellation(std::stop_source target, Duration delay);
    ~DelayedCancellation();

    DelayedCancellation(const DelayedCancellation&) = delete;
    DelayedCancellation& operator=(const DelayedCancellation&) = delete;

    /// Disarm the timer. Has no effect once it has fired.
    void cancel();

    [[nodiscard]] bool fired() const noexcept;

private:
    std::stop_source target_;
    std::atomic<bool> fired_{false};
    std::jthread timer_;
};

/**
 * @brief A stop source that also stops when an upstream token does.
 *
 * Stopping this source never propagates back to the upstream token.
 */
class LinkedStopSource {
public:
    explicit LinkedStopSource(std::stop_token upstream);

    LinkedStopSource(const LinkedStopSource&) = delete;
    LinkedStopSource& operator=(const LinkedStopSource&) = delete;

    [[nodiscard]] std::stop_source& source() noexcept { return source_; }
    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }
    [[nodiscard]] bool stop_requested() const noexcept { return source_.stop_requested(); }

    bool request_stop() noexcept { return source_.request_stop(); }

private:
    struct Forward {
        std::stop_source* target;
        void operator()() const noexcept { target->request_stop(); }
    };

    std::stop_source source_;
    std::optional<std::stop_callback<Forward>> link_;
};

}  // namespace autotune
