/**
 * @file cancellation.cpp
 * @brief Interruptible waits and delayed cancellation.
 */

#include "core/cancellation.hpp"

namespace autotune {

bool interruptible_sleep(Duration duration, std::stop_token stop) {
    if (stop.stop_requested()) return false;
    if (duration <= Duration::zero()) return true;

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);

    // Nothing notifies cv; wait_for returns on timeout or on a stop request.
    (void)cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

// ── DelayedCancellation ──────────────────────

DelayedCancellation::DelayedCancellation(std::stop_source target, Duration delay)
    : target_(std::move(target)) {
    timer_ = std::jthread([this, delay](std::stop_token disarm) {
        if (interruptible_sleep(delay, disarm)) {
            fired_.store(true);
            target_.request_stop();
        }
    });
}

DelayedCancellation::~DelayedCancellation() {
    cancel();
}

void DelayedCancellation::cancel() {
    timer_.request_stop();
    if (timer_.joinable() && timer_.get_id() != std::this_thread::get_id()) {
        timer_.join();
    }
}

bool DelayedCancellation::fired() const noexcept {
    return fired_.load();
}

// ── LinkedStopSource ─────────────────────────

LinkedStopSource::LinkedStopSource(std::stop_token upstream) {
    // Registering on an already-stopped token runs the callback inline.
    link_.emplace(std::move(upstream), Forward{&source_});
}

}  // namespace autotune
