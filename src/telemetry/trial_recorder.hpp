/**
 * @file trial_recorder.hpp
 * @brief Structured NDJSON telemetry for trial events.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "telemetry/event_channel.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace autotune {

/**
 * @brief Subscribes to an EventChannel and writes one NDJSON line per event.
 *
 * Detaches from the channel on destruction; the channel must outlive it.
 */
class TrialEventRecorder {
public:
    TrialEventRecorder(EventChannel& channel, std::unique_ptr<ILogSink> sink);
    ~TrialEventRecorder();

    TrialEventRecorder(const TrialEventRecorder&) = delete;
    TrialEventRecorder& operator=(const TrialEventRecorder&) = delete;

    void record_trial_event(const TrialEvent& event);
    void record_summary(std::string_view outcome,
                        size_t completed_trials,
                        std::optional<TrialResult> best,
                        Duration elapsed);

    [[nodiscard]] size_t events_recorded() const;

    void flush();

private:
    void emit(std::string_view json_line);

    EventChannel& channel_;
    SubscriptionId subscription_;
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    size_t events_recorded_{0};
};

}  // namespace autotune
