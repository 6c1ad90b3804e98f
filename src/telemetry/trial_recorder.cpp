/**
 * @file trial_recorder.cpp
 * @brief TrialEventRecorder implementation.
 */

#include "telemetry/trial_recorder.hpp"

#include "core/json.hpp"

#include <sstream>

namespace autotune {

TrialEventRecorder::TrialEventRecorder(EventChannel& channel, std::unique_ptr<ILogSink> sink)
    : channel_(channel), sink_(std::move(sink)) {
    subscription_ = channel_.subscribe([this](const TrialEvent& event) {
        record_trial_event(event);
    });
}

TrialEventRecorder::~TrialEventRecorder() {
    channel_.unsubscribe(subscription_);
    flush();
}

void TrialEventRecorder::record_trial_event(const TrialEvent& event) {
    std::ostringstream oss;
    oss << R"({"event":")" << to_string(event.kind) << "\""
        << R"(,"trial":)" << event.trial_id;
    if (event.metric) {
        oss << R"(,"metric":)";
        write_json_number(oss, *event.metric);
    }
    if (event.duration.count() > 0) {
        oss << R"(,"duration_ms":)" << event.duration.count();
    }
    if (!event.message.empty()) {
        oss << R"(,"msg":")" << escape_json(event.message) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void TrialEventRecorder::record_summary(std::string_view outcome,
                                        size_t completed_trials,
                                        std::optional<TrialResult> best,
                                        Duration elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"experiment_summary")"
        << R"(,"outcome":")" << escape_json(outcome) << "\""
        << R"(,"completed":)" << completed_trials
        << R"(,"elapsed_ms":)" << elapsed.count();
    if (best) {
        oss << R"(,"best_trial":)" << best->trial_id() << R"(,"best_metric":)";
        write_json_number(oss, best->metric);
        if (best->settings) {
            oss << R"(,"parameters":)" << to_json(best->settings->parameters);
        }
    }
    oss << "}";
    emit(oss.str());
}

size_t TrialEventRecorder::events_recorded() const {
    std::lock_guard lock(write_mutex_);
    return events_recorded_;
}

void TrialEventRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_recorded_;
}

void TrialEventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace autotune
