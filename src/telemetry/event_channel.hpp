/**
 * @file event_channel.hpp
 * @brief Synchronous publish/subscribe channel for trial lifecycle events.
 *
 * The channel is passed explicitly to the scheduler and the trial runners.
 * Handlers run on the publishing thread, in subscription order, and may
 * call back into the channel (subscribe, unsubscribe) or request stop on
 * the experiment's stop source from inside the handler.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace autotune {

enum class TrialEventKind : uint8_t {
    Running,        ///< Trial dispatched, runner about to block
    Progress,       ///< Free-form runner progress
    Completed,      ///< Runner produced a result
    Failed,         ///< Runner reported an error
    Cancelled,      ///< Runner interrupted by the stop token
    BestUpdated     ///< Best-result tracker moved to this trial
};

[[nodiscard]] constexpr std::string_view to_string(TrialEventKind kind) noexcept {
    switch (kind) {
        case TrialEventKind::Running:     return "trial_running";
        case TrialEventKind::Progress:    return "trial_progress";
        case TrialEventKind::Completed:   return "trial_completed";
        case TrialEventKind::Failed:      return "trial_failed";
        case TrialEventKind::Cancelled:   return "trial_cancelled";
        case TrialEventKind::BestUpdated: return "best_trial";
    }
    return "unknown";
}

struct TrialEvent {
    TrialEventKind kind = TrialEventKind::Progress;
    TrialId trial_id{0};
    std::string message;
    std::optional<double> metric;
    Duration duration{0};
};

using SubscriptionId = uint64_t;
using TrialEventHandler = std::function<void(const TrialEvent&)>;

class EventChannel {
public:
    SubscriptionId subscribe(TrialEventHandler handler);

    /**
     * @brief Remove a subscription.
     *
     * Blocks until every call of the handler running on another thread has
     * returned, so state the handler captures may be released afterwards.
     * A handler may unsubscribe itself; that call does not wait for itself.
     *
     * @return false if @p id was not subscribed.
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Deliver @p event to every current subscriber.
     *
     * Handlers are invoked outside the channel lock. A handler removed
     * during delivery is not called after its removal.
     */
    void publish(const TrialEvent& event);

    [[nodiscard]] size_t subscriber_count() const;

private:
    struct Entry {
        TrialEventHandler handler;
        std::vector<std::thread::id> callers;   ///< Threads inside handler
        bool removed = false;
    };

    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<Entry> entry;
    };

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::vector<Subscription> subscriptions_;
    SubscriptionId next_id_{1};
};

}  // namespace autotune
