/**
 * @file event_channel.cpp
 * @brief EventChannel implementation.
 */

#include "telemetry/event_channel.hpp"

#include <algorithm>

namespace autotune {

SubscriptionId EventChannel::subscribe(TrialEventHandler handler) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    auto entry = std::make_shared<Entry>();
    entry->handler = std::move(handler);
    subscriptions_.push_back(Subscription{.id = id, .entry = std::move(entry)});
    return id;
}

bool EventChannel::unsubscribe(SubscriptionId id) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) return false;
    auto entry = it->entry;
    entry->removed = true;
    subscriptions_.erase(it);

    // Wait out calls on other threads; our own call (self-unsubscribe) stays.
    const auto self = std::this_thread::get_id();
    idle_cv_.wait(lock, [&] {
        return std::all_of(entry->callers.begin(), entry->callers.end(),
                           [self](std::thread::id caller) { return caller == self; });
    });
    return true;
}

void EventChannel::publish(const TrialEvent& event) {
    std::vector<Subscription> snapshot;
    {
        std::lock_guard lock(mutex_);
        snapshot = subscriptions_;
    }

    const auto self = std::this_thread::get_id();
    for (const auto& sub : snapshot) {
        Entry& entry = *sub.entry;
        {
            std::lock_guard lock(mutex_);
            if (entry.removed) continue;
            entry.callers.push_back(self);
        }
        struct Leave {
            EventChannel& channel;
            Entry& entry;
            std::thread::id self;
            ~Leave() {
                {
                    std::lock_guard lock(channel.mutex_);
                    auto& callers = entry.callers;
                    callers.erase(std::find(callers.begin(), callers.end(), self));
                }
                channel.idle_cv_.notify_all();
            }
        } leave{*this, entry, self};
        entry.handler(event);
    }
}

size_t EventChannel::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return subscriptions_.size();
}

}  // namespace autotune
