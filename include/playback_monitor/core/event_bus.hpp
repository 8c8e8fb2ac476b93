#pragma once

#include <any>
#include <functional>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace playback_monitor::core {

// Synchronous, type-indexed publish/subscribe for operator-facing signals.
// Handlers run on the publishing thread. A throwing handler is logged and
// the remaining handlers still receive the event.
class EventBus {
public:
    using HandlerId = std::size_t;

    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        Subscription subscription{
            .id = 0,
            .invoke = [handler = std::move(handler)](const std::any& event) {
                handler(std::any_cast<const EventType&>(event));
            }
        };

        std::lock_guard lock(m_mutex);
        subscription.id = m_next_id++;
        const HandlerId id = subscription.id;
        m_subscriptions[std::type_index(typeid(EventType))].push_back(std::move(subscription));
        return id;
    }

    template<typename EventType>
    void publish(const EventType& event) {
        const auto targets = snapshot(std::type_index(typeid(EventType)));
        if (targets.empty()) {
            return;
        }

        const std::any payload = event;
        for (const auto& subscription : targets) {
            try {
                subscription.invoke(payload);
            } catch (const std::exception& e) {
                report_failure(typeid(EventType).name(), subscription.id, e);
            }
        }
    }

    void unsubscribe(HandlerId id);

private:
    struct Subscription {
        HandlerId id;
        std::function<void(const std::any&)> invoke;
    };

    std::vector<Subscription> snapshot(std::type_index type) const;
    void report_failure(const char* event_type, HandlerId id, const std::exception& e) const;

    mutable std::mutex m_mutex;
    std::unordered_map<std::type_index, std::vector<Subscription>> m_subscriptions;
    HandlerId m_next_id{1};
};

} // namespace playback_monitor::core
