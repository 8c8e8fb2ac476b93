#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/utils/logger.hpp"

namespace playback_monitor::core {

void EventBus::unsubscribe(HandlerId id) {
    std::lock_guard lock(m_mutex);
    for (auto& [type, subscriptions] : m_subscriptions) {
        const auto removed = std::erase_if(subscriptions, [id](const Subscription& s) { return s.id == id; });
        if (removed > 0) {
            return;
        }
    }
}

std::vector<EventBus::Subscription> EventBus::snapshot(std::type_index type) const {
    std::lock_guard lock(m_mutex);
    const auto it = m_subscriptions.find(type);
    if (it == m_subscriptions.end()) {
        return {};
    }
    return it->second;
}

void EventBus::report_failure(const char* event_type, HandlerId id, const std::exception& e) const {
    LOG_ERROR("EventBus", std::string("Handler ") + std::to_string(id) + " failed on " + event_type + ": " + e.what());
}

} // namespace playback_monitor::core
