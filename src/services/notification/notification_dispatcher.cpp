#include "playback_monitor/services/notification/notification_dispatcher.hpp"
#include "playback_monitor/core/session_state.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <algorithm>

namespace playback_monitor {
namespace services {

using core::NotificationAction;
using core::SessionState;

NotificationDispatcher::NotificationDispatcher(core::NotificationConfig config)
    : m_config(std::move(config))
    , m_queue(m_config.queue_capacity) {}

NotificationDispatcher::~NotificationDispatcher() {
    stop();
}

void NotificationDispatcher::add_handler(std::shared_ptr<NotificationHandler> handler) {
    if (!handler) {
        return;
    }
    std::lock_guard lock(m_handlers_mutex);
    LOG_DEBUG("NotificationDispatcher", "Registered handler " + handler->name());
    m_handlers.push_back(std::move(handler));
}

void NotificationDispatcher::clear_handlers() {
    std::lock_guard lock(m_handlers_mutex);
    m_handlers.clear();
}

std::size_t NotificationDispatcher::handler_count() const {
    std::lock_guard lock(m_handlers_mutex);
    return m_handlers.size();
}

void NotificationDispatcher::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_queue.reopen();
    m_thread = std::jthread([this](std::stop_token stop_token) { run(stop_token); });
}

void NotificationDispatcher::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    // Closing lets the consumer finish the backlog before pop() reports the end
    m_queue.close();
    if (m_thread.joinable()) {
        m_thread.join();
    }

    const auto totals = counters();
    LOG_DEBUG("NotificationDispatcher", "Stopped: delivered=" + std::to_string(totals.delivered) +
              " failed=" + std::to_string(totals.failed) + " dropped=" + std::to_string(totals.dropped));
}

void NotificationDispatcher::set_config(const core::NotificationConfig& config) {
    {
        std::lock_guard lock(m_config_mutex);
        m_config = config;
    }

    settle(m_queue.set_capacity(config.queue_capacity));
}

core::NotificationConfig NotificationDispatcher::config() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

NotificationDispatcher::Counters NotificationDispatcher::counters() const {
    return Counters{
        .enqueued = m_enqueued.load(),
        .dropped = m_queue.dropped(),
        .delivered = m_delivered.load(),
        .failed = m_failed.load()
    };
}

bool NotificationDispatcher::enqueue(const core::LifecycleEvent& event) {
    m_enqueued.fetch_add(1);
    {
        std::lock_guard lock(m_idle_mutex);
        ++m_outstanding;
    }

    const auto dropped = m_queue.push(event);
    if (dropped == 0) {
        return true;
    }
    LOG_DEBUG("NotificationDispatcher", "Queue full, dropped " + std::to_string(dropped) + " pending events");
    settle(dropped);
    return false;
}

void NotificationDispatcher::settle(std::uint64_t count) {
    if (count == 0) {
        return;
    }
    {
        std::lock_guard lock(m_idle_mutex);
        m_outstanding = m_outstanding > count ? m_outstanding - count : 0;
    }
    m_idle.notify_all();
}

bool NotificationDispatcher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(m_idle_mutex);
    return m_idle.wait_for(lock, timeout, [this] { return m_outstanding == 0; });
}

std::vector<core::Notification> NotificationDispatcher::map_actions(const core::LifecycleEvent& event,
                                                                    int watched_threshold_percent) {
    std::vector<NotificationAction> actions;

    switch (event.to_state) {
        case SessionState::Playing:
            if (event.from_state == SessionState::Starting) {
                actions.push_back(NotificationAction::OnStart);
            } else if (event.from_state == SessionState::Paused) {
                actions.push_back(NotificationAction::OnResume);
            }
            break;
        case SessionState::Paused:
            if (event.from_state == SessionState::Starting) {
                actions.push_back(NotificationAction::OnStart);
            } else if (event.from_state == SessionState::Playing) {
                actions.push_back(NotificationAction::OnPause);
            }
            break;
        case SessionState::Buffering:
            if (event.from_state == SessionState::Starting) {
                actions.push_back(NotificationAction::OnStart);
            }
            break;
        case SessionState::Stopped:
            actions.push_back(NotificationAction::OnStop);
            break;
        case SessionState::Error:
            actions.push_back(NotificationAction::OnError);
            break;
        case SessionState::Starting:
            break;
    }

    const int watched = core::compute_watched_percent(event.snapshot.position_ms, event.snapshot.duration_ms);
    if (event.to_state == SessionState::Stopped && watched >= watched_threshold_percent) {
        actions.push_back(NotificationAction::OnWatched);
    }

    std::vector<core::Notification> notifications;
    notifications.reserve(actions.size());
    for (auto action : actions) {
        notifications.push_back(core::Notification{
            .action = action,
            .session_key = event.session_key,
            .user_id = event.snapshot.user_id,
            .item_id = event.snapshot.item_id,
            .timestamp = event.timestamp,
            .snapshot = event.snapshot,
            .watched_percent = watched
        });
    }
    return notifications;
}

void NotificationDispatcher::run(std::stop_token stop_token) {
    while (auto event = m_queue.pop(stop_token)) {
        dispatch(*event);
        settle(1);
    }
}

void NotificationDispatcher::dispatch(const core::LifecycleEvent& event) {
    const auto cfg = config();
    const auto notifications = map_actions(event, cfg.watched_threshold_percent);
    if (notifications.empty()) {
        return;
    }

    std::vector<std::shared_ptr<NotificationHandler>> handlers;
    {
        std::lock_guard lock(m_handlers_mutex);
        handlers = m_handlers;
    }

    for (const auto& notification : notifications) {
        for (const auto& handler : handlers) {
            deliver(*handler, notification, cfg.handler_retries);
        }
    }
}

void NotificationDispatcher::deliver(NotificationHandler& handler, const core::Notification& notification,
                                     int retries) {
    const int attempts = 1 + std::max(0, retries);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto result = handler.handle(notification);
            if (result) {
                m_delivered.fetch_add(1);
                return;
            }
            LOG_DEBUG("NotificationDispatcher", handler.name() + " failed " + core::to_string(notification.action) +
                      " (" + to_string(result.error()) + "), attempt " + std::to_string(attempt));
        } catch (const std::exception& e) {
            LOG_WARNING("NotificationDispatcher", handler.name() + " threw on " +
                        core::to_string(notification.action) + ": " + e.what());
        }
    }

    m_failed.fetch_add(1);
    LOG_WARNING("NotificationDispatcher", "Giving up on " + core::to_string(notification.action) + " for " +
                notification.session_key.get() + " via " + handler.name());
}

} // namespace services
} // namespace playback_monitor
