#pragma once

#include "playback_monitor/core/models.hpp"
#include "playback_monitor/services/notification/bounded_queue.hpp"
#include "playback_monitor/services/notification/notification_handler.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace playback_monitor {
namespace services {

/**
 * @brief Delivers lifecycle transitions to notification handlers
 *
 * enqueue() never blocks the reconciler: when the queue is full the oldest
 * pending event is dropped and counted. A single consumer thread maps each
 * event to its actions and hands every action to every handler, retrying a
 * failing or throwing handler without holding up the others.
 */
class NotificationDispatcher {
public:
    struct Counters {
        std::uint64_t enqueued = 0;
        std::uint64_t dropped = 0;
        std::uint64_t delivered = 0;
        std::uint64_t failed = 0;
    };

    explicit NotificationDispatcher(core::NotificationConfig config);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    void add_handler(std::shared_ptr<NotificationHandler> handler);
    void clear_handlers();
    std::size_t handler_count() const;

    void start();

    // Delivers what is already queued, then joins the consumer
    void stop();

    bool is_running() const { return m_running.load(); }

    // Returns false when an older pending event was dropped to make room
    bool enqueue(const core::LifecycleEvent& event);

    // Waits until every accepted event has been delivered or dropped
    bool wait_idle(std::chrono::milliseconds timeout);

    void set_config(const core::NotificationConfig& config);
    core::NotificationConfig config() const;

    Counters counters() const;
    std::size_t queue_size() const { return m_queue.size(); }

    static std::vector<core::Notification> map_actions(const core::LifecycleEvent& event,
                                                       int watched_threshold_percent);

private:
    void run(std::stop_token stop_token);
    void dispatch(const core::LifecycleEvent& event);
    void deliver(NotificationHandler& handler, const core::Notification& notification, int retries);
    void settle(std::uint64_t count);

    mutable std::mutex m_config_mutex;
    core::NotificationConfig m_config;

    mutable std::mutex m_handlers_mutex;
    std::vector<std::shared_ptr<NotificationHandler>> m_handlers;

    BoundedQueue<core::LifecycleEvent> m_queue;

    std::mutex m_idle_mutex;
    std::condition_variable m_idle;
    std::uint64_t m_outstanding = 0;

    std::atomic<std::uint64_t> m_enqueued{0};
    std::atomic<std::uint64_t> m_delivered{0};
    std::atomic<std::uint64_t> m_failed{0};

    std::atomic<bool> m_running{false};
    std::jthread m_thread;
};

} // namespace services
} // namespace playback_monitor
