#pragma once

#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/core/models.hpp"
#include "playback_monitor/services/connector/backend_connector.hpp"
#include "playback_monitor/services/history/history_store.hpp"
#include "playback_monitor/services/history/history_writer.hpp"
#include "playback_monitor/services/monitor/observation_intake.hpp"
#include "playback_monitor/services/monitor/poller.hpp"
#include "playback_monitor/services/monitor/push_ingestor.hpp"
#include "playback_monitor/services/monitor/session_reconciler.hpp"
#include "playback_monitor/services/network/http_client.hpp"
#include "playback_monitor/services/notification/notification_dispatcher.hpp"
#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace playback_monitor {
namespace core {

struct PipelineStatus {
    bool running = false;
    std::size_t live_sessions = 0;
    std::size_t pending_flushes = 0;
    bool push_supported = true;
    bool push_connected = false;
    int poll_failures = 0;
    bool poller_healthy = true;
    bool storage_healthy = true;
    services::SessionReconciler::Counters reconciler;
    services::ObservationIntake::Stats intake;
    services::NotificationDispatcher::Counters notifications;
    services::PushIngestor::Stats push;
};

/**
 * @brief Wires connector, poller, push ingestor, reconciler, history writer
 * and notification dispatcher into one running unit
 *
 * Data flows connector -> {poller, push ingestor} -> intake -> reconciler
 * -> {history writer, dispatcher}. A housekeeping thread retries failed
 * history flushes and closes sessions nobody has reported within the grace
 * period. Configuration changes published on the event bus are re-issued
 * to the running components.
 *
 * A pipeline runs once: after stop() it cannot be started again.
 */
class MonitoringPipeline {
    // Restricts construction to create()
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    // Optional overrides; missing pieces are built from the configuration
    struct Dependencies {
        std::shared_ptr<services::HttpClient> http_client;
        std::shared_ptr<services::BackendConnector> connector;
        std::shared_ptr<services::HistoryStore> history_store;
    };

    static std::expected<std::unique_ptr<MonitoringPipeline>, PipelineError>
    create(const MonitorConfig& config, std::shared_ptr<EventBus> bus, Dependencies dependencies = {});

    MonitoringPipeline(ConstructionKey,
                       const MonitorConfig& config,
                       std::shared_ptr<EventBus> bus,
                       std::shared_ptr<services::BackendConnector> connector,
                       std::shared_ptr<services::HistoryStore> store,
                       std::shared_ptr<services::HttpClient> http_client);
    ~MonitoringPipeline();

    MonitoringPipeline(const MonitoringPipeline&) = delete;
    MonitoringPipeline& operator=(const MonitoringPipeline&) = delete;

    std::expected<void, PipelineError> start();

    // Cancels the producers, applies what is queued, closes every live
    // session into history and delivers the remaining notifications
    void stop();

    bool is_running() const { return m_running.load(); }

    PipelineStatus status() const;
    std::vector<Session> live_sessions() const;

    std::expected<void, ConnectorError> send_command(const SessionKey& key, const SessionCommand& command);

    void apply_config(const MonitorConfig& config);
    MonitorConfig config() const;

    // Registered in addition to the handlers named by the configuration
    void add_notification_handler(std::shared_ptr<services::NotificationHandler> handler);

    // One housekeeping pass; returns the number of sessions expired
    std::size_t run_housekeeping(TimePoint now = Clock::now());

    services::ObservationIntake& intake() { return *m_intake; }
    services::SessionReconciler& reconciler() { return *m_reconciler; }
    services::Poller& poller() { return *m_poller; }
    services::PushIngestor& push_ingestor() { return *m_push_ingestor; }
    services::HistoryWriter& history_writer() { return *m_history_writer; }
    services::NotificationDispatcher& dispatcher() { return *m_dispatcher; }

    static constexpr std::chrono::seconds HOUSEKEEPING_INTERVAL{1};

private:
    void rebuild_handlers(const NotificationConfig& config);
    void housekeeping_loop(std::stop_token stop_token);

    mutable std::mutex m_config_mutex;
    MonitorConfig m_config;

    std::shared_ptr<EventBus> m_event_bus;
    std::shared_ptr<services::BackendConnector> m_connector;
    std::shared_ptr<services::HistoryStore> m_history_store;
    std::shared_ptr<services::HttpClient> m_http_client;

    std::unique_ptr<services::HistoryWriter> m_history_writer;
    std::unique_ptr<services::NotificationDispatcher> m_dispatcher;
    std::unique_ptr<services::SessionReconciler> m_reconciler;
    std::unique_ptr<services::ObservationIntake> m_intake;
    std::unique_ptr<services::Poller> m_poller;
    std::unique_ptr<services::PushIngestor> m_push_ingestor;

    std::mutex m_handlers_mutex;
    std::vector<std::shared_ptr<services::NotificationHandler>> m_extra_handlers;

    EventBus::HandlerId m_config_subscription = 0;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopped{false};
    std::jthread m_housekeeping;
};

} // namespace core
} // namespace playback_monitor
