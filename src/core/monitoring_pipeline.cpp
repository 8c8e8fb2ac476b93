#include "playback_monitor/core/monitoring_pipeline.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/services/history/sqlite_history_store.hpp"
#include "playback_monitor/services/notification/notification_handlers.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/threading.hpp"

namespace playback_monitor {
namespace core {

std::expected<std::unique_ptr<MonitoringPipeline>, PipelineError>
MonitoringPipeline::create(const MonitorConfig& config, std::shared_ptr<EventBus> bus, Dependencies dependencies) {
    if (!config.is_valid()) {
        LOG_ERROR("MonitoringPipeline", "Configuration is invalid");
        return std::unexpected(PipelineError::InvalidConfiguration);
    }

    auto connector = std::move(dependencies.connector);
    if (!connector) {
        auto created = services::create_connector(config.connector, dependencies.http_client);
        if (!created) {
            return std::unexpected(created.error());
        }
        connector = std::move(*created);
    }

    auto store = std::move(dependencies.history_store);
    if (!store) {
        if (config.history.database_path.empty()) {
            LOG_WARNING("MonitoringPipeline", "No history database configured, keeping history in memory");
            store = std::make_shared<services::InMemoryHistoryStore>();
        } else {
            auto opened = services::SqliteHistoryStore::open(config.history.database_path);
            if (!opened) {
                LOG_ERROR("MonitoringPipeline", "History storage unavailable: " + to_string(opened.error()));
                return std::unexpected(PipelineError::StorageUnavailable);
            }
            store = std::move(*opened);
        }
    }

    auto http_client = std::move(dependencies.http_client);
    if (!http_client && !config.notifications.webhook_urls.empty()) {
        services::HttpClientConfig client_config;
        client_config.default_timeout = config.connector.request_timeout;
        http_client = services::create_http_client(client_config);
    }

    if (!bus) {
        bus = std::make_shared<EventBus>();
    }

    return std::make_unique<MonitoringPipeline>(ConstructionKey{}, config, std::move(bus), std::move(connector),
                                                std::move(store), std::move(http_client));
}

MonitoringPipeline::MonitoringPipeline(ConstructionKey,
                                       const MonitorConfig& config,
                                       std::shared_ptr<EventBus> bus,
                                       std::shared_ptr<services::BackendConnector> connector,
                                       std::shared_ptr<services::HistoryStore> store,
                                       std::shared_ptr<services::HttpClient> http_client)
    : m_config(config)
    , m_event_bus(std::move(bus))
    , m_connector(std::move(connector))
    , m_history_store(std::move(store))
    , m_http_client(std::move(http_client)) {
    m_history_writer = std::make_unique<services::HistoryWriter>(m_history_store, config.history);
    m_history_writer->set_event_bus(m_event_bus);

    m_dispatcher = std::make_unique<services::NotificationDispatcher>(config.notifications);
    rebuild_handlers(config.notifications);

    auto* dispatcher = m_dispatcher.get();
    auto* writer = m_history_writer.get();
    m_reconciler = std::make_unique<services::SessionReconciler>(
        config.reconciler.shard_count,
        [this, dispatcher](const LifecycleEvent& event) {
            if (event.to_state == SessionState::Stopped && m_push_ingestor) {
                m_push_ingestor->forget(event.session_key);
            }
            dispatcher->enqueue(event);
        },
        [writer](const Session& session) -> std::expected<void, HistoryError> {
            // Runs on an intake worker; backoff is left to housekeeping
            auto recorded = writer->record_once(session);
            if (!recorded) {
                return std::unexpected(recorded.error());
            }
            return {};
        },
        [writer](const Session& session) -> std::expected<void, HistoryError> {
            auto recorded = writer->record(session);
            if (!recorded) {
                return std::unexpected(recorded.error());
            }
            return {};
        });

    auto* reconciler = m_reconciler.get();
    m_intake = std::make_unique<services::ObservationIntake>(
        config.reconciler.shard_count,
        config.reconciler.intake_capacity,
        [reconciler](const Observation& observation) { reconciler->apply(observation); });

    auto* intake = m_intake.get();
    auto submit = [intake](Observation observation) { intake->submit(std::move(observation)); };

    m_poller = std::make_unique<services::Poller>(
        m_connector, config.poller, submit,
        [reconciler](const std::string& note) { return reconciler->force_stop_poll_only(note); });
    m_poller->set_event_bus(m_event_bus);

    m_push_ingestor = std::make_unique<services::PushIngestor>(m_connector, config.push, submit);
    m_push_ingestor->set_event_bus(m_event_bus);
    m_push_ingestor->set_identity_lookup([reconciler](const SessionKey& key) -> std::optional<SessionSnapshot> {
        if (auto session = reconciler->find(key)) {
            return session->snapshot;
        }
        return std::nullopt;
    });

    m_config_subscription = m_event_bus->subscribe<events::ConfigurationUpdated>(
        [this](const events::ConfigurationUpdated& event) { apply_config(event.new_config); });
}

MonitoringPipeline::~MonitoringPipeline() {
    m_event_bus->unsubscribe(m_config_subscription);
    stop();
}

std::expected<void, PipelineError> MonitoringPipeline::start() {
    if (m_stopped.load() || m_running.exchange(true)) {
        return std::unexpected(PipelineError::AlreadyRunning);
    }

    const auto cfg = config();
    LOG_INFO("MonitoringPipeline", "Starting session monitoring for " + m_connector->backend_name() +
             " at " + cfg.connector.server_url);

    m_dispatcher->start();
    m_intake->start();
    m_poller->start();
    if (cfg.push.enabled) {
        m_push_ingestor->start();
    } else {
        LOG_INFO("MonitoringPipeline", "Push channel disabled, running in poll-only mode");
    }

    m_housekeeping = std::jthread([this](std::stop_token stop_token) { housekeeping_loop(stop_token); });
    return {};
}

void MonitoringPipeline::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    m_stopped = true;

    LOG_INFO("MonitoringPipeline", "Stopping session monitoring");

    // Producers first so nothing new arrives while live sessions are closed
    m_connector->shutdown();
    m_poller->stop();
    m_push_ingestor->stop();

    // Ends backoff waits so housekeeping and the final flush make one attempt each
    m_history_writer->shutdown();
    m_housekeeping.request_stop();
    if (m_housekeeping.joinable()) {
        m_housekeeping.join();
    }

    m_intake->drain();
    m_intake->stop();

    m_reconciler->flush_all("shutdown");
    m_dispatcher->stop();

    LOG_INFO("MonitoringPipeline", "Stopped");
}

void MonitoringPipeline::housekeeping_loop(std::stop_token stop_token) {
    while (utils::interruptible_sleep(HOUSEKEEPING_INTERVAL, stop_token)) {
        run_housekeeping();
    }
}

std::size_t MonitoringPipeline::run_housekeeping(TimePoint now) {
    m_reconciler->retry_pending_flushes();

    // Without a working poller, silence says nothing about a session
    if (!m_poller->healthy()) {
        return 0;
    }
    return m_reconciler->expire_idle(now, config().reconciler.stale_session_grace);
}

PipelineStatus MonitoringPipeline::status() const {
    PipelineStatus status;
    status.running = m_running.load();
    status.live_sessions = m_reconciler->live_count();
    status.pending_flushes = m_reconciler->pending_flush_count();
    status.push_supported = m_push_ingestor->is_supported();
    status.push_connected = m_push_ingestor->is_connected();
    status.poll_failures = m_poller->consecutive_failures();
    status.poller_healthy = m_poller->healthy();
    status.storage_healthy = m_history_writer->storage_healthy();
    status.reconciler = m_reconciler->counters();
    status.intake = m_intake->stats();
    status.notifications = m_dispatcher->counters();
    status.push = m_push_ingestor->stats();
    return status;
}

std::vector<Session> MonitoringPipeline::live_sessions() const {
    return m_reconciler->live_sessions();
}

std::expected<void, ConnectorError> MonitoringPipeline::send_command(const SessionKey& key,
                                                                     const SessionCommand& command) {
    LOG_INFO("MonitoringPipeline", "Sending command to session " + key.get());
    return m_connector->send_command(key, command);
}

MonitorConfig MonitoringPipeline::config() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

void MonitoringPipeline::apply_config(const MonitorConfig& config) {
    MonitorConfig previous;
    {
        std::lock_guard lock(m_config_mutex);
        previous = m_config;
        m_config = config;
    }

    if (config.log_level != previous.log_level) {
        utils::LoggerManager::get_instance().set_level(config.log_level);
    }

    if (config.connector.backend != previous.connector.backend) {
        LOG_WARNING("MonitoringPipeline", "Backend change to '" + config.connector.backend +
                    "' takes effect after a restart");
    }
    if (config.reconciler.shard_count != previous.reconciler.shard_count ||
        config.reconciler.intake_capacity != previous.reconciler.intake_capacity) {
        LOG_WARNING("MonitoringPipeline", "Shard layout changes take effect after a restart");
    }

    m_connector->reconfigure(config.connector);
    m_poller->set_config(config.poller);
    m_push_ingestor->set_config(config.push);
    m_history_writer->set_config(config.history);
    m_dispatcher->set_config(config.notifications);

    if (config.notifications.log_handler != previous.notifications.log_handler ||
        config.notifications.webhook_urls != previous.notifications.webhook_urls) {
        rebuild_handlers(config.notifications);
    }

    LOG_INFO("MonitoringPipeline", "Applied configuration update");
}

void MonitoringPipeline::add_notification_handler(std::shared_ptr<services::NotificationHandler> handler) {
    {
        std::lock_guard lock(m_handlers_mutex);
        m_extra_handlers.push_back(handler);
    }
    m_dispatcher->add_handler(std::move(handler));
}

void MonitoringPipeline::rebuild_handlers(const NotificationConfig& config) {
    m_dispatcher->clear_handlers();

    if (config.log_handler) {
        m_dispatcher->add_handler(std::make_shared<services::LogNotificationHandler>());
    }

    if (!config.webhook_urls.empty() && !m_http_client) {
        services::HttpClientConfig client_config;
        client_config.default_timeout = this->config().connector.request_timeout;
        m_http_client = services::create_http_client(client_config);
    }
    for (const auto& url : config.webhook_urls) {
        m_dispatcher->add_handler(std::make_shared<services::WebhookNotificationHandler>(m_http_client, url));
    }

    std::lock_guard lock(m_handlers_mutex);
    for (const auto& handler : m_extra_handlers) {
        m_dispatcher->add_handler(handler);
    }
}

} // namespace core
} // namespace playback_monitor
