#include "playback_monitor/services/monitor/push_ingestor.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/threading.hpp"

namespace playback_monitor {
namespace services {

using core::events::PushChannelStateChanged;

PushIngestor::PushIngestor(std::shared_ptr<BackendConnector> connector,
                           core::PushConfig config,
                           ObservationSink sink)
    : m_connector(std::move(connector))
    , m_sink(std::move(sink))
    , m_config(std::move(config)) {}

PushIngestor::~PushIngestor() {
    stop();
}

void PushIngestor::set_event_bus(std::shared_ptr<core::EventBus> bus) {
    m_event_bus = std::move(bus);
}

void PushIngestor::set_identity_lookup(IdentityLookup lookup) {
    m_identity_lookup = std::move(lookup);
}

void PushIngestor::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_thread = std::jthread([this](std::stop_token stop_token) { run(stop_token); });
}

void PushIngestor::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    m_thread.request_stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_connected = false;
    LOG_DEBUG("PushIngestor", "Stopped");
}

void PushIngestor::set_config(const core::PushConfig& config) {
    std::lock_guard lock(m_config_mutex);
    m_config = config;
}

core::PushConfig PushIngestor::config() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

PushIngestor::Stats PushIngestor::stats() const {
    return Stats{
        .events_received = m_events_received.load(),
        .malformed = m_malformed.load(),
        .connections = m_connections.load(),
        .metadata_lookups = m_metadata_lookups.load()
    };
}

void PushIngestor::mark_unsupported() {
    m_supported = false;
    LOG_INFO("PushIngestor", "Backend " + m_connector->backend_name() +
             " has no push channel, running in poll-only mode");
    publish(PushChannelStateChanged::unsupported());
}

void PushIngestor::run(std::stop_token stop_token) {
    if (!m_connector->supports_event_stream()) {
        mark_unsupported();
        return;
    }

    int attempt = 0;
    while (!stop_token.stop_requested()) {
        std::string reason;

        auto stream = m_connector->open_event_stream();
        if (!stream) {
            if (stream.error() == core::ConnectorError::Unsupported) {
                mark_unsupported();
                return;
            }
            reason = "open failed: " + core::to_string(stream.error());
        } else {
            const auto received_before = m_events_received.load();

            (*stream)->set_connected_callback([this] {
                m_connected = true;
                m_connections.fetch_add(1);
                if (m_degraded) {
                    m_degraded = false;
                    LOG_INFO("PushIngestor", "Push channel restored");
                } else {
                    LOG_INFO("PushIngestor", "Push channel connected");
                }
                publish(PushChannelStateChanged::connected());
            });

            auto result = (*stream)->run([this](const StreamEvent& event) { handle_event(event); }, stop_token);
            m_connected = false;

            if (stop_token.stop_requested()) {
                break;
            }

            // A stream that delivered events counts as a healthy connection
            if (m_events_received.load() > received_before) {
                attempt = 0;
            }
            reason = result ? "stream closed by server" : core::to_string(result.error());
        }

        // Stops sent while disconnected are lost; identities learned so far
        // may belong to sessions that have already ended
        {
            std::lock_guard lock(m_cache_mutex);
            m_identities.clear();
        }

        if (!m_degraded) {
            m_degraded = true;
            LOG_WARNING("PushIngestor", "Push channel lost (" + reason + "), continuing in poll-only mode");
        }
        publish(PushChannelStateChanged::disconnected(reason));

        const auto cfg = config();
        const auto delay = utils::exponential_backoff(attempt, cfg.reconnect_initial_backoff,
                                                      cfg.reconnect_max_backoff);
        ++attempt;

        LOG_DEBUG("PushIngestor", "Reconnect attempt " + std::to_string(attempt) + " in " +
                  std::to_string(delay.count()) + "ms");
        publish(PushChannelStateChanged::reconnecting(attempt, delay));

        if (!utils::interruptible_sleep(delay, stop_token)) {
            break;
        }
    }
}

void PushIngestor::handle_event(const StreamEvent& event) {
    auto observation = to_observation(event);
    if (!observation || !m_sink) {
        return;
    }
    m_sink(std::move(*observation));
}

std::optional<core::Observation> PushIngestor::to_observation(const StreamEvent& event) {
    m_events_received.fetch_add(1);

    if (event.kind == StreamEvent::Kind::Malformed || event.snapshot.session_key.empty()) {
        m_malformed.fetch_add(1);
        LOG_DEBUG("PushIngestor", "Skipping malformed push event");
        return std::nullopt;
    }

    core::Observation observation;
    observation.snapshot = event.snapshot;
    observation.source = core::ObservationSource::Push;
    observation.observed_at = core::Clock::now();
    observation.revision = m_revisions.next(observation.observed_at);

    const auto& key = observation.snapshot.session_key;
    if (event.kind == StreamEvent::Kind::Stopped) {
        observation.kind = core::ObservationKind::Stopped;
        enrich(observation.snapshot);
        std::lock_guard lock(m_cache_mutex);
        m_identities.erase(key);
        return observation;
    }

    bool first_seen;
    {
        std::lock_guard lock(m_cache_mutex);
        first_seen = !m_identities.contains(key);
    }
    observation.kind = first_seen ? core::ObservationKind::Started : core::ObservationKind::Update;
    enrich(observation.snapshot);
    return observation;
}

void PushIngestor::enrich(core::SessionSnapshot& snapshot) {
    Identity identity;
    bool cached = false;
    {
        std::lock_guard lock(m_cache_mutex);
        auto it = m_identities.find(snapshot.session_key);
        if (it != m_identities.end()) {
            identity = it->second;
            cached = true;
        }
    }

    if (!cached && m_identity_lookup) {
        if (auto live = m_identity_lookup(snapshot.session_key)) {
            identity.user_id = live->user_id;
            identity.user_name = live->user_name;
            identity.item_id = live->item_id;
            identity.title = live->title;
            identity.media_type = live->media_type;
            identity.duration_ms = live->duration_ms;
        }
    }

    if (snapshot.user_id.empty()) snapshot.user_id = identity.user_id;
    if (snapshot.user_name.empty()) snapshot.user_name = identity.user_name;
    if (snapshot.item_id.empty()) snapshot.item_id = identity.item_id;

    // Item changed mid-session or never described: the cached title does not apply
    const bool same_item = snapshot.item_id == identity.item_id;
    if (same_item) {
        if (snapshot.title.empty()) snapshot.title = identity.title;
        if (snapshot.media_type == core::MediaType::Other) snapshot.media_type = identity.media_type;
        if (snapshot.duration_ms == 0) snapshot.duration_ms = identity.duration_ms;
    }

    if ((snapshot.title.empty() || snapshot.duration_ms == 0) && !snapshot.item_id.empty()) {
        if (auto metadata = lookup_metadata(snapshot.item_id, snapshot.user_id)) {
            if (snapshot.title.empty()) snapshot.title = metadata->full_title;
            if (snapshot.media_type == core::MediaType::Other) snapshot.media_type = metadata->media_type;
            if (snapshot.duration_ms == 0) snapshot.duration_ms = metadata->duration_ms;
        }
    }

    identity.user_id = snapshot.user_id;
    identity.user_name = snapshot.user_name;
    identity.item_id = snapshot.item_id;
    identity.title = snapshot.title;
    identity.media_type = snapshot.media_type;
    identity.duration_ms = snapshot.duration_ms;

    std::lock_guard lock(m_cache_mutex);
    if (m_identities.size() >= IDENTITY_CACHE_LIMIT && !m_identities.contains(snapshot.session_key)) {
        m_identities.clear();
    }
    m_identities[snapshot.session_key] = std::move(identity);
}

void PushIngestor::forget(const core::SessionKey& key) {
    std::lock_guard lock(m_cache_mutex);
    m_identities.erase(key);
}

std::optional<core::ItemMetadata> PushIngestor::lookup_metadata(const std::string& item_id,
                                                                const std::string& user_id) {
    {
        std::lock_guard lock(m_cache_mutex);
        auto it = m_metadata.find(item_id);
        if (it != m_metadata.end()) {
            return it->second;
        }
    }

    m_metadata_lookups.fetch_add(1);
    auto metadata = m_connector->get_item_metadata(item_id, user_id);
    if (!metadata) {
        LOG_DEBUG("PushIngestor", "Metadata lookup for item " + item_id + " failed: " +
                  core::to_string(metadata.error()));
        return std::nullopt;
    }

    std::lock_guard lock(m_cache_mutex);
    if (m_metadata.size() >= METADATA_CACHE_LIMIT) {
        m_metadata.clear();
    }
    m_metadata[item_id] = *metadata;
    return *metadata;
}

} // namespace services
} // namespace playback_monitor
