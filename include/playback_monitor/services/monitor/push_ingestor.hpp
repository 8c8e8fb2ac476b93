#pragma once

#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/core/models.hpp"
#include "playback_monitor/core/session_state.hpp"
#include "playback_monitor/services/connector/backend_connector.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace playback_monitor {
namespace services {

/**
 * @brief Keeps the backend's push channel open and feeds its events to the intake
 *
 * Reconnects with exponential backoff for as long as it runs. While the
 * channel is down the poller alone drives session state, so losing it is
 * logged once and otherwise tolerated.
 *
 * Push payloads are sparse. Missing identity is filled from a per-key cache,
 * from an optional lookup into the live session table, and from item
 * metadata fetched through the connector.
 */
class PushIngestor {
public:
    using ObservationSink = std::function<void(core::Observation)>;
    using IdentityLookup = std::function<std::optional<core::SessionSnapshot>(const core::SessionKey&)>;

    struct Stats {
        std::uint64_t events_received = 0;
        std::uint64_t malformed = 0;
        std::uint64_t connections = 0;
        std::uint64_t metadata_lookups = 0;
    };

    PushIngestor(std::shared_ptr<BackendConnector> connector,
                 core::PushConfig config,
                 ObservationSink sink);
    ~PushIngestor();

    PushIngestor(const PushIngestor&) = delete;
    PushIngestor& operator=(const PushIngestor&) = delete;

    void set_event_bus(std::shared_ptr<core::EventBus> bus);
    void set_identity_lookup(IdentityLookup lookup);

    void start();
    void stop();

    bool is_running() const { return m_running.load(); }
    bool is_connected() const { return m_connected.load(); }
    // False once the backend reported that it has no push channel
    bool is_supported() const { return m_supported.load(); }

    void set_config(const core::PushConfig& config);
    core::PushConfig config() const;

    Stats stats() const;

    // Drops the identity learned for a key whose session has ended
    void forget(const core::SessionKey& key);

    // Normalizes one stream event; nullopt for malformed events
    std::optional<core::Observation> to_observation(const StreamEvent& event);

private:
    struct Identity {
        std::string user_id;
        std::string user_name;
        std::string item_id;
        std::string title;
        core::MediaType media_type = core::MediaType::Other;
        std::int64_t duration_ms = 0;
    };

    static constexpr std::size_t METADATA_CACHE_LIMIT = 512;
    static constexpr std::size_t IDENTITY_CACHE_LIMIT = 1024;

    void run(std::stop_token stop_token);
    void handle_event(const StreamEvent& event);
    void mark_unsupported();
    void enrich(core::SessionSnapshot& snapshot);
    std::optional<core::ItemMetadata> lookup_metadata(const std::string& item_id, const std::string& user_id);

    template<typename EventType>
    void publish(const EventType& event) {
        if (m_event_bus) {
            m_event_bus->publish(event);
        }
    }

    std::shared_ptr<BackendConnector> m_connector;
    ObservationSink m_sink;
    IdentityLookup m_identity_lookup;
    std::shared_ptr<core::EventBus> m_event_bus;

    mutable std::mutex m_config_mutex;
    core::PushConfig m_config;

    std::mutex m_cache_mutex;
    std::unordered_map<core::SessionKey, Identity> m_identities;
    std::unordered_map<std::string, core::ItemMetadata> m_metadata;

    core::RevisionClock m_revisions;
    std::atomic<std::uint64_t> m_events_received{0};
    std::atomic<std::uint64_t> m_malformed{0};
    std::atomic<std::uint64_t> m_connections{0};
    std::atomic<std::uint64_t> m_metadata_lookups{0};

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_connected{false};
    std::atomic<bool> m_supported{true};
    bool m_degraded = false;
    std::jthread m_thread;
};

} // namespace services
} // namespace playback_monitor
