#pragma once

#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/core/models.hpp"
#include "playback_monitor/core/session_state.hpp"
#include "playback_monitor/services/connector/backend_connector.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace playback_monitor {
namespace services {

// Fetches the full active-session list on a fixed interval and turns the
// difference against the previous tick into observations.
class Poller {
public:
    enum class TickOutcome {
        Completed,
        Failed,
        Skipped  // previous tick still in flight
    };

    using ObservationSink = std::function<void(core::Observation)>;
    // Stops poll-only sessions after a sustained outage; returns how many
    using ForceFlush = std::function<std::size_t(const std::string& note)>;

    Poller(std::shared_ptr<BackendConnector> connector,
           core::PollerConfig config,
           ObservationSink sink,
           ForceFlush force_flush = {});
    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    void set_event_bus(std::shared_ptr<core::EventBus> bus);

    void start();
    void stop();
    bool is_running() const { return m_running.load(); }

    TickOutcome tick();

    void set_config(const core::PollerConfig& config);
    core::PollerConfig config() const;

    // False while consecutive failures are at or above the threshold
    bool healthy() const;
    int consecutive_failures() const { return m_consecutive_failures.load(); }
    std::size_t tracked_sessions() const;

    static constexpr const char* OUTAGE_NOTE = "error: poll failures exceeded threshold";

private:
    void run(std::stop_token stop_token);
    void handle_success(const std::vector<core::SessionSnapshot>& sessions);
    void handle_failure(core::ConnectorError error);
    void emit(const core::SessionSnapshot& snapshot, core::ObservationKind kind, std::uint64_t revision,
              core::TimePoint now);

    template<typename EventType>
    void publish(const EventType& event) {
        if (m_event_bus) {
            m_event_bus->publish(event);
        }
    }

    std::shared_ptr<BackendConnector> m_connector;
    ObservationSink m_sink;
    ForceFlush m_force_flush;
    std::shared_ptr<core::EventBus> m_event_bus;

    mutable std::mutex m_config_mutex;
    core::PollerConfig m_config;

    // Owned by whichever thread holds m_tick_in_flight
    std::unordered_map<core::SessionKey, core::SessionSnapshot> m_previous;
    std::unordered_map<core::SessionKey, int> m_misses;
    bool m_outage_flushed = false;
    bool m_unauthorized_reported = false;

    std::atomic<bool> m_tick_in_flight{false};
    std::atomic<int> m_consecutive_failures{0};
    std::atomic<std::size_t> m_tracked{0};
    core::RevisionClock m_revisions;

    std::atomic<bool> m_running{false};
    std::jthread m_thread;
};

} // namespace services
} // namespace playback_monitor
