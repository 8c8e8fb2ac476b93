#include "playback_monitor/services/monitor/poller.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/threading.hpp"
#include <unordered_set>

namespace playback_monitor {
namespace services {

Poller::Poller(std::shared_ptr<BackendConnector> connector,
               core::PollerConfig config,
               ObservationSink sink,
               ForceFlush force_flush)
    : m_connector(std::move(connector))
    , m_sink(std::move(sink))
    , m_force_flush(std::move(force_flush))
    , m_config(std::move(config)) {}

Poller::~Poller() {
    stop();
}

void Poller::set_event_bus(std::shared_ptr<core::EventBus> bus) {
    m_event_bus = std::move(bus);
}

void Poller::start() {
    if (m_running.exchange(true)) {
        return;
    }

    LOG_INFO("Poller", "Polling " + m_connector->backend_name() + " every " +
             std::to_string(config().interval.count()) + "ms");
    m_thread = std::jthread([this](std::stop_token stop_token) { run(stop_token); });
}

void Poller::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    m_thread.request_stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    LOG_DEBUG("Poller", "Stopped");
}

void Poller::set_config(const core::PollerConfig& config) {
    std::lock_guard lock(m_config_mutex);
    m_config = config;
}

core::PollerConfig Poller::config() const {
    std::lock_guard lock(m_config_mutex);
    return m_config;
}

bool Poller::healthy() const {
    return m_consecutive_failures.load() < config().failure_threshold;
}

std::size_t Poller::tracked_sessions() const {
    return m_tracked.load();
}

void Poller::run(std::stop_token stop_token) {
    auto next_tick = std::chrono::steady_clock::now();

    while (!stop_token.stop_requested()) {
        tick();

        // Fixed rate: the next deadline does not drift with tick duration
        const auto interval = config().interval;
        next_tick += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next_tick < now) {
            next_tick = now;
        }

        const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - now);
        if (!utils::interruptible_sleep(wait, stop_token)) {
            break;
        }
    }
}

Poller::TickOutcome Poller::tick() {
    if (m_tick_in_flight.exchange(true)) {
        LOG_DEBUG("Poller", "Previous tick still running, skipping");
        return TickOutcome::Skipped;
    }

    auto result = m_connector->list_active_sessions();

    TickOutcome outcome;
    if (result) {
        handle_success(*result);
        outcome = TickOutcome::Completed;
    } else {
        handle_failure(result.error());
        outcome = TickOutcome::Failed;
    }

    m_tick_in_flight.store(false);
    return outcome;
}

void Poller::emit(const core::SessionSnapshot& snapshot, core::ObservationKind kind, std::uint64_t revision,
                  core::TimePoint now) {
    if (!m_sink) {
        return;
    }

    core::Observation observation;
    observation.snapshot = snapshot;
    observation.source = core::ObservationSource::Poll;
    observation.kind = kind;
    observation.revision = revision;
    observation.observed_at = now;
    m_sink(std::move(observation));
}

void Poller::handle_success(const std::vector<core::SessionSnapshot>& sessions) {
    const int failures = m_consecutive_failures.exchange(0);
    if (failures > 0) {
        LOG_INFO("Poller", "Backend reachable again after " + std::to_string(failures) + " failed polls");
        publish(core::events::PollerRecovered{failures});
    }
    m_outage_flushed = false;
    m_unauthorized_reported = false;

    const auto missed_ticks_before_stop = config().missed_ticks_before_stop;
    const auto now = core::Clock::now();
    const auto revision = m_revisions.next(now);

    std::unordered_set<core::SessionKey> present;
    for (const auto& snapshot : sessions) {
        const auto& key = snapshot.session_key;
        present.insert(key);
        m_misses.erase(key);

        const bool known = m_previous.contains(key);
        emit(snapshot, known ? core::ObservationKind::Update : core::ObservationKind::Started, revision, now);
        m_previous[key] = snapshot;
    }

    for (auto it = m_previous.begin(); it != m_previous.end();) {
        if (present.contains(it->first)) {
            ++it;
            continue;
        }

        // Absorb transient misses before declaring the session gone
        const int misses = ++m_misses[it->first];
        if (misses <= missed_ticks_before_stop) {
            ++it;
            continue;
        }

        LOG_DEBUG("Poller", "Session " + it->first.get() + " missing for " + std::to_string(misses) + " polls");
        emit(it->second, core::ObservationKind::Stopped, revision, now);
        m_misses.erase(it->first);
        it = m_previous.erase(it);
    }

    m_tracked.store(m_previous.size());
}

void Poller::handle_failure(core::ConnectorError error) {
    const int failures = m_consecutive_failures.fetch_add(1) + 1;
    const int threshold = config().failure_threshold;

    LOG_WARNING("Poller", "Poll failed (" + core::to_string(error) + "), " + std::to_string(failures) +
                " consecutive");
    publish(core::events::ConnectorFailure{error, failures});

    if (error == core::ConnectorError::Unauthorized && !m_unauthorized_reported) {
        m_unauthorized_reported = true;
        LOG_ERROR("Poller", "Backend rejected the credentials; update the api token");
        publish(core::events::ConnectorUnauthorized{"Backend " + m_connector->backend_name() +
                                                    " rejected the configured credentials"});
    }

    if (failures < threshold || m_outage_flushed) {
        return;
    }

    m_outage_flushed = true;
    LOG_ERROR("Poller", "Poll failures reached threshold (" + std::to_string(threshold) +
              "), stopping poll-only sessions");

    std::size_t flushed = 0;
    if (m_force_flush) {
        flushed = m_force_flush(OUTAGE_NOTE);
    }

    // Sessions still running after recovery are announced as new ones
    m_previous.clear();
    m_misses.clear();
    m_tracked.store(0);

    publish(core::events::PollerDegraded{failures, flushed});
}

} // namespace services
} // namespace playback_monitor
