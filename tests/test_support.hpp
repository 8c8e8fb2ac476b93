#pragma once

#include "playback_monitor/core/models.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <chrono>
#include <functional>
#include <thread>

namespace playback_monitor::test_support {

inline core::SessionSnapshot make_snapshot(const std::string& key,
                                           core::SessionState state = core::SessionState::Playing,
                                           std::int64_t position_ms = 0,
                                           std::int64_t duration_ms = 0) {
    core::SessionSnapshot snapshot;
    snapshot.session_key = core::SessionKey(key);
    snapshot.user_id = "u1";
    snapshot.user_name = "alice";
    snapshot.item_id = "42";
    snapshot.title = "The Movie (2020)";
    snapshot.media_type = core::MediaType::Movie;
    snapshot.state = state;
    snapshot.position_ms = position_ms;
    snapshot.duration_ms = duration_ms;
    return snapshot;
}

inline core::Observation make_observation(const std::string& key,
                                          core::SessionState state,
                                          std::uint64_t revision,
                                          core::ObservationSource source = core::ObservationSource::Poll,
                                          core::ObservationKind kind = core::ObservationKind::Update) {
    core::Observation observation;
    observation.snapshot = make_snapshot(key, state);
    observation.source = source;
    observation.kind = kind;
    observation.revision = revision;
    observation.observed_at = core::from_epoch_ms(static_cast<std::int64_t>(revision));
    return observation;
}

// Polls the condition until it holds or the timeout passes
inline bool eventually(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Routes log output into memory for the lifetime of the object. Declare it
// before any component that logs from its own threads.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(utils::LogLevel level = utils::LogLevel::Debug) {
        auto logger = std::make_unique<utils::Logger>(level);
        auto sink = std::make_unique<utils::MemorySink>();
        m_sink = sink.get();
        logger->add_sink(std::move(sink));
        utils::LoggerManager::set_instance(std::move(logger));
    }

    ~ScopedLogCapture() {
        utils::LoggerManager::set_instance(utils::LoggerManager::create_default_logger());
    }

    ScopedLogCapture(const ScopedLogCapture&) = delete;
    ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

    const utils::MemorySink& sink() const { return *m_sink; }
    std::size_t count(std::string_view needle) const { return m_sink->count_containing(needle); }

private:
    utils::MemorySink* m_sink = nullptr;
};

} // namespace playback_monitor::test_support
