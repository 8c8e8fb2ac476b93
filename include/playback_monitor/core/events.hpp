#pragma once

#include "playback_monitor/core/models.hpp"
#include <chrono>
#include <string>

namespace playback_monitor::core::events {

struct Event {
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

struct ConfigurationUpdated : Event {
    MonitorConfig previous_config;
    MonitorConfig new_config;

    ConfigurationUpdated(MonitorConfig prev, MonitorConfig curr)
        : previous_config(std::move(prev)), new_config(std::move(curr)) {}
};

struct ConnectorFailure : Event {
    ConnectorError error;
    int consecutive_failures = 0;

    ConnectorFailure(ConnectorError err, int failures)
        : error(err), consecutive_failures(failures) {}
};

struct ConnectorUnauthorized : Event {
    std::string message;

    explicit ConnectorUnauthorized(std::string msg) : message(std::move(msg)) {}
};

struct PollerDegraded : Event {
    int consecutive_failures = 0;
    std::size_t sessions_flushed = 0;

    PollerDegraded(int failures, std::size_t flushed)
        : consecutive_failures(failures), sessions_flushed(flushed) {}
};

struct PollerRecovered : Event {
    int failures_before_recovery = 0;

    explicit PollerRecovered(int failures) : failures_before_recovery(failures) {}
};

struct PushChannelStateChanged : Event {
    enum class ChannelState {
        Connected,
        Disconnected,
        Reconnecting,
        Unsupported
    };

    ChannelState state = ChannelState::Disconnected;
    std::string reason;                      // for Disconnected
    int attempt_number = 0;                  // for Reconnecting
    std::chrono::milliseconds next_retry_in{};

    static PushChannelStateChanged connected() {
        PushChannelStateChanged event;
        event.state = ChannelState::Connected;
        return event;
    }

    static PushChannelStateChanged disconnected(std::string reason) {
        PushChannelStateChanged event;
        event.state = ChannelState::Disconnected;
        event.reason = std::move(reason);
        return event;
    }

    static PushChannelStateChanged reconnecting(int attempt, std::chrono::milliseconds delay) {
        PushChannelStateChanged event;
        event.state = ChannelState::Reconnecting;
        event.attempt_number = attempt;
        event.next_retry_in = delay;
        return event;
    }

    static PushChannelStateChanged unsupported() {
        PushChannelStateChanged event;
        event.state = ChannelState::Unsupported;
        return event;
    }

private:
    PushChannelStateChanged() = default;
};

struct HistoryStorageFailure : Event {
    StorageError error;
    int attempts = 0;
    SessionKey session_key;

    HistoryStorageFailure(StorageError err, int tries, SessionKey key)
        : error(err), attempts(tries), session_key(std::move(key)) {}
};

struct HistoryStorageRecovered : Event {};

} // namespace playback_monitor::core::events
