#pragma once

#include "playback_monitor/services/connector/backend_connector.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace playback_monitor::test_support {

// One connection's worth of push traffic
struct ScriptedStream {
    std::vector<services::StreamEvent> events;
    bool announce_connected = true;
    // Keeps the connection open after the events until stop is requested
    bool hold_open = false;
    std::optional<core::ConnectorError> error;
};

class FakeEventStream : public services::EventStream {
public:
    explicit FakeEventStream(ScriptedStream script) : m_script(std::move(script)) {}

    void set_connected_callback(std::function<void()> callback) override {
        m_connected_callback = std::move(callback);
    }

    std::expected<void, core::ConnectorError> run(const services::StreamEventCallback& on_event,
                                                  std::stop_token stop_token) override {
        if (m_script.announce_connected && m_connected_callback) {
            m_connected_callback();
        }
        for (const auto& event : m_script.events) {
            if (stop_token.stop_requested()) {
                return {};
            }
            on_event(event);
        }
        if (m_script.hold_open) {
            std::mutex mutex;
            std::condition_variable_any cv;
            std::unique_lock lock(mutex);
            cv.wait(lock, stop_token, [] { return false; });
            return {};
        }
        if (m_script.error) {
            return std::unexpected(*m_script.error);
        }
        return {};
    }

private:
    ScriptedStream m_script;
    std::function<void()> m_connected_callback;
};

// Backend double with scripted poll results and push connections
class FakeConnector : public services::BackendConnector {
public:
    using PollResult = std::expected<std::vector<core::SessionSnapshot>, core::ConnectorError>;

    explicit FakeConnector(bool push_capable = true) : m_push_capable(push_capable) {}

    std::string backend_name() const override { return "fake"; }

    // Returned by every poll once the scripted results are used up
    void set_sessions(std::vector<core::SessionSnapshot> sessions) {
        std::lock_guard lock(m_mutex);
        m_sessions = std::move(sessions);
    }

    void script_poll(PollResult result) {
        std::lock_guard lock(m_mutex);
        m_poll_script.push_back(std::move(result));
    }

    void fail_polls(core::ConnectorError error, int count) {
        for (int i = 0; i < count; ++i) {
            script_poll(std::unexpected(error));
        }
    }

    PollResult list_active_sessions() override {
        std::lock_guard lock(m_mutex);
        ++m_poll_calls;
        if (!m_poll_script.empty()) {
            auto result = std::move(m_poll_script.front());
            m_poll_script.pop_front();
            return result;
        }
        return m_sessions;
    }

    void set_metadata(core::ItemMetadata metadata) {
        std::lock_guard lock(m_mutex);
        m_metadata[metadata.item_id] = std::move(metadata);
    }

    std::expected<core::ItemMetadata, core::ConnectorError>
    get_item_metadata(const std::string& item_id, const std::string&) override {
        std::lock_guard lock(m_mutex);
        ++m_metadata_calls;
        auto it = m_metadata.find(item_id);
        if (it == m_metadata.end()) {
            return std::unexpected(core::ConnectorError::NotFound);
        }
        return it->second;
    }

    bool supports_event_stream() const override { return m_push_capable; }

    void script_stream(ScriptedStream stream) {
        std::lock_guard lock(m_mutex);
        m_stream_script.push_back(std::move(stream));
    }

    void fail_stream_opens(core::ConnectorError error, int count) {
        std::lock_guard lock(m_mutex);
        m_open_failures = count;
        m_open_error = error;
    }

    std::expected<std::unique_ptr<services::EventStream>, core::ConnectorError> open_event_stream() override {
        std::lock_guard lock(m_mutex);
        ++m_stream_opens;
        if (!m_push_capable) {
            return std::unexpected(core::ConnectorError::Unsupported);
        }
        if (m_open_failures > 0) {
            --m_open_failures;
            return std::unexpected(m_open_error);
        }

        ScriptedStream script;
        script.hold_open = true;
        if (!m_stream_script.empty()) {
            script = std::move(m_stream_script.front());
            m_stream_script.pop_front();
        }
        return std::make_unique<FakeEventStream>(std::move(script));
    }

    std::expected<void, core::ConnectorError>
    send_command(const core::SessionKey& key, const core::SessionCommand& command) override {
        std::lock_guard lock(m_mutex);
        m_commands.emplace_back(key, command);
        return {};
    }

    void reconfigure(const core::ConnectorConfig& config) override {
        std::lock_guard lock(m_mutex);
        m_last_config = config;
        ++m_reconfigures;
    }

    void shutdown() override {
        std::lock_guard lock(m_mutex);
        m_shutdown = true;
    }

    int poll_calls() const { std::lock_guard lock(m_mutex); return m_poll_calls; }
    int metadata_calls() const { std::lock_guard lock(m_mutex); return m_metadata_calls; }
    int stream_opens() const { std::lock_guard lock(m_mutex); return m_stream_opens; }
    int reconfigures() const { std::lock_guard lock(m_mutex); return m_reconfigures; }
    bool was_shut_down() const { std::lock_guard lock(m_mutex); return m_shutdown; }
    std::optional<core::ConnectorConfig> last_config() const { std::lock_guard lock(m_mutex); return m_last_config; }

    std::vector<std::pair<core::SessionKey, core::SessionCommand>> commands() const {
        std::lock_guard lock(m_mutex);
        return m_commands;
    }

private:
    mutable std::mutex m_mutex;
    bool m_push_capable;

    std::vector<core::SessionSnapshot> m_sessions;
    std::deque<PollResult> m_poll_script;
    std::deque<ScriptedStream> m_stream_script;
    std::map<std::string, core::ItemMetadata> m_metadata;
    std::vector<std::pair<core::SessionKey, core::SessionCommand>> m_commands;
    std::optional<core::ConnectorConfig> m_last_config;

    int m_open_failures = 0;
    core::ConnectorError m_open_error = core::ConnectorError::Unreachable;

    int m_poll_calls = 0;
    int m_metadata_calls = 0;
    int m_stream_opens = 0;
    int m_reconfigures = 0;
    bool m_shutdown = false;
};

} // namespace playback_monitor::test_support
