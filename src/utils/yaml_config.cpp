#include "playback_monitor/utils/yaml_config.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace playback_monitor {
namespace utils {

namespace {

std::chrono::milliseconds read_ms(const YAML::Node& node, const char* key, std::chrono::milliseconds fallback) {
    if (!node[key]) {
        return fallback;
    }
    return std::chrono::milliseconds(node[key].as<std::int64_t>());
}

template<typename T>
void read_value(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

std::expected<core::MonitorConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

std::expected<void, core::ConfigError>
YamlConfigHelper::save_to_file(const core::MonitorConfig& config, const std::filesystem::path& path) {
    try {
        auto dir = path.parent_path();
        if (!dir.empty() && !std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        YAML::Node node = to_yaml(config);
        std::ofstream file(path);
        if (!file) {
            LOG_ERROR("YamlConfig", "Cannot open file for writing: " + path.string());
            return std::unexpected(core::ConfigError::PermissionDenied);
        }

        file << node << "\n";
        return {};
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlConfig", "Save error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::MonitorConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::MonitorConfig config;

    if (node["log_level"]) {
        config.log_level = log_level_from_string(node["log_level"].as<std::string>());
    }
    read_value(node, "log_file", config.log_file);

    if (node["connector"]) config.connector = parse_connector_config(node["connector"]);
    if (node["poller"]) config.poller = parse_poller_config(node["poller"]);
    if (node["push"]) config.push = parse_push_config(node["push"]);
    if (node["reconciler"]) config.reconciler = parse_reconciler_config(node["reconciler"]);
    if (node["history"]) config.history = parse_history_config(node["history"]);
    if (node["notifications"]) config.notifications = parse_notification_config(node["notifications"]);

    return config;
}

core::ConnectorConfig YamlConfigHelper::parse_connector_config(const YAML::Node& node) {
    core::ConnectorConfig config;

    read_value(node, "backend", config.backend);
    read_value(node, "server_url", config.server_url);
    read_value(node, "api_token", config.api_token);
    read_value(node, "verify_ssl", config.verify_ssl);
    read_value(node, "max_retries", config.max_retries);

    if (node["request_timeout_ms"]) {
        const auto timeout = std::chrono::milliseconds(node["request_timeout_ms"].as<std::int64_t>());
        config.request_timeout = std::max(std::chrono::seconds(1),
                                          std::chrono::duration_cast<std::chrono::seconds>(timeout));
    }
    config.retry_initial_backoff = read_ms(node, "retry_initial_backoff_ms", config.retry_initial_backoff);
    config.retry_max_backoff = read_ms(node, "retry_max_backoff_ms", config.retry_max_backoff);

    return config;
}

core::PollerConfig YamlConfigHelper::parse_poller_config(const YAML::Node& node) {
    core::PollerConfig config;
    config.interval = read_ms(node, "interval_ms", config.interval);
    read_value(node, "missed_ticks_before_stop", config.missed_ticks_before_stop);
    read_value(node, "failure_threshold", config.failure_threshold);
    return config;
}

core::PushConfig YamlConfigHelper::parse_push_config(const YAML::Node& node) {
    core::PushConfig config;
    read_value(node, "enabled", config.enabled);
    config.reconnect_initial_backoff = read_ms(node, "reconnect_initial_backoff_ms", config.reconnect_initial_backoff);
    config.reconnect_max_backoff = read_ms(node, "reconnect_max_backoff_ms", config.reconnect_max_backoff);
    return config;
}

core::ReconcilerConfig YamlConfigHelper::parse_reconciler_config(const YAML::Node& node) {
    core::ReconcilerConfig config;
    config.stale_session_grace = read_ms(node, "stale_session_grace_ms", config.stale_session_grace);
    read_value(node, "shard_count", config.shard_count);
    read_value(node, "intake_capacity", config.intake_capacity);
    return config;
}

core::HistoryConfig YamlConfigHelper::parse_history_config(const YAML::Node& node) {
    core::HistoryConfig config;
    read_value(node, "database_path", config.database_path);
    config.merge_gap = read_ms(node, "merge_gap_ms", config.merge_gap);
    read_value(node, "write_retries", config.write_retries);
    config.write_initial_backoff = read_ms(node, "write_initial_backoff_ms", config.write_initial_backoff);
    config.write_max_backoff = read_ms(node, "write_max_backoff_ms", config.write_max_backoff);
    return config;
}

core::NotificationConfig YamlConfigHelper::parse_notification_config(const YAML::Node& node) {
    core::NotificationConfig config;
    read_value(node, "queue_capacity", config.queue_capacity);
    read_value(node, "watched_threshold_percent", config.watched_threshold_percent);
    read_value(node, "handler_retries", config.handler_retries);
    read_value(node, "log_handler", config.log_handler);

    if (node["webhook_urls"]) {
        for (const auto& url : node["webhook_urls"]) {
            config.webhook_urls.push_back(url.as<std::string>());
        }
    }
    return config;
}

YAML::Node YamlConfigHelper::to_yaml(const core::MonitorConfig& config) {
    YAML::Node node;

    node["log_level"] = to_string(config.log_level);
    node["log_file"] = config.log_file;

    const auto& connector = config.connector;
    node["connector"]["backend"] = connector.backend;
    node["connector"]["server_url"] = connector.server_url;
    node["connector"]["api_token"] = connector.api_token;
    node["connector"]["request_timeout_ms"] =
        std::chrono::duration_cast<std::chrono::milliseconds>(connector.request_timeout).count();
    node["connector"]["verify_ssl"] = connector.verify_ssl;
    node["connector"]["max_retries"] = connector.max_retries;
    node["connector"]["retry_initial_backoff_ms"] = connector.retry_initial_backoff.count();
    node["connector"]["retry_max_backoff_ms"] = connector.retry_max_backoff.count();

    node["poller"]["interval_ms"] = config.poller.interval.count();
    node["poller"]["missed_ticks_before_stop"] = config.poller.missed_ticks_before_stop;
    node["poller"]["failure_threshold"] = config.poller.failure_threshold;

    node["push"]["enabled"] = config.push.enabled;
    node["push"]["reconnect_initial_backoff_ms"] = config.push.reconnect_initial_backoff.count();
    node["push"]["reconnect_max_backoff_ms"] = config.push.reconnect_max_backoff.count();

    node["reconciler"]["stale_session_grace_ms"] = config.reconciler.stale_session_grace.count();
    node["reconciler"]["shard_count"] = config.reconciler.shard_count;
    node["reconciler"]["intake_capacity"] = config.reconciler.intake_capacity;

    node["history"]["database_path"] = config.history.database_path;
    node["history"]["merge_gap_ms"] = config.history.merge_gap.count();
    node["history"]["write_retries"] = config.history.write_retries;
    node["history"]["write_initial_backoff_ms"] = config.history.write_initial_backoff.count();
    node["history"]["write_max_backoff_ms"] = config.history.write_max_backoff.count();

    const auto& notifications = config.notifications;
    node["notifications"]["queue_capacity"] = notifications.queue_capacity;
    node["notifications"]["watched_threshold_percent"] = notifications.watched_threshold_percent;
    node["notifications"]["handler_retries"] = notifications.handler_retries;
    node["notifications"]["log_handler"] = notifications.log_handler;
    node["notifications"]["webhook_urls"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& url : notifications.webhook_urls) {
        node["notifications"]["webhook_urls"].push_back(url);
    }

    return node;
}

void YamlConfigHelper::apply_env_overrides(core::MonitorConfig& config) {
    if (const char* value = env("MONITOR_BACKEND")) {
        config.connector.backend = value;
    }
    if (const char* value = env("MONITOR_SERVER_URL")) {
        config.connector.server_url = value;
    }
    if (const char* value = env("MONITOR_API_TOKEN")) {
        config.connector.api_token = value;
    }
    if (const char* value = env("MONITOR_TIMEOUT")) {
        try {
            config.connector.request_timeout = std::chrono::seconds(std::stoi(value));
        } catch (const std::exception&) {
            LOG_WARNING("YamlConfig", "Ignoring invalid MONITOR_TIMEOUT: " + std::string(value));
        }
    }
    if (const char* value = env("MONITOR_SSL_VERIFY")) {
        const std::string flag = value;
        config.connector.verify_ssl = !(flag == "false" || flag == "0");
    }
    if (const char* value = env("MONITOR_DB_PATH")) {
        config.history.database_path = value;
    }
    if (const char* value = env("MONITOR_LOG_LEVEL")) {
        config.log_level = log_level_from_string(value);
    }
}

} // namespace utils
} // namespace playback_monitor
