#pragma once

#include "playback_monitor/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <expected>
#include <filesystem>

namespace playback_monitor {
namespace utils {

class YamlConfigHelper {
public:
    // Load configuration from YAML file
    static std::expected<core::MonitorConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Save configuration to YAML file
    static std::expected<void, core::ConfigError>
    save_to_file(const core::MonitorConfig& config, const std::filesystem::path& path);

    // Convert between YAML nodes and config structures. Keys missing from
    // the node keep their defaults; durations are in milliseconds.
    static core::MonitorConfig from_yaml(const YAML::Node& node);
    static YAML::Node to_yaml(const core::MonitorConfig& config);

    // MONITOR_* environment variables take precedence over the file
    static void apply_env_overrides(core::MonitorConfig& config);

private:
    static core::ConnectorConfig parse_connector_config(const YAML::Node& node);
    static core::PollerConfig parse_poller_config(const YAML::Node& node);
    static core::PushConfig parse_push_config(const YAML::Node& node);
    static core::ReconcilerConfig parse_reconciler_config(const YAML::Node& node);
    static core::HistoryConfig parse_history_config(const YAML::Node& node);
    static core::NotificationConfig parse_notification_config(const YAML::Node& node);
};

} // namespace utils
} // namespace playback_monitor
