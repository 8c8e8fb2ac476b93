#include "playback_monitor/core/config_manager.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/utils/yaml_config.hpp"
#include <cstdlib>
#include <fstream>
#include <shared_mutex>
#include <sstream>

namespace playback_monitor {
namespace core {

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? default_config_directory() / "config.yaml" : config_path) {
        LOG_DEBUG("ConfigService", "Initializing with path: " + m_config_path.string());
    }

    std::expected<void, ConfigError> load() {
        LOG_DEBUG("ConfigService", "Loading configuration");

        if (!std::filesystem::exists(m_config_path)) {
            LOG_INFO("ConfigService", "No configuration at " + m_config_path.string() + ", writing defaults");
            MonitorConfig defaults;
            utils::YamlConfigHelper::apply_env_overrides(defaults);
            {
                std::unique_lock lock(m_mutex);
                m_config = std::move(defaults);
            }
            auto saved = save();
            if (saved) {
                if (auto documented = add_documentation_comments(); !documented) {
                    LOG_DEBUG("ConfigService", "Could not add documentation to " + m_config_path.string());
                }
            }
            return saved;
        }

        auto result = read_file();
        if (!result) {
            return std::unexpected(result.error());
        }

        std::unique_lock lock(m_mutex);
        m_config = std::move(*result);
        LOG_DEBUG("ConfigService", "Configuration loaded");
        return {};
    }

    std::expected<void, ConfigError> save() {
        MonitorConfig config_copy;
        {
            std::shared_lock lock(m_mutex);
            config_copy = m_config;
        }

        LOG_DEBUG("ConfigService", "Saving configuration");
        return utils::YamlConfigHelper::save_to_file(config_copy, m_config_path);
    }

    std::expected<void, ConfigError> reload() {
        LOG_INFO("ConfigService", "Reloading " + m_config_path.string());

        auto result = read_file();
        if (!result) {
            return std::unexpected(result.error());
        }
        return apply(*result, false);
    }

    MonitorConfig get() const {
        std::shared_lock lock(m_mutex);
        return m_config;
    }

    std::expected<void, ConfigError> update(const MonitorConfig& config) {
        LOG_INFO("ConfigService", "Updating configuration");
        return apply(config, true);
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

    void set_event_bus(std::shared_ptr<EventBus> bus) {
        LOG_DEBUG("ConfigService", "Setting event bus");
        m_event_bus = std::move(bus);
    }

private:
    std::expected<MonitorConfig, ConfigError> read_file() const {
        auto result = utils::YamlConfigHelper::load_from_file(m_config_path);
        if (!result) {
            return result;
        }
        utils::YamlConfigHelper::apply_env_overrides(*result);
        return result;
    }

    std::expected<void, ConfigError> apply(const MonitorConfig& config, bool persist) {
        if (!config.is_valid()) {
            LOG_ERROR("ConfigService", "Rejected invalid configuration");
            return std::unexpected(ConfigError::ValidationError);
        }

        MonitorConfig old_config;
        {
            std::unique_lock lock(m_mutex);
            old_config = m_config;
            m_config = config;
        }

        // Save and publish event outside of lock
        if (persist) {
            auto saved = save();
            if (!saved) {
                return saved;
            }
        }

        if (m_event_bus) {
            m_event_bus->publish(events::ConfigurationUpdated{std::move(old_config), config});
        }
        return {};
    }

    std::expected<void, ConfigError> add_documentation_comments() const {
        std::ifstream in_file(m_config_path);
        if (!in_file) {
            return std::unexpected(ConfigError::FileNotFound);
        }

        std::stringstream content;
        content << "# Playback Monitor Configuration\n";
        content << "# Generated on first run. Durations are in milliseconds.\n";
        content << "#\n";
        content << "# connector.backend: plex or emby\n";
        content << "# connector.server_url / api_token: media server address and access token\n";
        content << "# poller.interval_ms: time between session snapshots\n";
        content << "# poller.missed_ticks_before_stop: absent polls tolerated before a session stops\n";
        content << "# poller.failure_threshold: failed polls before poll-only sessions are closed\n";
        content << "# push.*: reconnect backoff for the real-time channel\n";
        content << "# reconciler.stale_session_grace_ms: idle time before an unseen session is closed\n";
        content << "# history.merge_gap_ms: reconnects within this gap extend the previous entry\n";
        content << "# history.database_path: SQLite file; empty keeps history in memory\n";
        content << "# notifications.watched_threshold_percent: progress that counts as watched\n";
        content << "# notifications.webhook_urls: endpoints receiving JSON notifications\n";
        content << "#\n";
        content << "# MONITOR_BACKEND, MONITOR_SERVER_URL, MONITOR_API_TOKEN, MONITOR_TIMEOUT,\n";
        content << "# MONITOR_SSL_VERIFY, MONITOR_DB_PATH and MONITOR_LOG_LEVEL override this file.\n\n";
        content << in_file.rdbuf();
        in_file.close();

        std::ofstream out_file(m_config_path);
        if (!out_file) {
            return std::unexpected(ConfigError::PermissionDenied);
        }

        out_file << content.str();
        return {};
    }

    mutable std::shared_mutex m_mutex;
    std::filesystem::path m_config_path;
    MonitorConfig m_config;
    std::shared_ptr<EventBus> m_event_bus;
};

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

std::expected<void, ConfigError> ConfigManager::save() {
    return m_impl->save();
}

std::expected<void, ConfigError> ConfigManager::reload() {
    return m_impl->reload();
}

MonitorConfig ConfigManager::get() const {
    return m_impl->get();
}

std::expected<void, ConfigError> ConfigManager::update(const MonitorConfig& config) {
    return m_impl->update(config);
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

void ConfigManager::set_event_bus(std::shared_ptr<EventBus> bus) {
    m_impl->set_event_bus(std::move(bus));
}

std::filesystem::path ConfigManager::default_config_directory() {
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        return std::filesystem::path(xdg_config) / "playback-monitor";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "playback-monitor";
    }
    return std::filesystem::path("playback-monitor");
}

} // namespace core
} // namespace playback_monitor
