#pragma once

#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>

namespace playback_monitor {
namespace core {

// Owns the active MonitorConfig and its YAML file. Updates are validated,
// persisted and announced with ConfigurationUpdated on the event bus.
class ConfigManager {
public:
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    // Core operations
    std::expected<void, ConfigError> load();
    std::expected<void, ConfigError> save();

    // Re-reads the file and applies it through update()
    std::expected<void, ConfigError> reload();

    // Configuration access
    MonitorConfig get() const;
    std::expected<void, ConfigError> update(const MonitorConfig& config);

    const std::filesystem::path& path() const;

    // Event notifications
    void set_event_bus(std::shared_ptr<EventBus> bus);

    static std::filesystem::path default_config_directory();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace core
} // namespace playback_monitor
