#include "playback_monitor/core/config_manager.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/utils/yaml_config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

using namespace playback_monitor;
using namespace std::chrono_literals;
using core::ConfigError;
using core::ConfigManager;
using utils::YamlConfigHelper;

namespace {

const char* const OVERRIDE_VARIABLES[] = {
    "MONITOR_BACKEND", "MONITOR_SERVER_URL", "MONITOR_API_TOKEN", "MONITOR_TIMEOUT",
    "MONITOR_SSL_VERIFY", "MONITOR_DB_PATH", "MONITOR_LOG_LEVEL"
};

core::MonitorConfig valid_config() {
    core::MonitorConfig config;
    config.connector.backend = "emby";
    config.connector.server_url = "https://emby.example.com:8920";
    config.connector.api_token = "token-1";
    config.connector.request_timeout = 12s;
    config.poller.interval = 2500ms;
    config.poller.missed_ticks_before_stop = 2;
    config.push.enabled = false;
    config.reconciler.shard_count = 8;
    config.history.database_path = "/var/lib/playback-monitor/history.db";
    config.history.merge_gap = 45000ms;
    config.notifications.watched_threshold_percent = 90;
    config.notifications.webhook_urls = {"http://hooks.local/a", "http://hooks.local/b"};
    config.log_level = utils::LogLevel::Debug;
    return config;
}

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : OVERRIDE_VARIABLES) {
            unsetenv(name);
        }
        std::random_device device;
        m_dir = std::filesystem::temp_directory_path() /
                ("playback-monitor-config-" + std::to_string(device()));
        m_path = m_dir / "config.yaml";
    }

    void TearDown() override {
        for (const char* name : OVERRIDE_VARIABLES) {
            unsetenv(name);
        }
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    void write_file(const std::string& content) {
        std::filesystem::create_directories(m_dir);
        std::ofstream file(m_path);
        file << content;
    }

    std::filesystem::path m_dir;
    std::filesystem::path m_path;
};

} // namespace

TEST_F(ConfigTest, SavedFileLoadsBackUnchanged) {
    const auto original = valid_config();
    ASSERT_TRUE(YamlConfigHelper::save_to_file(original, m_path));

    auto loaded = YamlConfigHelper::load_from_file(m_path);
    ASSERT_TRUE(loaded);

    EXPECT_EQ(loaded->connector.backend, "emby");
    EXPECT_EQ(loaded->connector.server_url, original.connector.server_url);
    EXPECT_EQ(loaded->connector.request_timeout, 12s);
    EXPECT_EQ(loaded->poller.interval, 2500ms);
    EXPECT_EQ(loaded->poller.missed_ticks_before_stop, 2);
    EXPECT_FALSE(loaded->push.enabled);
    EXPECT_EQ(loaded->reconciler.shard_count, 8u);
    EXPECT_EQ(loaded->history.database_path, original.history.database_path);
    EXPECT_EQ(loaded->history.merge_gap, 45000ms);
    EXPECT_EQ(loaded->notifications.watched_threshold_percent, 90);
    EXPECT_EQ(loaded->notifications.webhook_urls, original.notifications.webhook_urls);
    EXPECT_EQ(loaded->log_level, utils::LogLevel::Debug);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    write_file(
        "connector:\n"
        "  server_url: http://plex.local:32400\n"
        "  request_timeout_ms: 250\n"
        "poller:\n"
        "  interval_ms: 1000\n");

    auto loaded = YamlConfigHelper::load_from_file(m_path);
    ASSERT_TRUE(loaded);

    const core::MonitorConfig defaults;
    EXPECT_EQ(loaded->connector.backend, "plex");
    EXPECT_EQ(loaded->connector.server_url, "http://plex.local:32400");
    // Sub-second timeouts round up to the one-second floor
    EXPECT_EQ(loaded->connector.request_timeout, 1s);
    EXPECT_EQ(loaded->poller.interval, 1000ms);
    EXPECT_EQ(loaded->poller.failure_threshold, defaults.poller.failure_threshold);
    EXPECT_EQ(loaded->history.merge_gap, defaults.history.merge_gap);
    EXPECT_EQ(loaded->notifications.queue_capacity, defaults.notifications.queue_capacity);
}

TEST_F(ConfigTest, ReportsMissingAndUnparsableFiles) {
    auto missing = YamlConfigHelper::load_from_file(m_path);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error(), ConfigError::FileNotFound);

    write_file("connector: [unterminated\n");
    auto broken = YamlConfigHelper::load_from_file(m_path);
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error(), ConfigError::InvalidFormat);
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    setenv("MONITOR_SERVER_URL", "http://override.local:8096", 1);
    setenv("MONITOR_BACKEND", "emby", 1);
    setenv("MONITOR_TIMEOUT", "7", 1);
    setenv("MONITOR_SSL_VERIFY", "false", 1);
    setenv("MONITOR_DB_PATH", "/tmp/override.db", 1);
    setenv("MONITOR_LOG_LEVEL", "error", 1);

    auto config = valid_config();
    config.connector.backend = "plex";
    YamlConfigHelper::apply_env_overrides(config);

    EXPECT_EQ(config.connector.server_url, "http://override.local:8096");
    EXPECT_EQ(config.connector.backend, "emby");
    EXPECT_EQ(config.connector.request_timeout, 7s);
    EXPECT_FALSE(config.connector.verify_ssl);
    EXPECT_EQ(config.history.database_path, "/tmp/override.db");
    EXPECT_EQ(config.log_level, utils::LogLevel::Error);
    EXPECT_EQ(config.connector.api_token, "token-1");
}

TEST_F(ConfigTest, InvalidTimeoutOverrideIsIgnored) {
    setenv("MONITOR_TIMEOUT", "soon", 1);

    auto config = valid_config();
    YamlConfigHelper::apply_env_overrides(config);

    EXPECT_EQ(config.connector.request_timeout, 12s);
}

TEST_F(ConfigTest, ValidationCoversEverySection) {
    EXPECT_TRUE(valid_config().is_valid());
    EXPECT_FALSE(core::MonitorConfig{}.is_valid());

    auto bad_backend = valid_config();
    bad_backend.connector.backend = "jellyfin";
    EXPECT_FALSE(bad_backend.is_valid());

    auto bad_interval = valid_config();
    bad_interval.poller.interval = 0ms;
    EXPECT_FALSE(bad_interval.is_valid());

    auto bad_backoff = valid_config();
    bad_backoff.push.reconnect_max_backoff = bad_backoff.push.reconnect_initial_backoff - 1ms;
    EXPECT_FALSE(bad_backoff.is_valid());

    auto bad_intake = valid_config();
    bad_intake.reconciler.intake_capacity = bad_intake.reconciler.shard_count - 1;
    EXPECT_FALSE(bad_intake.is_valid());

    auto bad_webhook = valid_config();
    bad_webhook.notifications.webhook_urls.push_back("not a url");
    EXPECT_FALSE(bad_webhook.is_valid());

    auto bad_threshold = valid_config();
    bad_threshold.notifications.watched_threshold_percent = 101;
    EXPECT_FALSE(bad_threshold.is_valid());
}

TEST_F(ConfigTest, FirstLoadWritesDefaults) {
    setenv("MONITOR_SERVER_URL", "http://plex.local:32400", 1);

    ConfigManager manager(m_path);
    ASSERT_TRUE(manager.load());

    EXPECT_TRUE(std::filesystem::exists(m_path));
    EXPECT_EQ(manager.get().connector.server_url, "http://plex.local:32400");
    EXPECT_EQ(manager.path(), m_path);

    auto written = YamlConfigHelper::load_from_file(m_path);
    ASSERT_TRUE(written);
    EXPECT_EQ(written->connector.server_url, "http://plex.local:32400");
}

TEST_F(ConfigTest, UpdateValidatesPersistsAndAnnounces) {
    ConfigManager manager(m_path);
    ASSERT_TRUE(YamlConfigHelper::save_to_file(valid_config(), m_path));
    ASSERT_TRUE(manager.load());

    auto bus = std::make_shared<core::EventBus>();
    manager.set_event_bus(bus);

    std::vector<core::events::ConfigurationUpdated> updates;
    bus->subscribe<core::events::ConfigurationUpdated>(
        [&updates](const core::events::ConfigurationUpdated& event) { updates.push_back(event); });

    auto invalid = valid_config();
    invalid.connector.server_url.clear();
    auto rejected = manager.update(invalid);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error(), ConfigError::ValidationError);
    EXPECT_TRUE(updates.empty());
    EXPECT_EQ(manager.get().connector.server_url, "https://emby.example.com:8920");

    auto changed = valid_config();
    changed.connector.api_token = "token-2";
    ASSERT_TRUE(manager.update(changed));

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].previous_config.connector.api_token, "token-1");
    EXPECT_EQ(updates[0].new_config.connector.api_token, "token-2");

    auto persisted = YamlConfigHelper::load_from_file(m_path);
    ASSERT_TRUE(persisted);
    EXPECT_EQ(persisted->connector.api_token, "token-2");
}

TEST_F(ConfigTest, ReloadPicksUpEditedFile) {
    ASSERT_TRUE(YamlConfigHelper::save_to_file(valid_config(), m_path));
    ConfigManager manager(m_path);
    ASSERT_TRUE(manager.load());

    auto edited = valid_config();
    edited.poller.interval = 9000ms;
    ASSERT_TRUE(YamlConfigHelper::save_to_file(edited, m_path));

    ASSERT_TRUE(manager.reload());
    EXPECT_EQ(manager.get().poller.interval, 9000ms);
}

TEST_F(ConfigTest, ReloadKeepsCurrentConfigWhenFileIsBroken) {
    ASSERT_TRUE(YamlConfigHelper::save_to_file(valid_config(), m_path));
    ConfigManager manager(m_path);
    ASSERT_TRUE(manager.load());

    write_file("poller: {interval_ms: [\n");
    auto result = manager.reload();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), ConfigError::InvalidFormat);
    EXPECT_EQ(manager.get().poller.interval, 2500ms);
}
