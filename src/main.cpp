#include "playback_monitor/core/config_manager.hpp"
#include "playback_monitor/core/event_bus.hpp"
#include "playback_monitor/core/events.hpp"
#include "playback_monitor/core/monitoring_pipeline.hpp"
#include "playback_monitor/utils/logger.hpp"
#include "playback_monitor/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace {
    std::atomic<bool> g_shutdown_requested{false};
    std::atomic<bool> g_reload_requested{false};

    void handle_shutdown_signal(int) {
        g_shutdown_requested = true;
    }

    void handle_reload_signal(int) {
        g_reload_requested = true;
    }

    void register_signal_handlers() {
        std::signal(SIGINT, handle_shutdown_signal);
        std::signal(SIGTERM, handle_shutdown_signal);
        std::signal(SIGHUP, handle_reload_signal);
    }

    std::unique_ptr<playback_monitor::utils::Logger> setup_logging(const playback_monitor::core::MonitorConfig& config) {
        using namespace playback_monitor::utils;

        auto logger = std::make_unique<Logger>(config.log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        std::filesystem::path log_path = config.log_file;
        if (log_path.empty()) {
            log_path = playback_monitor::core::ConfigManager::default_config_directory() / "playback-monitor.log";
        }

        auto file_sink = std::make_unique<FileSink>(log_path, false);
        if (file_sink->is_open()) {
            logger->add_sink(std::move(file_sink));
            std::cerr << "Logging to: " << log_path << std::endl;
        } else {
            std::cerr << "Cannot open log file " << log_path << ", logging to console only" << std::endl;
        }

        return logger;
    }

    void subscribe_operator_events(playback_monitor::core::EventBus& bus) {
        using namespace playback_monitor::core;

        bus.subscribe<events::ConnectorUnauthorized>([](const events::ConnectorUnauthorized& event) {
            LOG_ERROR("Main", event.message);
        });
        bus.subscribe<events::PollerDegraded>([](const events::PollerDegraded& event) {
            LOG_WARNING("Main", "Backend unreachable for " + std::to_string(event.consecutive_failures) +
                        " polls, closed " + std::to_string(event.sessions_flushed) + " sessions");
        });
        bus.subscribe<events::HistoryStorageFailure>([](const events::HistoryStorageFailure& event) {
            LOG_DEBUG("Main", "History write for " + event.session_key.get() + " failed after " +
                      std::to_string(event.attempts) + " attempts");
        });
    }

    void log_status(const playback_monitor::core::MonitoringPipeline& pipeline) {
        const auto status = pipeline.status();
        LOG_DEBUG("Main", "live=" + std::to_string(status.live_sessions) +
                  " pending=" + std::to_string(status.pending_flushes) +
                  " push=" + std::string(!status.push_supported ? "unsupported" :
                                         status.push_connected ? "connected" : "down") +
                  " poll_failures=" + std::to_string(status.poll_failures) +
                  " applied=" + std::to_string(status.reconciler.applied) +
                  " stale=" + std::to_string(status.reconciler.stale) +
                  " notified=" + std::to_string(status.notifications.delivered) +
                  " dropped=" + std::to_string(status.notifications.dropped + status.intake.dropped));
    }
} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path{};

    auto event_bus = std::make_shared<playback_monitor::core::EventBus>();
    auto config_service = std::make_shared<playback_monitor::core::ConfigManager>(config_path);
    if (auto loaded = config_service->load(); !loaded) {
        std::cerr << "Cannot load configuration from " << config_service->path() << ": "
                  << playback_monitor::core::to_string(loaded.error()) << std::endl;
        return EXIT_FAILURE;
    }
    config_service->set_event_bus(event_bus);

    const auto config = config_service->get();
    playback_monitor::utils::LoggerManager::set_instance(setup_logging(config));

    LOG_INFO("Main", "PlaybackMonitor v" PLAYBACK_MONITOR_VERSION_STRING " starting...");
    LOG_DEBUG("Main", "Configuration: " + config_service->path().string());

    register_signal_handlers();
    subscribe_operator_events(*event_bus);

    try {
        auto pipeline_result = playback_monitor::core::MonitoringPipeline::create(config, event_bus);
        if (!pipeline_result) {
            LOG_ERROR("Main", "Cannot create pipeline: " + playback_monitor::core::to_string(pipeline_result.error()));
            if (pipeline_result.error() == playback_monitor::core::PipelineError::InvalidConfiguration) {
                LOG_ERROR("Main", "Set connector.server_url and connector.api_token in " +
                          config_service->path().string());
            }
            return EXIT_FAILURE;
        }

        auto pipeline = std::move(*pipeline_result);
        if (auto started = pipeline->start(); !started) {
            LOG_ERROR("Main", "Pipeline start failed: " + playback_monitor::core::to_string(started.error()));
            return EXIT_FAILURE;
        }

        std::cout << "\nPlaybackMonitor v" PLAYBACK_MONITOR_VERSION_STRING " running\n"
                  << "Press Ctrl+C to exit, send SIGHUP to reload the configuration\n" << std::endl;

        constexpr auto status_interval = std::chrono::seconds(60);
        auto next_status = std::chrono::steady_clock::now() + status_interval;

        while (!g_shutdown_requested) {
            if (g_reload_requested.exchange(false)) {
                if (auto reloaded = config_service->reload(); !reloaded) {
                    LOG_WARNING("Main", "Reload failed (" + playback_monitor::core::to_string(reloaded.error()) +
                                "), keeping the current configuration");
                }
            }

            if (std::chrono::steady_clock::now() >= next_status) {
                log_status(*pipeline);
                next_status += status_interval;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        LOG_INFO("Main", "Shutting down...");
        pipeline->stop();

        LOG_INFO("Main", "Shutdown complete");
        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
