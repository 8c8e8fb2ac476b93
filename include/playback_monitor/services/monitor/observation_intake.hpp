#pragma once

#include "playback_monitor/core/models.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace playback_monitor {
namespace services {

// Shared entry point for poll and push observations. Each session key maps
// to one shard; a shard applies its observations in arrival order on its own
// worker thread, so different keys proceed in parallel while one key never
// sees concurrent writers.
class ObservationIntake {
public:
    using Handler = std::function<void(const core::Observation&)>;

    struct Stats {
        std::uint64_t submitted = 0;
        std::uint64_t processed = 0;
        std::uint64_t dropped = 0;
        std::size_t max_queue_depth = 0;
    };

    ObservationIntake(std::size_t shard_count, std::size_t capacity, Handler handler);
    ~ObservationIntake();

    ObservationIntake(const ObservationIntake&) = delete;
    ObservationIntake& operator=(const ObservationIntake&) = delete;

    void start();

    // Applies what is queued, then joins the workers
    void stop();

    // Never blocks; returns false when the shard is full and the observation was dropped
    bool submit(core::Observation observation);

    // Waits until every shard has applied its queue
    void drain();

    bool is_running() const { return m_running.load(); }
    std::size_t shard_count() const { return m_shards.size(); }
    std::size_t shard_for(const core::SessionKey& key) const;
    Stats stats() const;

private:
    struct Shard {
        std::mutex mutex;
        std::condition_variable_any work_available;
        std::condition_variable idle;
        std::deque<core::Observation> queue;
        std::size_t capacity = 0;
        bool busy = false;
        std::atomic<std::uint64_t> submitted{0};
        std::atomic<std::uint64_t> processed{0};
        std::atomic<std::uint64_t> dropped{0};
        std::atomic<std::size_t> max_depth{0};
        std::jthread worker;
    };

    void worker_loop(Shard& shard, std::stop_token stop_token);

    Handler m_handler;
    std::vector<std::unique_ptr<Shard>> m_shards;
    std::atomic<bool> m_running{false};
};

} // namespace services
} // namespace playback_monitor
