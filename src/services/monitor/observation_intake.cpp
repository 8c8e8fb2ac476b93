#include "playback_monitor/services/monitor/observation_intake.hpp"
#include "playback_monitor/utils/logger.hpp"
#include <algorithm>

namespace playback_monitor {
namespace services {

ObservationIntake::ObservationIntake(std::size_t shard_count, std::size_t capacity, Handler handler)
    : m_handler(std::move(handler)) {
    const std::size_t shards = shard_count > 0 ? shard_count : 1;
    const std::size_t per_shard = std::max<std::size_t>(1, capacity / shards);

    m_shards.reserve(shards);
    for (std::size_t i = 0; i < shards; ++i) {
        auto shard = std::make_unique<Shard>();
        shard->capacity = per_shard;
        m_shards.push_back(std::move(shard));
    }
}

ObservationIntake::~ObservationIntake() {
    stop();
}

void ObservationIntake::start() {
    if (m_running.exchange(true)) {
        return;
    }

    for (auto& shard : m_shards) {
        Shard* target = shard.get();
        shard->worker = std::jthread([this, target](std::stop_token stop_token) {
            worker_loop(*target, stop_token);
        });
    }

    LOG_DEBUG("ObservationIntake", "Started " + std::to_string(m_shards.size()) + " shard workers");
}

void ObservationIntake::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    for (auto& shard : m_shards) {
        shard->worker.request_stop();
    }
    for (auto& shard : m_shards) {
        if (shard->worker.joinable()) {
            shard->worker.join();
        }
    }

    LOG_DEBUG("ObservationIntake", "Stopped shard workers");
}

std::size_t ObservationIntake::shard_for(const core::SessionKey& key) const {
    return std::hash<core::SessionKey>{}(key) % m_shards.size();
}

bool ObservationIntake::submit(core::Observation observation) {
    auto& shard = *m_shards[shard_for(observation.snapshot.session_key)];
    shard.submitted.fetch_add(1);

    {
        std::lock_guard lock(shard.mutex);
        if (shard.queue.size() >= shard.capacity) {
            shard.dropped.fetch_add(1);
            LOG_WARNING("ObservationIntake", "Shard full, dropping observation for " +
                        observation.snapshot.session_key.get());
            return false;
        }
        shard.queue.push_back(std::move(observation));

        const auto depth = shard.queue.size();
        if (depth > shard.max_depth.load()) {
            shard.max_depth.store(depth);
        }
    }

    shard.work_available.notify_one();
    return true;
}

void ObservationIntake::drain() {
    for (auto& shard : m_shards) {
        std::unique_lock lock(shard->mutex);
        if (!m_running.load()) {
            // No worker to hand off to; apply on the caller's thread
            while (!shard->queue.empty()) {
                auto observation = std::move(shard->queue.front());
                shard->queue.pop_front();
                lock.unlock();
                m_handler(observation);
                shard->processed.fetch_add(1);
                lock.lock();
            }
            continue;
        }
        shard->idle.wait(lock, [&shard] { return shard->queue.empty() && !shard->busy; });
    }
}

ObservationIntake::Stats ObservationIntake::stats() const {
    Stats stats;
    for (const auto& shard : m_shards) {
        stats.submitted += shard->submitted.load();
        stats.processed += shard->processed.load();
        stats.dropped += shard->dropped.load();
        stats.max_queue_depth = std::max(stats.max_queue_depth, shard->max_depth.load());
    }
    return stats;
}

void ObservationIntake::worker_loop(Shard& shard, std::stop_token stop_token) {
    std::unique_lock lock(shard.mutex);

    while (true) {
        shard.work_available.wait(lock, stop_token, [&shard] { return !shard.queue.empty(); });

        if (shard.queue.empty()) {
            // Stop requested and nothing left to apply
            shard.idle.notify_all();
            return;
        }

        auto observation = std::move(shard.queue.front());
        shard.queue.pop_front();
        shard.busy = true;
        lock.unlock();

        try {
            m_handler(observation);
        } catch (const std::exception& e) {
            LOG_ERROR("ObservationIntake", "Handler failed for " + observation.snapshot.session_key.get() +
                      ": " + e.what());
        }
        shard.processed.fetch_add(1);

        lock.lock();
        shard.busy = false;
        if (shard.queue.empty()) {
            shard.idle.notify_all();
        }
    }
}

} // namespace services
} // namespace playback_monitor
