#include "playback_monitor/services/monitor/observation_intake.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace playback_monitor;
using services::ObservationIntake;
using test_support::make_observation;

TEST(ObservationIntakeTest, KeepsPerKeyOrderAcrossShards) {
    std::mutex mutex;
    std::map<std::string, std::vector<std::uint64_t>> seen;

    ObservationIntake intake(4, 4096, [&](const core::Observation& observation) {
        std::lock_guard lock(mutex);
        seen[observation.snapshot.session_key.get()].push_back(observation.revision);
    });
    intake.start();

    for (std::uint64_t revision = 1; revision <= 200; ++revision) {
        for (const char* key : {"a", "b", "c", "d", "e"}) {
            ASSERT_TRUE(intake.submit(make_observation(key, core::SessionState::Playing, revision)));
        }
    }
    intake.drain();
    intake.stop();

    ASSERT_EQ(seen.size(), 5u);
    for (const auto& [key, revisions] : seen) {
        ASSERT_EQ(revisions.size(), 200u) << key;
        EXPECT_TRUE(std::is_sorted(revisions.begin(), revisions.end())) << key;
    }
    EXPECT_EQ(intake.stats().processed, 1000u);
}

TEST(ObservationIntakeTest, SameKeyAlwaysMapsToSameShard) {
    ObservationIntake intake(8, 64, [](const core::Observation&) {});
    const auto shard = intake.shard_for(core::SessionKey("session-17"));
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(intake.shard_for(core::SessionKey("session-17")), shard);
    }
    EXPECT_LT(shard, intake.shard_count());
}

TEST(ObservationIntakeTest, FullShardDropsInsteadOfBlocking) {
    ObservationIntake intake(1, 3, [](const core::Observation&) {});

    // Not started: nothing consumes the queue
    EXPECT_TRUE(intake.submit(make_observation("s1", core::SessionState::Playing, 1)));
    EXPECT_TRUE(intake.submit(make_observation("s1", core::SessionState::Playing, 2)));
    EXPECT_TRUE(intake.submit(make_observation("s1", core::SessionState::Playing, 3)));
    EXPECT_FALSE(intake.submit(make_observation("s1", core::SessionState::Playing, 4)));

    const auto stats = intake.stats();
    EXPECT_EQ(stats.submitted, 4u);
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.max_queue_depth, 3u);
}

TEST(ObservationIntakeTest, DrainWithoutWorkersAppliesOnCaller) {
    std::vector<std::uint64_t> applied;
    ObservationIntake intake(2, 16, [&](const core::Observation& observation) {
        applied.push_back(observation.revision);
    });

    intake.submit(make_observation("s1", core::SessionState::Playing, 1));
    intake.submit(make_observation("s1", core::SessionState::Paused, 2));
    intake.drain();

    EXPECT_EQ(applied, (std::vector<std::uint64_t>{1, 2}));
    EXPECT_EQ(intake.stats().processed, 2u);
}

TEST(ObservationIntakeTest, StopAppliesWhatIsQueued) {
    std::atomic<int> applied{0};
    ObservationIntake intake(2, 1024, [&](const core::Observation&) {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        ++applied;
    });
    intake.start();

    for (std::uint64_t revision = 1; revision <= 100; ++revision) {
        intake.submit(make_observation("s" + std::to_string(revision % 7), core::SessionState::Playing, revision));
    }
    intake.stop();

    EXPECT_EQ(applied.load(), 100);
    EXPECT_FALSE(intake.is_running());
}

TEST(ObservationIntakeTest, ThrowingHandlerDoesNotKillWorker) {
    std::atomic<int> applied{0};
    ObservationIntake intake(1, 16, [&](const core::Observation& observation) {
        if (observation.revision == 1) {
            throw std::runtime_error("bad observation");
        }
        ++applied;
    });
    intake.start();

    intake.submit(make_observation("s1", core::SessionState::Playing, 1));
    intake.submit(make_observation("s1", core::SessionState::Playing, 2));
    intake.drain();
    intake.stop();

    EXPECT_EQ(applied.load(), 1);
    EXPECT_EQ(intake.stats().processed, 2u);
}

TEST(ObservationIntakeTest, DifferentKeysProceedInParallel) {
    std::mutex mutex;
    std::condition_variable released;
    bool release = false;
    std::atomic<int> other_applied{0};

    ObservationIntake intake(4, 64, [&](const core::Observation& observation) {
        if (observation.snapshot.session_key.get() == "slow") {
            std::unique_lock lock(mutex);
            released.wait(lock, [&] { return release; });
            return;
        }
        ++other_applied;
    });
    intake.start();

    const auto slow_shard = intake.shard_for(core::SessionKey("slow"));
    std::string other_key;
    for (int i = 0; other_key.empty(); ++i) {
        const auto candidate = "k" + std::to_string(i);
        if (intake.shard_for(core::SessionKey(candidate)) != slow_shard) {
            other_key = candidate;
        }
    }

    intake.submit(make_observation("slow", core::SessionState::Playing, 1));
    intake.submit(make_observation(other_key, core::SessionState::Playing, 1));

    EXPECT_TRUE(test_support::eventually([&] { return other_applied.load() == 1; }));

    {
        std::lock_guard lock(mutex);
        release = true;
    }
    released.notify_all();
    intake.stop();
}
