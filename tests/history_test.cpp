#include "playback_monitor/services/history/history_writer.hpp"
#include "playback_monitor/core/events.hpp"
#include "fakes/failing_history_store.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace playback_monitor;
using namespace std::chrono_literals;
using services::HistoryWriter;
using services::InMemoryHistoryStore;
using test_support::FailingHistoryStore;

namespace {

const auto T0 = core::from_epoch_ms(1'700'000'000'000);

core::Session finished_session(const std::string& key,
                               std::chrono::seconds start,
                               std::chrono::seconds stop,
                               std::int64_t position_ms = 0,
                               const std::string& user_id = "u1",
                               const std::string& item_id = "42") {
    core::Session session;
    session.snapshot = test_support::make_snapshot(key, core::SessionState::Stopped, position_ms, 300000);
    session.snapshot.user_id = user_id;
    session.snapshot.item_id = item_id;
    session.started_at = T0 + start;
    session.last_seen_at = T0 + stop;
    session.stopped_at = T0 + stop;
    return session;
}

core::HistoryConfig fast_history(int retries = 2) {
    return core::HistoryConfig{
        .database_path = "",
        .merge_gap = 30s,
        .write_retries = retries,
        .write_initial_backoff = 1ms,
        .write_max_backoff = 2ms
    };
}

} // namespace

TEST(HistoryWriterTest, EntryCarriesSessionSummary) {
    auto session = finished_session("s1", 0s, 600s, 270000);
    session.paused_duration_ms = 15000;
    session.ever_transcoded = true;
    session.history_note = "grace expired";

    const auto entry = HistoryWriter::entry_for(session);

    EXPECT_EQ(entry.history_id, "u1|42|1700000000000");
    EXPECT_EQ(entry.session_key_group, (std::vector<core::SessionKey>{core::SessionKey("s1")}));
    EXPECT_EQ(entry.started_at, T0);
    EXPECT_EQ(entry.stopped_at, T0 + 600s);
    EXPECT_EQ(entry.watched_percent, 90);
    EXPECT_EQ(entry.paused_duration_ms, 15000);
    EXPECT_TRUE(entry.transcoded);
    EXPECT_EQ(entry.note, "grace expired");
}

TEST(HistoryWriterTest, ReconnectWithinGapJoinsTheSameEntry) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    auto first = finished_session("s1", 0s, 600s, 100000);
    first.paused_duration_ms = 2000;
    auto second = finished_session("s2", 610s, 1200s, 270000);
    second.paused_duration_ms = 3000;

    ASSERT_TRUE(writer.record(first));
    auto merged = writer.record(second);

    ASSERT_TRUE(merged);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(merged->history_id, HistoryWriter::make_history_id(first));
    EXPECT_EQ(merged->session_key_group,
              (std::vector<core::SessionKey>{core::SessionKey("s1"), core::SessionKey("s2")}));
    EXPECT_EQ(merged->started_at, T0);
    EXPECT_EQ(merged->stopped_at, T0 + 1200s);
    EXPECT_EQ(merged->paused_duration_ms, 5000);
    EXPECT_EQ(merged->final_position_ms, 270000);
    EXPECT_EQ(merged->watched_percent, 90);
}

TEST(HistoryWriterTest, LongGapStartsANewEntry) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    ASSERT_TRUE(writer.record(finished_session("s1", 0s, 600s)));
    ASSERT_TRUE(writer.record(finished_session("s2", 900s, 1200s)));

    EXPECT_EQ(store->size(), 2u);
    auto recent = store->list_recent(10);
    ASSERT_TRUE(recent);
    ASSERT_EQ(recent->size(), 2u);
    EXPECT_EQ((*recent)[0].session_key_group.front().get(), "s2");
}

TEST(HistoryWriterTest, OtherUserOrItemDoesNotMerge) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    ASSERT_TRUE(writer.record(finished_session("s1", 0s, 600s)));
    ASSERT_TRUE(writer.record(finished_session("s2", 605s, 700s, 0, "u2")));
    ASSERT_TRUE(writer.record(finished_session("s3", 605s, 700s, 0, "u1", "43")));

    EXPECT_EQ(store->size(), 3u);
}

TEST(HistoryWriterTest, RepeatedFlushOfOneSessionIsIdempotent) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    auto session = finished_session("s1", 0s, 600s, 150000);
    session.paused_duration_ms = 4000;

    ASSERT_TRUE(writer.record(session));
    auto again = writer.record(session);

    ASSERT_TRUE(again);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(again->paused_duration_ms, 4000);
    EXPECT_EQ(again->session_key_group.size(), 1u);
    EXPECT_EQ(again->watched_percent, 50);
}

TEST(HistoryWriterTest, ReusedKeyAfterLongGapStartsANewEntry) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    ASSERT_TRUE(writer.record(finished_session("5", 0s, 60s)));
    auto later = writer.record(finished_session("5", 1000s, 1100s));

    ASSERT_TRUE(later);
    EXPECT_EQ(store->size(), 2u);
    EXPECT_EQ(later->started_at, T0 + 1000s);
    EXPECT_EQ(later->stopped_at, T0 + 1100s);

    auto earlier = store->find(HistoryWriter::make_history_id(finished_session("5", 0s, 60s)));
    ASSERT_TRUE(earlier && earlier->has_value());
    EXPECT_EQ((*earlier)->stopped_at, T0 + 60s);
}

TEST(HistoryWriterTest, ReusedKeyWithinGapJoinsTheEntry) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    auto first = finished_session("5", 0s, 60s);
    first.paused_duration_ms = 1000;
    auto second = finished_session("5", 70s, 100s);
    second.paused_duration_ms = 2000;

    ASSERT_TRUE(writer.record(first));
    auto merged = writer.record(second);

    ASSERT_TRUE(merged);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(merged->session_key_group.size(), 1u);
    EXPECT_EQ(merged->stopped_at, T0 + 100s);
    EXPECT_EQ(merged->paused_duration_ms, 3000);
}

TEST(HistoryWriterTest, MergedMemberFlushedAgainIsIdempotent) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    auto first = finished_session("s1", 0s, 600s);
    first.paused_duration_ms = 1000;
    auto second = finished_session("s2", 610s, 1200s);
    second.paused_duration_ms = 2000;

    ASSERT_TRUE(writer.record(first));
    ASSERT_TRUE(writer.record(second));
    auto again = writer.record(second);

    ASSERT_TRUE(again);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(again->session_key_group.size(), 2u);
    EXPECT_EQ(again->paused_duration_ms, 3000);
}

TEST(HistoryWriterTest, AnonymousSessionsAreNeverMerged) {
    auto store = std::make_shared<InMemoryHistoryStore>();
    HistoryWriter writer(store, fast_history());

    ASSERT_TRUE(writer.record(finished_session("s1", 0s, 600s, 0, "")));
    ASSERT_TRUE(writer.record(finished_session("s2", 601s, 700s, 0, "")));

    EXPECT_EQ(store->size(), 2u);
}

TEST(HistoryWriterTest, TransientStorageErrorsAreRetried) {
    auto store = std::make_shared<FailingHistoryStore>();
    store->fail_next(2);
    auto bus = std::make_shared<core::EventBus>();
    int failures = 0;
    bus->subscribe<core::events::HistoryStorageFailure>([&](const core::events::HistoryStorageFailure&) {
        ++failures;
    });

    HistoryWriter writer(store, fast_history(3));
    writer.set_event_bus(bus);

    EXPECT_TRUE(writer.record(finished_session("s1", 0s, 600s)));
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(failures, 0);
    EXPECT_TRUE(writer.storage_healthy());
}

TEST(HistoryWriterTest, ExhaustedRetriesReportFailureUntilRecovery) {
    test_support::ScopedLogCapture logs;
    auto store = std::make_shared<FailingHistoryStore>();
    store->set_down(true);
    auto bus = std::make_shared<core::EventBus>();
    std::vector<int> attempts;
    int recoveries = 0;
    bus->subscribe<core::events::HistoryStorageFailure>([&](const core::events::HistoryStorageFailure& event) {
        attempts.push_back(event.attempts);
        EXPECT_EQ(event.error, core::StorageError::Unavailable);
    });
    bus->subscribe<core::events::HistoryStorageRecovered>([&](const core::events::HistoryStorageRecovered&) {
        ++recoveries;
    });

    HistoryWriter writer(store, fast_history(2));
    writer.set_event_bus(bus);

    auto first = writer.record(finished_session("s1", 0s, 600s));
    auto second = writer.record(finished_session("s2", 700s, 800s));

    ASSERT_FALSE(first);
    EXPECT_EQ(first.error(), core::HistoryError::StorageFailed);
    EXPECT_FALSE(second);
    EXPECT_FALSE(writer.storage_healthy());
    EXPECT_EQ(attempts, (std::vector<int>{3, 3}));
    EXPECT_EQ(logs.count("History storage unavailable"), 1u);

    store->set_down(false);
    EXPECT_TRUE(writer.record(finished_session("s1", 0s, 600s)));
    EXPECT_TRUE(writer.storage_healthy());
    EXPECT_EQ(recoveries, 1);
}

TEST(HistoryWriterTest, SingleAttemptDoesNotWaitOutBackoff) {
    auto store = std::make_shared<FailingHistoryStore>();
    store->set_down(true);
    auto bus = std::make_shared<core::EventBus>();
    std::vector<int> attempts;
    bus->subscribe<core::events::HistoryStorageFailure>([&](const core::events::HistoryStorageFailure& event) {
        attempts.push_back(event.attempts);
    });
    HistoryWriter writer(store, core::HistoryConfig{
        .database_path = "",
        .merge_gap = 30s,
        .write_retries = 5,
        .write_initial_backoff = 10s,
        .write_max_backoff = 10s
    });
    writer.set_event_bus(bus);

    const auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(writer.record_once(finished_session("a", 0s, 600s)));
    EXPECT_FALSE(writer.record_once(finished_session("b", 0s, 600s, 0, "u1", "43")));
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
    EXPECT_EQ(attempts, (std::vector<int>{1, 1}));
    EXPECT_FALSE(writer.storage_healthy());
}

TEST(HistoryWriterTest, BackoffWaitDoesNotBlockOtherRecords) {
    auto store = std::make_shared<FailingHistoryStore>();
    store->fail_next(1);
    HistoryWriter writer(store, core::HistoryConfig{
        .database_path = "",
        .merge_gap = 30s,
        .write_retries = 1,
        .write_initial_backoff = 1500ms,
        .write_max_backoff = 1500ms
    });

    std::jthread retrying([&writer] {
        EXPECT_TRUE(writer.record(finished_session("a", 0s, 600s)));
    });
    ASSERT_TRUE(test_support::eventually([&] { return store->failures_remaining() == 0; }));

    const auto before = std::chrono::steady_clock::now();
    EXPECT_TRUE(writer.record(finished_session("b", 0s, 600s, 0, "u1", "43")));
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);

    retrying.join();
    EXPECT_EQ(store->size(), 2u);
}

TEST(HistoryWriterTest, ShutdownAbortsRetryWaits) {
    auto store = std::make_shared<FailingHistoryStore>();
    store->set_down(true);
    HistoryWriter writer(store, core::HistoryConfig{
        .database_path = "",
        .merge_gap = 30s,
        .write_retries = 5,
        .write_initial_backoff = 10s,
        .write_max_backoff = 10s
    });

    writer.shutdown();
    const auto before = std::chrono::steady_clock::now();
    EXPECT_FALSE(writer.record(finished_session("s1", 0s, 600s)));
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2s);
}

TEST(HistoryWriterTest, MergeKeepsEarliestStartAndOrsTranscode) {
    auto existing = HistoryWriter::entry_for(finished_session("s1", 0s, 600s, 100000));
    auto next = HistoryWriter::entry_for(finished_session("s2", 620s, 900s, 200000));
    next.transcoded = true;
    next.note = "shutdown";

    EXPECT_TRUE(HistoryWriter::continues(existing, next, 30s));
    EXPECT_FALSE(HistoryWriter::continues(existing, next, 10s));

    const auto merged = HistoryWriter::merge(existing, next);
    EXPECT_EQ(merged.history_id, existing.history_id);
    EXPECT_EQ(merged.started_at, T0);
    EXPECT_EQ(merged.stopped_at, T0 + 900s);
    EXPECT_TRUE(merged.transcoded);
    EXPECT_EQ(merged.note, "shutdown");
    EXPECT_EQ(merged.watched_percent, 67);
}

TEST(InMemoryHistoryStoreTest, FindLatestPicksMostRecentStop) {
    InMemoryHistoryStore store;
    auto older = HistoryWriter::entry_for(finished_session("s1", 0s, 600s));
    auto newer = HistoryWriter::entry_for(finished_session("s2", 3600s, 4000s));
    ASSERT_TRUE(store.upsert(older));
    ASSERT_TRUE(store.upsert(newer));

    auto latest = store.find_latest("u1", "42");
    ASSERT_TRUE(latest);
    ASSERT_TRUE(latest->has_value());
    EXPECT_EQ((*latest)->history_id, newer.history_id);

    auto missing = store.find_latest("u9", "42");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing->has_value());
}
