#include "playback_monitor/services/notification/bounded_queue.hpp"
#include "playback_monitor/services/notification/notification_dispatcher.hpp"
#include "playback_monitor/services/notification/notification_handlers.hpp"
#include "fakes/mock_http_client.hpp"
#include "fakes/recording_handler.hpp"
#include "test_support.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace playback_monitor;
using namespace std::chrono_literals;
using core::NotificationAction;
using core::SessionState;
using services::BoundedQueue;
using services::NotificationDispatcher;
using test_support::MockHttpClient;
using test_support::RecordingHandler;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SaveArg;

namespace {

core::LifecycleEvent lifecycle(const std::string& key, SessionState from, SessionState to,
                               std::int64_t position_ms = 0, std::int64_t duration_ms = 0) {
    core::LifecycleEvent event;
    event.session_key = core::SessionKey(key);
    event.from_state = from;
    event.to_state = to;
    event.timestamp = core::from_epoch_ms(1'700'000'000'000);
    event.snapshot = test_support::make_snapshot(key, to, position_ms, duration_ms);
    return event;
}

core::NotificationConfig dispatcher_config(std::size_t capacity = 64, int retries = 0) {
    core::NotificationConfig config;
    config.queue_capacity = capacity;
    config.watched_threshold_percent = 85;
    config.handler_retries = retries;
    config.log_handler = false;
    return config;
}

} // namespace

TEST(BoundedQueueTest, FullQueueEvictsOldest) {
    BoundedQueue<int> queue(2);

    EXPECT_EQ(queue.push(1), 0u);
    EXPECT_EQ(queue.push(2), 0u);
    EXPECT_EQ(queue.push(3), 1u);

    EXPECT_EQ(queue.dropped(), 1u);
    EXPECT_EQ(queue.try_pop(), 2);
    EXPECT_EQ(queue.try_pop(), 3);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(BoundedQueueTest, ClosedQueueDrainsThenEnds) {
    BoundedQueue<int> queue(4);
    queue.push(1);
    queue.close();

    EXPECT_EQ(queue.push(2), 1u);
    std::stop_source never;
    EXPECT_EQ(queue.pop(never.get_token()), 1);
    EXPECT_FALSE(queue.pop(never.get_token()).has_value());

    queue.reopen();
    EXPECT_EQ(queue.push(3), 0u);
    EXPECT_EQ(queue.size(), 1u);
}

TEST(BoundedQueueTest, PopReturnsWhenStopRequested) {
    BoundedQueue<int> queue(4);
    std::jthread consumer([&queue](std::stop_token token) {
        EXPECT_FALSE(queue.pop(token).has_value());
    });
    std::this_thread::sleep_for(10ms);
    consumer.request_stop();
}

TEST(BoundedQueueTest, ShrinkingCapacityTrimsOldest) {
    BoundedQueue<int> queue(4);
    for (int i = 1; i <= 4; ++i) {
        queue.push(i);
    }
    EXPECT_EQ(queue.set_capacity(2), 2u);

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 2u);
    EXPECT_EQ(queue.try_pop(), 3);
}

TEST(BoundedQueueTest, ConcurrentProducersSeeOnlyTheirOwnDrops) {
    BoundedQueue<int> queue(8);
    std::atomic<std::size_t> reported{0};
    {
        std::vector<std::jthread> producers;
        for (int p = 0; p < 4; ++p) {
            producers.emplace_back([&queue, &reported] {
                for (int i = 0; i < 200; ++i) {
                    reported.fetch_add(queue.push(i));
                }
            });
        }
    }

    EXPECT_EQ(queue.size(), 8u);
    EXPECT_EQ(reported.load(), 800u - 8u);
    EXPECT_EQ(queue.dropped(), reported.load());
}

TEST(NotificationActionsTest, MapsTransitionsToActions) {
    using Actions = std::vector<NotificationAction>;
    auto actions_for = [](SessionState from, SessionState to) {
        Actions actions;
        for (const auto& n : NotificationDispatcher::map_actions(lifecycle("s1", from, to), 85)) {
            actions.push_back(n.action);
        }
        return actions;
    };

    EXPECT_EQ(actions_for(SessionState::Starting, SessionState::Playing), Actions{NotificationAction::OnStart});
    EXPECT_EQ(actions_for(SessionState::Starting, SessionState::Paused), Actions{NotificationAction::OnStart});
    EXPECT_EQ(actions_for(SessionState::Starting, SessionState::Buffering), Actions{NotificationAction::OnStart});
    EXPECT_EQ(actions_for(SessionState::Playing, SessionState::Paused), Actions{NotificationAction::OnPause});
    EXPECT_EQ(actions_for(SessionState::Paused, SessionState::Playing), Actions{NotificationAction::OnResume});
    EXPECT_EQ(actions_for(SessionState::Playing, SessionState::Error), Actions{NotificationAction::OnError});
    EXPECT_EQ(actions_for(SessionState::Playing, SessionState::Stopped), Actions{NotificationAction::OnStop});
    EXPECT_TRUE(actions_for(SessionState::Buffering, SessionState::Playing).empty());
    EXPECT_TRUE(actions_for(SessionState::Paused, SessionState::Buffering).empty());
}

TEST(NotificationActionsTest, WatchedFollowsStopAtThreshold) {
    const auto watched = NotificationDispatcher::map_actions(
        lifecycle("s1", SessionState::Playing, SessionState::Stopped, 270000, 300000), 85);
    ASSERT_EQ(watched.size(), 2u);
    EXPECT_EQ(watched[0].action, NotificationAction::OnStop);
    EXPECT_EQ(watched[1].action, NotificationAction::OnWatched);
    EXPECT_EQ(watched[1].watched_percent, 90);
    EXPECT_EQ(watched[1].user_id, "u1");
    EXPECT_EQ(watched[1].item_id, "42");

    const auto exact = NotificationDispatcher::map_actions(
        lifecycle("s1", SessionState::Playing, SessionState::Stopped, 255000, 300000), 85);
    EXPECT_EQ(exact.size(), 2u);

    const auto partial = NotificationDispatcher::map_actions(
        lifecycle("s1", SessionState::Playing, SessionState::Stopped, 120000, 300000), 85);
    ASSERT_EQ(partial.size(), 1u);
    EXPECT_EQ(partial[0].watched_percent, 40);
}

TEST(NotificationDispatcherTest, DeliversActionsInTransitionOrder) {
    NotificationDispatcher dispatcher(dispatcher_config());
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_handler(handler);
    dispatcher.start();

    dispatcher.enqueue(lifecycle("s1", SessionState::Starting, SessionState::Playing));
    dispatcher.enqueue(lifecycle("s1", SessionState::Playing, SessionState::Paused));
    dispatcher.enqueue(lifecycle("s1", SessionState::Paused, SessionState::Playing));
    dispatcher.enqueue(lifecycle("s1", SessionState::Playing, SessionState::Stopped, 270000, 300000));

    ASSERT_TRUE(dispatcher.wait_idle(5s));
    dispatcher.stop();

    EXPECT_EQ(handler->actions(), (std::vector<NotificationAction>{
        NotificationAction::OnStart, NotificationAction::OnPause, NotificationAction::OnResume,
        NotificationAction::OnStop, NotificationAction::OnWatched
    }));
    EXPECT_EQ(dispatcher.counters().delivered, 5u);
}

TEST(NotificationDispatcherTest, FullQueueDropsOldestWithoutBlocking) {
    NotificationDispatcher dispatcher(dispatcher_config(2));
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_handler(handler);

    // No consumer yet, so the queue fills up
    EXPECT_TRUE(dispatcher.enqueue(lifecycle("a", SessionState::Starting, SessionState::Playing)));
    EXPECT_TRUE(dispatcher.enqueue(lifecycle("b", SessionState::Starting, SessionState::Playing)));
    EXPECT_FALSE(dispatcher.enqueue(lifecycle("c", SessionState::Starting, SessionState::Playing)));
    EXPECT_FALSE(dispatcher.enqueue(lifecycle("d", SessionState::Starting, SessionState::Playing)));

    const auto counters = dispatcher.counters();
    EXPECT_EQ(counters.enqueued, 4u);
    EXPECT_EQ(counters.dropped, 2u);
    EXPECT_EQ(dispatcher.queue_size(), 2u);

    dispatcher.start();
    ASSERT_TRUE(dispatcher.wait_idle(5s));
    dispatcher.stop();

    const auto received = handler->received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].session_key.get(), "c");
    EXPECT_EQ(received[1].session_key.get(), "d");
}

TEST(NotificationDispatcherTest, WaitIdleCoversEverythingKeptAfterConcurrentOverflow) {
    NotificationDispatcher dispatcher(dispatcher_config(8));
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_handler(handler);
    {
        std::vector<std::jthread> producers;
        for (int p = 0; p < 4; ++p) {
            producers.emplace_back([&dispatcher, p] {
                for (int i = 0; i < 100; ++i) {
                    dispatcher.enqueue(lifecycle("p" + std::to_string(p) + "-" + std::to_string(i),
                                                 SessionState::Starting, SessionState::Playing));
                }
            });
        }
    }
    ASSERT_EQ(dispatcher.queue_size(), 8u);
    EXPECT_EQ(dispatcher.counters().dropped, 392u);

    dispatcher.start();
    ASSERT_TRUE(dispatcher.wait_idle(5s));
    EXPECT_EQ(handler->received().size(), 8u);
    dispatcher.stop();
}

TEST(NotificationDispatcherTest, FailingHandlerDoesNotAffectOthers) {
    NotificationDispatcher dispatcher(dispatcher_config(64, 1));
    auto broken = std::make_shared<RecordingHandler>("broken");
    broken->throw_next(100);
    auto healthy = std::make_shared<RecordingHandler>("healthy");
    dispatcher.add_handler(broken);
    dispatcher.add_handler(healthy);
    dispatcher.start();

    dispatcher.enqueue(lifecycle("s1", SessionState::Starting, SessionState::Playing));
    dispatcher.enqueue(lifecycle("s1", SessionState::Playing, SessionState::Stopped));
    ASSERT_TRUE(dispatcher.wait_idle(5s));
    dispatcher.stop();

    EXPECT_EQ(healthy->received().size(), 2u);
    EXPECT_EQ(broken->calls(), 4);
    EXPECT_EQ(dispatcher.counters().failed, 2u);
    EXPECT_EQ(dispatcher.counters().delivered, 2u);
}

TEST(NotificationDispatcherTest, FailedDeliveryIsRetried) {
    NotificationDispatcher dispatcher(dispatcher_config(64, 2));
    auto flaky = std::make_shared<RecordingHandler>();
    flaky->fail_next(2);
    dispatcher.add_handler(flaky);
    dispatcher.start();

    dispatcher.enqueue(lifecycle("s1", SessionState::Starting, SessionState::Playing));
    ASSERT_TRUE(dispatcher.wait_idle(5s));
    dispatcher.stop();

    EXPECT_EQ(flaky->calls(), 3);
    EXPECT_EQ(flaky->received().size(), 1u);
    EXPECT_EQ(dispatcher.counters().failed, 0u);
}

TEST(NotificationDispatcherTest, StopDeliversBacklog) {
    NotificationDispatcher dispatcher(dispatcher_config());
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_handler(handler);
    dispatcher.start();

    for (int i = 0; i < 20; ++i) {
        dispatcher.enqueue(lifecycle("s" + std::to_string(i), SessionState::Starting, SessionState::Playing));
    }
    dispatcher.stop();

    EXPECT_EQ(handler->received().size(), 20u);
    EXPECT_FALSE(dispatcher.is_running());
}

TEST(NotificationDispatcherTest, ConfigChangeAppliesThreshold) {
    NotificationDispatcher dispatcher(dispatcher_config());
    auto handler = std::make_shared<RecordingHandler>();
    dispatcher.add_handler(handler);

    auto config = dispatcher_config();
    config.watched_threshold_percent = 30;
    dispatcher.set_config(config);
    dispatcher.start();

    dispatcher.enqueue(lifecycle("s1", SessionState::Playing, SessionState::Stopped, 120000, 300000));
    ASSERT_TRUE(dispatcher.wait_idle(5s));
    dispatcher.stop();

    EXPECT_EQ(handler->actions(), (std::vector<NotificationAction>{
        NotificationAction::OnStop, NotificationAction::OnWatched
    }));
}

TEST(WebhookNotificationHandlerTest, PostsNotificationAsJson) {
    auto client = std::make_shared<MockHttpClient>();
    std::string body;
    EXPECT_CALL(*client, post_json("http://hooks.local/playback", _, _))
        .WillOnce(DoAll(SaveArg<1>(&body), Return(test_support::http_response(204))));

    services::WebhookNotificationHandler handler(client, "http://hooks.local/playback");
    auto notifications = NotificationDispatcher::map_actions(
        lifecycle("s1", SessionState::Playing, SessionState::Stopped, 270000, 300000), 85);

    ASSERT_TRUE(handler.handle(notifications[0]));

    const auto json = nlohmann::json::parse(body);
    EXPECT_EQ(json["action"], "on_stop");
    EXPECT_EQ(json["session_key"], "s1");
    EXPECT_EQ(json["user_id"], "u1");
    EXPECT_EQ(json["item_id"], "42");
    EXPECT_EQ(json["state"], "stopped");
    EXPECT_EQ(json["position_ms"], 270000);
    EXPECT_EQ(json["watched_percent"], 90);
    EXPECT_EQ(json["timestamp"], 1'700'000'000'000);
}

TEST(WebhookNotificationHandlerTest, ErrorStatusIsRejected) {
    auto client = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*client, post_json(_, _, _)).WillOnce(Return(test_support::http_response(500)));

    services::WebhookNotificationHandler handler(client, "http://hooks.local/playback");
    auto result = handler.handle(core::Notification{});

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), services::DeliveryError::Rejected);
}

TEST(WebhookNotificationHandlerTest, TransportFailureIsUnreachable) {
    auto client = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*client, post_json(_, _, _))
        .WillOnce(Return(std::unexpected(services::NetworkError::ConnectionFailed)));

    services::WebhookNotificationHandler handler(client, "http://hooks.local/playback");
    auto result = handler.handle(core::Notification{});

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), services::DeliveryError::Unreachable);
}

TEST(LogNotificationHandlerTest, WritesOneLinePerAction) {
    test_support::ScopedLogCapture logs;
    services::LogNotificationHandler handler;
    auto notifications = NotificationDispatcher::map_actions(
        lifecycle("s1", SessionState::Playing, SessionState::Stopped, 270000, 300000), 85);

    for (const auto& notification : notifications) {
        ASSERT_TRUE(handler.handle(notification));
    }

    EXPECT_EQ(logs.count("on_stop s1 user=alice"), 1u);
    EXPECT_EQ(logs.count("on_watched s1"), 1u);
    EXPECT_EQ(logs.count("watched=90%"), 2u);
}

TEST(CallbackNotificationHandlerTest, ForwardsToCallback) {
    int calls = 0;
    services::CallbackNotificationHandler handler("counter",
        [&calls](const core::Notification&) -> std::expected<void, services::DeliveryError> {
            ++calls;
            return {};
        });

    EXPECT_EQ(handler.name(), "counter");
    EXPECT_TRUE(handler.handle(core::Notification{}));
    EXPECT_EQ(calls, 1);
}
