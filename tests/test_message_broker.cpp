#include "message_broker.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <thread>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

constexpr std::chrono::milliseconds wait_time{2000};

} // namespace

TEST(topic_matches, exact_and_wildcards) {
    using conductor::topic_matches;

    EXPECT_TRUE(topic_matches("report/ready", "report/ready"));
    EXPECT_FALSE(topic_matches("report/ready", "report/ready/now"));
    EXPECT_TRUE(topic_matches("agent/*/status", "agent/scan/status"));
    EXPECT_FALSE(topic_matches("agent/*/status", "agent/scan/result"));
    EXPECT_FALSE(topic_matches("agent/*", "agent"));
    EXPECT_TRUE(topic_matches("run/>", "run/run-1/status"));
    EXPECT_FALSE(topic_matches("run/>", "run"));
    EXPECT_TRUE(topic_matches(">", "anything/at/all"));
}

TEST(message_broker, broadcast_reaches_matching_subscribers) {
    conductor::message_broker broker(make_log());

    auto a = broker.subscribe("status");
    auto b = broker.subscribe("other");

    broker.publish("status", {{"state", "ok"}}, "clone");

    auto m = a->next_for(wait_time);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->topic, "status");
    EXPECT_EQ(m->sender, "clone");
    EXPECT_FALSE(m->recipient.has_value());
    EXPECT_EQ(m->payload["state"], "ok");
    EXPECT_GT(m->id, 0u);

    EXPECT_FALSE(b->try_next().has_value());
}

TEST(message_broker, messages_from_one_sender_arrive_in_order) {
    conductor::message_broker broker(make_log());
    auto sub = broker.subscribe("seq");

    for (int i = 0; i < 100; ++i) broker.publish("seq", i, "s");

    for (int i = 0; i < 100; ++i) {
        auto m = sub->next_for(wait_time);
        ASSERT_TRUE(m.has_value());
        EXPECT_EQ(m->payload, i);
    }
}

TEST(message_broker, sender_order_holds_across_publishing_threads) {
    conductor::message_broker broker(make_log());
    auto sub = broker.subscribe("repo/cloned");

    // Same sender identity, two worker threads, publishes strictly sequenced
    std::thread first([&] { broker.publish("repo/cloned", "m1", "clone"); });
    first.join();
    std::thread second([&] { broker.publish("repo/cloned", "m2", "clone"); });
    second.join();

    auto a = sub->next_for(wait_time);
    auto b = sub->next_for(wait_time);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->payload, "m1");
    EXPECT_EQ(b->payload, "m2");
}

TEST(message_broker, point_to_point_reaches_only_recipient) {
    conductor::message_broker broker(make_log());

    auto scan = broker.subscribe("scan", std::vector<std::string>{});
    auto report = broker.subscribe("report", std::vector<std::string>{"hint"});

    broker.publish("hint", "for scan", "clone", std::string("scan"));

    auto m = scan->next_for(wait_time);
    ASSERT_TRUE(m.has_value());
    ASSERT_TRUE(m->recipient.has_value());
    EXPECT_EQ(*m->recipient, "scan");
    EXPECT_EQ(m->payload, "for scan");

    // "report" listens to the topic but the message was addressed to "scan"
    EXPECT_FALSE(report->try_next().has_value());
}

TEST(message_broker, point_to_point_without_subscriber_is_dropped) {
    conductor::message_broker broker(make_log());

    EXPECT_NO_THROW(broker.publish("hint", 1, "clone", std::string("nobody")));

    auto s = broker.get_stats();
    EXPECT_EQ(s.published, 1u);
    EXPECT_EQ(s.delivered, 0u);
    EXPECT_EQ(s.dropped, 1u);
}

TEST(message_broker, subscribe_key_acts_as_name_and_topic) {
    conductor::message_broker broker(make_log());
    auto sub = broker.subscribe("report");

    broker.publish("report", 1, "x");
    broker.publish("other", 2, "x", std::string("report"));

    auto first = sub->next_for(wait_time);
    auto second = sub->next_for(wait_time);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->payload, 1);
    EXPECT_EQ(second->payload, 2);
}

TEST(message_broker, each_subscription_gets_one_copy) {
    conductor::message_broker broker(make_log());
    auto sub = broker.subscribe("me", std::vector<std::string>{"agent/>", "agent/*/status"});

    broker.publish("agent/scan/status", 1, "orchestrator");

    EXPECT_TRUE(sub->next_for(wait_time).has_value());
    EXPECT_FALSE(sub->try_next().has_value());
    EXPECT_EQ(broker.get_stats().delivered, 1u);
}

TEST(message_broker, cancelled_subscription_receives_nothing) {
    conductor::message_broker broker(make_log());
    auto sub = broker.subscribe("t");

    sub->cancel();
    broker.publish("t", 1, "s");

    EXPECT_FALSE(sub->try_next().has_value());
    EXPECT_EQ(broker.get_stats().subscriptions, 0u);
}

TEST(message_broker, history_filters) {
    conductor::message_broker broker(make_log());

    broker.publish("agent/clone/status", 1, "orchestrator");
    broker.publish("hint", 2, "clone", std::string("scan"));
    broker.publish("report/ready", 3, "report");

    EXPECT_EQ(broker.history().size(), 3u);

    conductor::message_filter by_sender;
    by_sender.sender = "clone";
    auto h = broker.history(by_sender);
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h[0].payload, 2);

    conductor::message_filter by_recipient;
    by_recipient.recipient = "scan";
    EXPECT_EQ(broker.history(by_recipient).size(), 1u);

    conductor::message_filter by_topic;
    by_topic.topic = "agent/>";
    EXPECT_EQ(broker.history(by_topic).size(), 1u);
}

TEST(message_broker, history_is_bounded) {
    conductor::message_broker broker(make_log(), 3);
    for (int i = 0; i < 10; ++i) broker.publish("t", i, "s");

    auto h = broker.history();
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.front().payload, 7);
    EXPECT_EQ(h.back().payload, 9);
}

TEST(message_broker, shutdown_cancels_and_rejects) {
    conductor::message_broker broker(make_log());
    auto sub = broker.subscribe("t");

    std::thread waiter([sub] { EXPECT_FALSE(sub->next().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    broker.shutdown();
    waiter.join();

    EXPECT_TRUE(broker.is_shut_down());
    EXPECT_TRUE(sub->cancelled());
    EXPECT_THROW(broker.publish("t", 1, "s"), conductor::broker_shutdown_error);
    EXPECT_THROW(broker.subscribe("t"), conductor::broker_shutdown_error);
}
