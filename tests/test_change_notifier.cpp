#include "notify/ChangeNotifier.h"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace json = boost::json;
using namespace livestate::notify;
using namespace std::chrono_literals;

namespace {

std::vector<Revision> drain(Subscription& sub) {
    std::vector<Revision> out;
    while (auto ev = sub.try_next()) out.push_back(ev->revision);
    return out;
}

} // namespace

TEST(ChangeNotifierTest, SubscriberSeesRevisionsInOrder) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("cart-42");

    for (int i = 0; i < 5; ++i) notifier.publish("cart-42", json::object{{"n", i}});

    EXPECT_EQ(drain(*sub), (std::vector<Revision>{1, 2, 3, 4, 5}));
    EXPECT_EQ(notifier.last_revision("cart-42"), 5u);
}

TEST(ChangeNotifierTest, OnlyMatchingResourceIsDelivered) {
    ChangeNotifier notifier;
    auto a = notifier.subscribe("a");
    auto b = notifier.subscribe("b");

    notifier.publish("a", json::object{});
    notifier.publish("a", json::object{});
    notifier.publish("b", json::object{});

    EXPECT_EQ(a->buffered(), 2u);
    EXPECT_EQ(b->buffered(), 1u);
    auto ev = b->try_next();
    ASSERT_TRUE(ev);
    EXPECT_EQ(ev->resource, "b");
}

TEST(ChangeNotifierTest, SubscribersShareTheSameEvent) {
    ChangeNotifier notifier;
    auto s1 = notifier.subscribe("a");
    auto s2 = notifier.subscribe("a");

    auto published = notifier.publish("a", json::object{{"k", "v"}});
    ASSERT_TRUE(published);
    EXPECT_EQ(s1->try_next().get(), published.get());
    EXPECT_EQ(s2->try_next().get(), published.get());
}

TEST(ChangeNotifierTest, NoReplayForLateSubscribers) {
    ChangeNotifier notifier;
    notifier.publish("a", json::object{});
    auto sub = notifier.subscribe("a");
    EXPECT_EQ(sub->try_next(), nullptr);

    notifier.publish("a", json::object{});
    EXPECT_EQ(drain(*sub), (std::vector<Revision>{2}));
}

TEST(ChangeNotifierTest, StoreRevisionsDropStaleAndDuplicates) {
    ChangeNotifier notifier(NotifierOptions{256, 0ms});
    auto sub = notifier.subscribe("a");

    EXPECT_TRUE(notifier.publish("a", Revision{3}, json::object{}));
    EXPECT_FALSE(notifier.publish("a", Revision{3}, json::object{}));
    EXPECT_FALSE(notifier.publish("a", Revision{2}, json::object{}));
    EXPECT_TRUE(notifier.publish("a", Revision{5}, json::object{}));

    EXPECT_EQ(drain(*sub), (std::vector<Revision>{3, 5}));
    EXPECT_EQ(notifier.stats().stale, 2u);
}

TEST(ChangeNotifierTest, ConcurrentPublishersKeepPerResourceOrder) {
    ChangeNotifier notifier(NotifierOptions{100000});
    auto sub = notifier.subscribe("hot");

    constexpr int kThreads = 8;
    constexpr int kEach = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&notifier] {
            for (int i = 0; i < kEach; ++i) notifier.publish("hot", json::object{});
        });
    }
    for (auto& th : threads) th.join();

    std::vector<Revision> seen = drain(*sub);
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(kThreads * kEach));
    for (std::size_t i = 0; i < seen.size(); ++i) EXPECT_EQ(seen[i], i + 1);
}

TEST(ChangeNotifierTest, UnsubscribeIsIdempotent) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("a");
    EXPECT_EQ(notifier.subscriber_count("a"), 1u);

    notifier.unsubscribe(sub);
    EXPECT_EQ(sub->state(), SubscriptionState::Unsubscribed);
    EXPECT_EQ(notifier.subscriber_count("a"), 0u);

    notifier.unsubscribe(sub);
    notifier.unsubscribe(nullptr);
    EXPECT_EQ(sub->state(), SubscriptionState::Unsubscribed);
    EXPECT_EQ(notifier.subscriber_count("a"), 0u);
}

TEST(ChangeNotifierTest, NothingDeliveredAfterUnsubscribe) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("a");
    notifier.publish("a", json::object{});
    notifier.publish("a", json::object{});

    notifier.unsubscribe(sub);
    notifier.publish("a", json::object{});

    EXPECT_EQ(sub->buffered(), 0u);
    EXPECT_EQ(sub->try_next(), nullptr);
    EXPECT_EQ(sub->next(10ms), nullptr);
}

TEST(ChangeNotifierTest, OverflowDisconnectsOnlyTheSlowSubscriber) {
    ChangeNotifier notifier(NotifierOptions{4});
    auto slow = notifier.subscribe("a");
    auto fast = notifier.subscribe("a");

    int slow_wakeups = 0;
    slow->set_ready_handler([&slow_wakeups] { ++slow_wakeups; });

    for (int i = 0; i < 10; ++i) {
        notifier.publish("a", json::object{{"i", i}});
        while (fast->try_next()) {}
    }

    EXPECT_EQ(slow->state(), SubscriptionState::Disconnected);
    EXPECT_STREQ(to_string(slow->state()), "SubscriberDisconnected");
    EXPECT_EQ(slow->try_next(), nullptr);
    EXPECT_EQ(fast->state(), SubscriptionState::Active);
    EXPECT_EQ(notifier.subscriber_count("a"), 1u);
    EXPECT_EQ(notifier.stats().overflowed, 1u);
    EXPECT_EQ(slow_wakeups, 5);  // four queued events plus the disconnect
}

TEST(ChangeNotifierTest, BlockingNextWakesOnPublish) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("a");

    std::thread publisher([&notifier] {
        std::this_thread::sleep_for(20ms);
        notifier.publish("a", json::object{{"x", 1}});
    });
    auto ev = sub->next(5s);
    publisher.join();

    ASSERT_TRUE(ev);
    EXPECT_EQ(ev->revision, 1u);
}

TEST(ChangeNotifierTest, ReadyHandlerFiresForPendingEvents) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("a");
    notifier.publish("a", json::object{});

    std::atomic<int> calls{0};
    sub->set_ready_handler([&calls] { ++calls; });
    EXPECT_EQ(calls.load(), 1);

    notifier.publish("a", json::object{});
    EXPECT_EQ(calls.load(), 2);

    notifier.unsubscribe(sub);
    EXPECT_EQ(calls.load(), 3);
    notifier.unsubscribe(sub);
    EXPECT_EQ(calls.load(), 3);
}

TEST(ChangeNotifierTest, LateLowerRevisionIsDeliveredFirst) {
    ChangeNotifier notifier(NotifierOptions{256, 10s});
    auto sub = notifier.subscribe("cart-42");

    EXPECT_FALSE(notifier.publish("cart-42", Revision{2}, json::object{{"n", 2}}));
    EXPECT_EQ(notifier.held_count("cart-42"), 1u);
    EXPECT_EQ(sub->buffered(), 0u);

    auto first = notifier.publish("cart-42", Revision{1}, json::object{{"n", 1}});
    ASSERT_TRUE(first);
    EXPECT_EQ(first->revision, 1u);
    EXPECT_EQ(drain(*sub), (std::vector<Revision>{1, 2}));
    EXPECT_EQ(notifier.held_count("cart-42"), 0u);
    EXPECT_EQ(notifier.last_revision("cart-42"), 2u);
    EXPECT_EQ(notifier.stats().held, 1u);
    EXPECT_EQ(notifier.stats().gaps, 0u);
}

TEST(ChangeNotifierTest, GapIsAcceptedWhenTheWindowEnds) {
    ChangeNotifier notifier(NotifierOptions{256, 50ms});
    auto sub = notifier.subscribe("cart-42");
    notifier.publish("cart-42", Revision{1}, json::object{});

    notifier.publish("cart-42", Revision{4}, json::object{});
    notifier.publish("cart-42", Revision{3}, json::object{});
    EXPECT_EQ(drain(*sub), (std::vector<Revision>{1}));

    EXPECT_EQ(notifier.flush_expired(ChangeNotifier::SteadyClock::now()), 0u);
    EXPECT_EQ(notifier.flush_expired(ChangeNotifier::SteadyClock::now() + 1s), 2u);
    EXPECT_EQ(drain(*sub), (std::vector<Revision>{3, 4}));
    EXPECT_EQ(notifier.stats().gaps, 1u);

    // Revision 2 finally shows up: too late, it is stale now.
    EXPECT_FALSE(notifier.publish("cart-42", Revision{2}, json::object{}));
    EXPECT_EQ(sub->buffered(), 0u);
}

TEST(ChangeNotifierTest, EventCarriesTheCommitTime) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("a");
    const auto committed = ChangeEvent::Clock::time_point(std::chrono::milliseconds(1700000000123));

    notifier.publish("a", Revision{1}, json::object{}, committed);
    auto ev = sub->try_next();
    ASSERT_TRUE(ev);
    EXPECT_EQ(ev->timestamp, committed);
}

TEST(ChangeNotifierTest, TopicsWithoutSubscribersAreRetired) {
    ChangeNotifier notifier;
    for (int i = 0; i < 10000; ++i) {
        const std::string resource = "cart-" + std::to_string(i);
        auto sub = notifier.subscribe(resource);
        notifier.publish(resource, Revision{1}, json::object{});
        notifier.unsubscribe(sub);
    }
    EXPECT_EQ(notifier.topic_count(), 0u);

    // Publishing with nobody listening creates nothing either.
    for (int i = 0; i < 1000; ++i) notifier.publish("doc-" + std::to_string(i), json::object{});
    EXPECT_EQ(notifier.topic_count(), 0u);
}

TEST(ChangeNotifierTest, RetiredTopicStillDropsStaleRevisions) {
    ChangeNotifier notifier;
    auto sub = notifier.subscribe("a");
    notifier.publish("a", Revision{1}, json::object{});
    notifier.publish("a", Revision{2}, json::object{});
    notifier.unsubscribe(sub);
    EXPECT_EQ(notifier.topic_count(), 0u);
    EXPECT_EQ(notifier.last_revision("a"), 2u);

    auto again = notifier.subscribe("a");
    EXPECT_FALSE(notifier.publish("a", Revision{2}, json::object{}));
    EXPECT_TRUE(notifier.publish("a", Revision{3}, json::object{}));
    EXPECT_EQ(drain(*again), (std::vector<Revision>{3}));
}

TEST(ChangeNotifierTest, OverflowOfTheLastSubscriberRetiresTheTopic) {
    ChangeNotifier notifier(NotifierOptions{2});
    auto slow = notifier.subscribe("a");
    for (int i = 0; i < 3; ++i) notifier.publish("a", json::object{});

    EXPECT_EQ(slow->state(), SubscriptionState::Disconnected);
    EXPECT_EQ(notifier.topic_count(), 0u);
    EXPECT_EQ(notifier.last_revision("a"), 3u);
}
