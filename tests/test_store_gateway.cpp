#include "notify/ChangeNotifier.h"
#include "store/MemoryStore.h"
#include "store/StoreGateway.h"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace json = boost::json;
using namespace livestate::store;
using namespace std::chrono_literals;

namespace {

RetryPolicy fast_retry(int attempts = 3) {
    RetryPolicy p;
    p.attempts = attempts;
    p.base_delay = 1ms;
    p.max_delay = 4ms;
    return p;
}

} // namespace

TEST(RetryPolicyTest, BoundedExponentialDelays) {
    RetryPolicy p;
    EXPECT_EQ(p.delay_before(1), 0ms);
    EXPECT_EQ(p.delay_before(2), 50ms);
    EXPECT_EQ(p.delay_before(3), 100ms);
    EXPECT_EQ(p.delay_before(4), 200ms);
    EXPECT_EQ(p.delay_before(30), 1000ms);
}

TEST(StoreGatewayTest, WriteThenReadRoundTrip) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry());
    boost::system::error_code ec;

    json::value doc = json::parse(R"({"items":[{"sku":"A1","qty":2}],"total":19.5})");
    Revision rev = gateway.write("cart-42", doc, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(rev, 1u);

    StoredDocument got = gateway.read("cart-42", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(got.revision, rev);
    EXPECT_EQ(got.payload, doc);
}

TEST(StoreGatewayTest, ReadMissingIsNotFoundWithoutRetry) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry());
    boost::system::error_code ec;

    gateway.read("nope", ec);
    EXPECT_EQ(ec, errc::not_found);
    EXPECT_EQ(store.operations(), 1u);
}

TEST(StoreGatewayTest, RetriesTransientFailures) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry(3));
    boost::system::error_code ec;

    store.fail_next(2);
    Revision rev = gateway.write("cart-42", json::object{{"items", 1}}, ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(rev, 1u);
    EXPECT_EQ(store.operations(), 3u);
}

TEST(StoreGatewayTest, GivesUpAfterAttempts) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry(3));
    boost::system::error_code ec;

    store.set_available(false);
    gateway.write("cart-42", json::object{}, ec);
    EXPECT_EQ(ec, errc::unavailable);
    EXPECT_EQ(store.operations(), 3u);

    gateway.read("cart-42", ec);
    EXPECT_EQ(ec, errc::unavailable);
    EXPECT_EQ(store.operations(), 6u);
}

TEST(StoreGatewayTest, ConflictIsNotRetried) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry(3));
    boost::system::error_code ec;

    gateway.write("cart-42", json::object{{"v", 1}}, ec);
    gateway.write("cart-42", json::object{{"v", 2}}, Revision{7}, ec);
    EXPECT_EQ(ec, errc::conflict);
    EXPECT_EQ(store.operations(), 2u);

    StoredDocument got = gateway.read("cart-42", ec);
    EXPECT_EQ(got.revision, 1u);
}

TEST(StoreGatewayTest, WriteListenerSeesCommittedDocuments) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry());
    std::vector<StoredDocument> seen;
    gateway.set_write_listener([&seen](const StoredDocument& d) { seen.push_back(d); });

    boost::system::error_code ec;
    gateway.write("cart-42", json::object{{"v", 1}}, ec);
    gateway.write("cart-42", json::object{{"v", 2}}, Revision{9}, ec);  // conflict
    gateway.write("cart-42", json::object{{"v", 3}}, ec);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].revision, 1u);
    EXPECT_EQ(seen[1].revision, 2u);
    EXPECT_EQ(seen[1].payload, (json::value(json::object{{"v", 3}})));
}

TEST(StoreGatewayTest, ConcurrentWritersGetDistinctRevisions) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry());

    constexpr int kThreads = 8;
    constexpr int kWrites = 50;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&gateway, &failures, t] {
            for (int i = 0; i < kWrites; ++i) {
                boost::system::error_code ec;
                gateway.write("counter", json::object{{"writer", t}, {"i", i}}, ec);
                if (ec) ++failures;
            }
        });
    }
    for (auto& th : threads) th.join();

    boost::system::error_code ec;
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(gateway.read("counter", ec).revision, static_cast<Revision>(kThreads * kWrites));
}

// The listener of the first writer is still running when the second
// writer's commit is published.
TEST(StoreGatewayTest, SlowListenerDoesNotLoseTheEarlierRevision) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry());
    livestate::notify::ChangeNotifier notifier;
    auto sub = notifier.subscribe("cart-42");

    std::promise<void> first_committed;
    std::promise<void> second_published;
    std::shared_future<void> release = second_published.get_future().share();

    gateway.set_write_listener([&](const StoredDocument& d) {
        if (d.revision == 1) {
            first_committed.set_value();
            release.wait();
        }
        notifier.publish(d.resource, d.revision, d.payload, d.committed_at);
    });

    std::thread first([&gateway] {
        boost::system::error_code ec;
        gateway.write("cart-42", json::object{{"items", 1}}, ec);
        EXPECT_FALSE(ec);
    });
    first_committed.get_future().wait();

    boost::system::error_code ec;
    EXPECT_EQ(gateway.write("cart-42", json::object{{"items", 2}}, ec), 2u);
    second_published.set_value();
    first.join();

    std::vector<Revision> got;
    while (auto ev = sub->try_next()) got.push_back(ev->revision);
    EXPECT_EQ(got, (std::vector<Revision>{1, 2}));
}

TEST(StoreGatewayTest, ConcurrentWritersPublishEveryRevisionInOrder) {
    MemoryStore store;
    StoreGateway gateway(store, fast_retry());
    livestate::notify::ChangeNotifier notifier(livestate::notify::NotifierOptions{100000, 10s});
    auto sub = notifier.subscribe("counter");
    gateway.set_write_listener([&notifier](const StoredDocument& d) {
        notifier.publish(d.resource, d.revision, d.payload, d.committed_at);
    });

    constexpr int kThreads = 8;
    constexpr int kWrites = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&gateway, t] {
            for (int i = 0; i < kWrites; ++i) {
                boost::system::error_code ec;
                gateway.write("counter", json::object{{"writer", t}, {"i", i}}, ec);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::vector<Revision> got;
    while (auto ev = sub->try_next()) got.push_back(ev->revision);
    ASSERT_EQ(got.size(), static_cast<std::size_t>(kThreads * kWrites));
    for (std::size_t i = 0; i < got.size(); ++i) EXPECT_EQ(got[i], i + 1);
}
