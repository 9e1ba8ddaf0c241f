#include "store/MemoryStore.h"

#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace json = boost::json;
using namespace livestate::store;
using namespace std::chrono_literals;

TEST(MemoryStoreTest, GetMissingIsNotFound) {
    MemoryStore store;
    boost::system::error_code ec;
    store.get("cart-42", ec);
    EXPECT_EQ(ec, errc::not_found);
}

TEST(MemoryStoreTest, PutAssignsIncreasingRevisions) {
    MemoryStore store;
    boost::system::error_code ec;

    EXPECT_EQ(store.put("cart-42", json::object{{"items", 1}}, std::nullopt, ec).revision, 1u);
    ASSERT_FALSE(ec);
    EXPECT_EQ(store.put("cart-42", json::object{{"items", 2}}, std::nullopt, ec).revision, 2u);
    EXPECT_EQ(store.put("cart-7", json::object{{"items", 9}}, std::nullopt, ec).revision, 1u);

    StoredDocument doc = store.get("cart-42", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(doc.resource, "cart-42");
    EXPECT_EQ(doc.revision, 2u);
    EXPECT_EQ(doc.payload, (json::value(json::object{{"items", 2}})));
}

TEST(MemoryStoreTest, ExpectedRevisionMismatchConflicts) {
    MemoryStore store;
    boost::system::error_code ec;

    store.put("cart-42", json::object{{"items", 1}}, std::nullopt, ec);
    store.put("cart-42", json::object{{"items", 2}}, Revision{5}, ec);
    EXPECT_EQ(ec, errc::conflict);

    EXPECT_EQ(store.put("cart-42", json::object{{"items", 2}}, Revision{1}, ec).revision, 2u);
    EXPECT_FALSE(ec);
}

TEST(MemoryStoreTest, CreateOnlyConflictLeavesNoDocument) {
    MemoryStore store;
    boost::system::error_code ec;

    // expected 0: the document must not exist yet
    store.put("cart-42", json::object{}, Revision{3}, ec);
    EXPECT_EQ(ec, errc::conflict);
    store.get("cart-42", ec);
    EXPECT_EQ(ec, errc::not_found);

    EXPECT_EQ(store.put("cart-42", json::object{}, Revision{0}, ec).revision, 1u);
    EXPECT_FALSE(ec);
}

TEST(MemoryStoreTest, FaultInjection) {
    MemoryStore store;
    boost::system::error_code ec;

    store.fail_next(2);
    store.get("x", ec);
    EXPECT_EQ(ec, errc::unavailable);
    store.put("x", json::object{}, std::nullopt, ec);
    EXPECT_EQ(ec, errc::unavailable);
    store.put("x", json::object{}, std::nullopt, ec);
    EXPECT_FALSE(ec);

    store.set_available(false);
    store.get("x", ec);
    EXPECT_EQ(ec, errc::unavailable);
    store.set_available(true);
    store.get("x", ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(store.operations(), 5u);
}

TEST(MemoryStoreTest, ChangesFromPosition) {
    MemoryStore store;
    boost::system::error_code ec;
    store.put("a", json::object{{"n", 1}}, std::nullopt, ec);
    store.put("b", json::object{{"n", 1}}, std::nullopt, ec);
    store.put("a", json::object{{"n", 2}}, std::nullopt, ec);

    ChangeBatch all = store.changes("0", 0ms, ec);
    ASSERT_FALSE(ec);
    ASSERT_EQ(all.changes.size(), 3u);
    EXPECT_EQ(all.changes[0].resource, "a");
    EXPECT_EQ(all.changes[2].revision, 2u);
    EXPECT_EQ(all.last_sequence, "3");

    ChangeBatch tail = store.changes("2", 0ms, ec);
    ASSERT_EQ(tail.changes.size(), 1u);
    EXPECT_EQ(tail.changes[0].sequence, "3");
}

TEST(MemoryStoreTest, ChangesFromNowWaitsForNextWrite) {
    MemoryStore store;
    boost::system::error_code ec;
    store.put("a", json::object{{"n", 1}}, std::nullopt, ec);

    std::thread writer([&store] {
        std::this_thread::sleep_for(20ms);
        boost::system::error_code wec;
        store.put("a", json::object{{"n", 2}}, std::nullopt, wec);
    });

    ChangeBatch batch = store.changes("now", 5s, ec);
    writer.join();

    ASSERT_FALSE(ec);
    ASSERT_EQ(batch.changes.size(), 1u);
    EXPECT_EQ(batch.changes[0].revision, 2u);
}

TEST(MemoryStoreTest, ChangesTimesOutWithPosition) {
    MemoryStore store;
    boost::system::error_code ec;
    store.put("a", json::object{}, std::nullopt, ec);

    ChangeBatch batch = store.changes("now", 10ms, ec);
    EXPECT_FALSE(ec);
    EXPECT_TRUE(batch.changes.empty());
    EXPECT_EQ(batch.last_sequence, "1");
}

TEST(MemoryStoreTest, InterruptWakesLongPoll) {
    MemoryStore store;
    boost::system::error_code ec;

    std::thread waker([&store] {
        std::this_thread::sleep_for(20ms);
        store.interrupt();
    });

    auto started = std::chrono::steady_clock::now();
    ChangeBatch batch = store.changes("now", 10s, ec);
    waker.join();

    EXPECT_FALSE(ec);
    EXPECT_TRUE(batch.changes.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(MemoryStoreTest, ChangeLogIsBounded) {
    MemoryStore store(2);
    boost::system::error_code ec;
    for (int i = 0; i < 5; ++i) store.put("a", json::object{{"n", i}}, std::nullopt, ec);

    ChangeBatch batch = store.changes("0", 0ms, ec);
    ASSERT_EQ(batch.changes.size(), 2u);
    EXPECT_EQ(batch.changes.front().revision, 4u);
    EXPECT_EQ(batch.last_sequence, "5");
}

TEST(MemoryStoreTest, CommitTimeTravelsWithTheChange) {
    MemoryStore store;
    boost::system::error_code ec;

    const auto before = CommitClock::now();
    StoredDocument committed = store.put("a", json::object{}, std::nullopt, ec);
    ASSERT_FALSE(ec);
    EXPECT_GE(committed.committed_at, before);
    EXPECT_LE(committed.committed_at, CommitClock::now());

    EXPECT_EQ(store.get("a", ec).committed_at, committed.committed_at);

    ChangeBatch batch = store.changes("0", 0ms, ec);
    ASSERT_EQ(batch.changes.size(), 1u);
    EXPECT_EQ(batch.changes[0].committed_at, committed.committed_at);
}
