#pragma once

#include "notify/ChangeEvent.h"
#include "notify/Subscription.h"

#include <boost/json/value.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace livestate::notify {

struct NotifierOptions {
    std::size_t subscriber_buffer = 256;

    // How long a store revision that arrives ahead of its predecessor is
    // held back before the gap is accepted. 0 publishes immediately.
    std::chrono::milliseconds reorder_window{200};
};

// Turns committed writes into ordered per-resource event streams.
//
// Each resource ("topic") has its own mutex, last revision and subscriber
// list; publishers and subscribers of different resources never contend on
// the same lock. Publishing never blocks on a consumer: a subscriber whose
// buffer is full is removed and marked Disconnected.
//
// A topic only lives while it has subscribers. The last revision of a
// retired topic is kept in a small per-shard LRU so stale drops still work
// when the resource is subscribed again.
class ChangeNotifier {
public:
    using SteadyClock = std::chrono::steady_clock;

    struct Stats {
        std::uint64_t published = 0;
        std::uint64_t stale = 0;
        std::uint64_t delivered = 0;
        std::uint64_t overflowed = 0;
        std::uint64_t held = 0;
        std::uint64_t gaps = 0;
    };

    explicit ChangeNotifier(NotifierOptions options = {});

    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    std::shared_ptr<Subscription> subscribe(const std::string& resource);

    // Idempotent. Buffered, undelivered events are discarded.
    void unsubscribe(const std::shared_ptr<Subscription>& subscription);

    // Publishes with the next revision of `resource`.
    ChangeEventPtr publish(const std::string& resource, boost::json::value payload);

    // Publishes with a revision assigned by the store, stamped with the
    // time the store committed it.
    //
    // A revision that is not newer than the last one seen is dropped. One
    // that skips ahead is held until its predecessors arrive or the reorder
    // window runs out. Returns nullptr unless `revision` went out now.
    ChangeEventPtr publish(const std::string& resource, Revision revision, boost::json::value payload,
                           ChangeEvent::Clock::time_point committed_at);
    ChangeEventPtr publish(const std::string& resource, Revision revision, boost::json::value payload);

    // Releases held revisions whose reorder window ended before `now`,
    // accepting the gap. Returns the number of events published.
    std::size_t flush_expired(SteadyClock::time_point now = SteadyClock::now());

    Revision last_revision(const std::string& resource) const;
    std::size_t subscriber_count(const std::string& resource) const;
    std::size_t held_count(const std::string& resource) const;
    std::size_t topic_count() const;

    const NotifierOptions& options() const noexcept { return options_; }

    Stats stats() const;

private:
    struct Held {
        boost::json::value payload;
        ChangeEvent::Clock::time_point committed_at;
    };

    struct Topic {
        std::mutex mu;
        Revision last_revision = 0;
        std::vector<std::shared_ptr<Subscription>> subscribers;

        std::map<Revision, Held> held;
        SteadyClock::time_point gap_deadline{};

        // Set once the topic left its shard; publishers must look it up again.
        bool retired = false;
    };

    using Woken = std::vector<std::shared_ptr<Subscription>>;

    struct Shard {
        mutable std::mutex mu;
        std::unordered_map<std::string, std::shared_ptr<Topic>> topics;

        // Last revisions of retired or never-subscribed topics, newest first.
        std::list<std::pair<std::string, Revision>> recent;
        std::unordered_map<std::string, std::list<std::pair<std::string, Revision>>::iterator> recent_index;
    };

    static constexpr std::size_t kShards = 64;
    static constexpr std::size_t kRecentPerShard = 512;
    static constexpr std::size_t kMaxHeld = 1024;

    Shard& shard_for(const std::string& resource) const;
    std::shared_ptr<Topic> find_topic(const std::string& resource) const;

    static Revision recall_locked(const Shard& shard, const std::string& resource);
    static void remember_locked(Shard& shard, const std::string& resource, Revision revision);
    static void retire_locked(Shard& shard, const std::string& resource, Topic& topic);

    // Retires `resource` if its topic has no subscribers left.
    void collect(const std::string& resource);

    ChangeEventPtr make_event(const std::string& resource, Revision revision, boost::json::value payload,
                              ChangeEvent::Clock::time_point committed_at);

    ChangeEventPtr publish_locked(Topic& topic, const std::string& resource, Revision revision,
                                  boost::json::value payload, ChangeEvent::Clock::time_point committed_at,
                                  Woken& woken);
    void release_ready_locked(Topic& topic, const std::string& resource, Woken& woken);
    std::size_t release_expired_locked(Topic& topic, const std::string& resource,
                                       SteadyClock::time_point now, Woken& woken);

    NotifierOptions options_;
    mutable std::array<Shard, kShards> shards_;

    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> stale_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> overflowed_{0};
    std::atomic<std::uint64_t> held_{0};
    std::atomic<std::uint64_t> gaps_{0};
};

} // namespace livestate::notify
