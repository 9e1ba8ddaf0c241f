#include "notify/ChangeNotifier.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <iterator>
#include <utility>

namespace livestate::notify {

ChangeNotifier::ChangeNotifier(NotifierOptions options) : options_(options) {}

ChangeNotifier::Shard& ChangeNotifier::shard_for(const std::string& resource) const {
    return shards_[std::hash<std::string>{}(resource) % kShards];
}

std::shared_ptr<ChangeNotifier::Topic> ChangeNotifier::find_topic(const std::string& resource) const {
    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.topics.find(resource);
    return it == shard.topics.end() ? nullptr : it->second;
}

Revision ChangeNotifier::recall_locked(const Shard& shard, const std::string& resource) {
    auto it = shard.recent_index.find(resource);
    return it == shard.recent_index.end() ? 0 : it->second->second;
}

void ChangeNotifier::remember_locked(Shard& shard, const std::string& resource, Revision revision) {
    auto it = shard.recent_index.find(resource);
    if (it != shard.recent_index.end()) {
        it->second->second = revision;
        shard.recent.splice(shard.recent.begin(), shard.recent, it->second);
        return;
    }

    shard.recent.emplace_front(resource, revision);
    shard.recent_index.emplace(resource, shard.recent.begin());
    while (shard.recent.size() > kRecentPerShard) {
        shard.recent_index.erase(shard.recent.back().first);
        shard.recent.pop_back();
    }
}

// Caller holds the shard lock, the topic lock and its own reference to the
// topic. Held revisions have nobody left to go to; they only advance the
// remembered revision.
void ChangeNotifier::retire_locked(Shard& shard, const std::string& resource, Topic& topic) {
    Revision last = topic.last_revision;
    if (!topic.held.empty()) last = std::max(last, topic.held.rbegin()->first);
    topic.held.clear();
    topic.retired = true;

    remember_locked(shard, resource, last);
    shard.topics.erase(resource);
}

void ChangeNotifier::collect(const std::string& resource) {
    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.topics.find(resource);
    if (it == shard.topics.end()) return;

    auto t = it->second;
    std::lock_guard<std::mutex> tlk(t->mu);
    if (t->subscribers.empty()) retire_locked(shard, resource, *t);
}

std::shared_ptr<Subscription> ChangeNotifier::subscribe(const std::string& resource) {
    auto sub = std::make_shared<Subscription>(resource, options_.subscriber_buffer);

    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto t = shard.topics[resource];
    if (!t) {
        t = std::make_shared<Topic>();
        t->last_revision = recall_locked(shard, resource);
        shard.topics[resource] = t;
    }

    std::lock_guard<std::mutex> tlk(t->mu);
    t->subscribers.push_back(sub);
    return sub;
}

void ChangeNotifier::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
    if (!subscription) return;

    // Close first: anything still racing into the buffer is refused.
    const bool was_active = subscription->close(SubscriptionState::Unsubscribed);

    const std::string& resource = subscription->resource();
    {
        Shard& shard = shard_for(resource);
        std::lock_guard<std::mutex> lk(shard.mu);
        auto it = shard.topics.find(resource);
        if (it != shard.topics.end()) {
            auto t = it->second;
            std::lock_guard<std::mutex> tlk(t->mu);
            auto& subs = t->subscribers;
            subs.erase(std::remove(subs.begin(), subs.end(), subscription), subs.end());
            if (subs.empty()) retire_locked(shard, resource, *t);
        }
    }

    if (was_active) subscription->signal();
}

ChangeEventPtr ChangeNotifier::publish(const std::string& resource, boost::json::value payload) {
    const auto committed_at = ChangeEvent::Clock::now();
    for (;;) {
        std::shared_ptr<Topic> t;
        {
            Shard& shard = shard_for(resource);
            std::lock_guard<std::mutex> lk(shard.mu);
            auto it = shard.topics.find(resource);
            if (it == shard.topics.end()) {
                const Revision revision = recall_locked(shard, resource) + 1;
                remember_locked(shard, resource, revision);
                return make_event(resource, revision, std::move(payload), committed_at);
            }
            t = it->second;
        }

        Woken woken;
        ChangeEventPtr ev;
        bool idle = false;
        {
            std::lock_guard<std::mutex> lk(t->mu);
            if (t->retired) continue;
            ev = publish_locked(*t, resource, t->last_revision + 1, std::move(payload), committed_at, woken);
            release_ready_locked(*t, resource, woken);
            idle = t->subscribers.empty();
        }
        for (auto& sub : woken) sub->signal();
        if (idle) collect(resource);
        return ev;
    }
}

ChangeEventPtr ChangeNotifier::publish(const std::string& resource, Revision revision,
                                       boost::json::value payload) {
    return publish(resource, revision, std::move(payload), ChangeEvent::Clock::now());
}

ChangeEventPtr ChangeNotifier::publish(const std::string& resource, Revision revision,
                                       boost::json::value payload,
                                       ChangeEvent::Clock::time_point committed_at) {
    for (;;) {
        std::shared_ptr<Topic> t;
        {
            Shard& shard = shard_for(resource);
            std::lock_guard<std::mutex> lk(shard.mu);
            auto it = shard.topics.find(resource);
            if (it == shard.topics.end()) {
                // Nobody listens; only the revision is worth keeping.
                const Revision last = recall_locked(shard, resource);
                if (revision <= last) {
                    ++stale_;
                    return nullptr;
                }
                remember_locked(shard, resource, revision);
                return make_event(resource, revision, std::move(payload), committed_at);
            }
            t = it->second;
        }

        Woken woken;
        ChangeEventPtr ev;
        bool idle = false;
        {
            std::lock_guard<std::mutex> lk(t->mu);
            if (t->retired) continue;

            if (revision <= t->last_revision || t->held.count(revision) != 0) {
                ++stale_;
                spdlog::debug("[ChangeNotifier] {} revision {} not newer than {}, dropped",
                              resource, revision, t->last_revision);
                return nullptr;
            }

            const auto now = SteadyClock::now();
            if (options_.reorder_window.count() <= 0 || revision == t->last_revision + 1) {
                ev = publish_locked(*t, resource, revision, std::move(payload), committed_at, woken);
                release_ready_locked(*t, resource, woken);
            } else {
                if (t->held.empty()) t->gap_deadline = now + options_.reorder_window;
                t->held.emplace(revision, Held{std::move(payload), committed_at});
                ++held_;
                spdlog::debug("[ChangeNotifier] {} revision {} held, waiting for {}",
                              resource, revision, t->last_revision + 1);
                if (t->held.size() > kMaxHeld) t->gap_deadline = now;
            }
            release_expired_locked(*t, resource, now, woken);
            idle = t->subscribers.empty();
        }
        for (auto& sub : woken) sub->signal();
        if (idle) collect(resource);
        return ev;
    }
}

std::size_t ChangeNotifier::flush_expired(SteadyClock::time_point now) {
    std::size_t released = 0;
    Woken woken;

    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lk(shard.mu);
        for (auto it = shard.topics.begin(); it != shard.topics.end();) {
            auto t = it->second;
            const std::string resource = it->first;
            ++it;

            std::lock_guard<std::mutex> tlk(t->mu);
            if (!t->held.empty()) released += release_expired_locked(*t, resource, now, woken);
            if (t->subscribers.empty()) retire_locked(shard, resource, *t);
        }
    }

    for (auto& sub : woken) sub->signal();
    return released;
}

ChangeEventPtr ChangeNotifier::make_event(const std::string& resource, Revision revision,
                                          boost::json::value payload,
                                          ChangeEvent::Clock::time_point committed_at) {
    auto ev = std::make_shared<ChangeEvent>();
    ev->resource = resource;
    ev->revision = revision;
    ev->payload = std::move(payload);
    ev->timestamp = committed_at;
    ++published_;
    return ev;
}

// Runs under the topic lock, so events of one resource are offered to every
// subscriber in revision order even with concurrent publishers.
ChangeEventPtr ChangeNotifier::publish_locked(Topic& topic, const std::string& resource, Revision revision,
                                              boost::json::value payload,
                                              ChangeEvent::Clock::time_point committed_at,
                                              Woken& woken) {
    topic.last_revision = revision;
    ChangeEventPtr shared = make_event(resource, revision, std::move(payload), committed_at);

    woken.reserve(woken.size() + topic.subscribers.size());

    auto& subs = topic.subscribers;
    for (auto it = subs.begin(); it != subs.end();) {
        const auto& sub = *it;
        switch (sub->offer(shared)) {
            case Subscription::Offer::Queued:
                ++delivered_;
                woken.push_back(sub);
                ++it;
                break;
            case Subscription::Offer::Overflow:
                ++overflowed_;
                spdlog::warn("[ChangeNotifier] subscriber of {} overflowed ({} buffered), disconnecting",
                             resource, sub->capacity());
                sub->close(SubscriptionState::Disconnected);
                woken.push_back(sub);
                it = subs.erase(it);
                break;
            case Subscription::Offer::Closed:
                it = subs.erase(it);
                break;
        }
    }
    return shared;
}

void ChangeNotifier::release_ready_locked(Topic& topic, const std::string& resource, Woken& woken) {
    auto& held = topic.held;
    while (!held.empty()) {
        auto next = held.begin();
        if (next->first <= topic.last_revision) {
            held.erase(next);
            continue;
        }
        if (next->first != topic.last_revision + 1) break;

        const Revision revision = next->first;
        Held entry = std::move(next->second);
        held.erase(next);
        publish_locked(topic, resource, revision, std::move(entry.payload), entry.committed_at, woken);
    }
}

std::size_t ChangeNotifier::release_expired_locked(Topic& topic, const std::string& resource,
                                                   SteadyClock::time_point now, Woken& woken) {
    std::size_t released = 0;
    while (!topic.held.empty() && topic.gap_deadline <= now) {
        auto first = topic.held.begin();
        const Revision revision = first->first;
        Held entry = std::move(first->second);
        topic.held.erase(first);

        ++gaps_;
        spdlog::debug("[ChangeNotifier] {} gave up waiting for {}, resuming at {}",
                      resource, topic.last_revision + 1, revision);
        publish_locked(topic, resource, revision, std::move(entry.payload), entry.committed_at, woken);
        ++released;

        const std::size_t before = topic.held.size();
        release_ready_locked(topic, resource, woken);
        released += before - topic.held.size();

        if (!topic.held.empty()) topic.gap_deadline = now + options_.reorder_window;
    }
    return released;
}

Revision ChangeNotifier::last_revision(const std::string& resource) const {
    Shard& shard = shard_for(resource);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.topics.find(resource);
    if (it == shard.topics.end()) return recall_locked(shard, resource);
    std::lock_guard<std::mutex> tlk(it->second->mu);
    return it->second->last_revision;
}

std::size_t ChangeNotifier::subscriber_count(const std::string& resource) const {
    auto t = find_topic(resource);
    if (!t) return 0;
    std::lock_guard<std::mutex> lk(t->mu);
    return t->subscribers.size();
}

std::size_t ChangeNotifier::held_count(const std::string& resource) const {
    auto t = find_topic(resource);
    if (!t) return 0;
    std::lock_guard<std::mutex> lk(t->mu);
    return t->held.size();
}

std::size_t ChangeNotifier::topic_count() const {
    std::size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lk(shard.mu);
        n += shard.topics.size();
    }
    return n;
}

ChangeNotifier::Stats ChangeNotifier::stats() const {
    Stats s;
    s.published = published_.load();
    s.stale = stale_.load();
    s.delivered = delivered_.load();
    s.overflowed = overflowed_.load();
    s.held = held_.load();
    s.gaps = gaps_.load();
    return s;
}

} // namespace livestate::notify
