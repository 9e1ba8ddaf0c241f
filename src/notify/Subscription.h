#pragma once

#include "notify/ChangeEvent.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace livestate::notify {

enum class SubscriptionState {
    Active,
    Unsubscribed,
    Disconnected,  // buffer overflowed; the notifier dropped this subscriber
};

const char* to_string(SubscriptionState s) noexcept;

// Interest of one consumer in one resource, and the bounded buffer of events
// published for it. Consumed either by polling (try_next / next) or by
// registering a ready handler that is invoked whenever the buffer gains an
// event or the subscription stops being Active.
//
// Not seekable: after Unsubscribed/Disconnected it never yields again and the
// consumer has to subscribe anew.
class Subscription {
public:
    using ReadyHandler = std::function<void()>;

    Subscription(std::string resource, std::size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    const std::string& resource() const noexcept { return resource_; }
    std::size_t capacity() const noexcept { return capacity_; }

    SubscriptionState state() const;
    std::size_t buffered() const;

    // Returns nullptr when nothing is buffered or the subscription is closed.
    ChangeEventPtr try_next();

    // Blocks up to `timeout`; nullptr on timeout or close.
    ChangeEventPtr next(std::chrono::milliseconds timeout);

    // The handler runs on the publishing thread and must not block or call
    // back into the notifier; post the real work elsewhere.
    void set_ready_handler(ReadyHandler handler);

private:
    friend class ChangeNotifier;

    enum class Offer { Queued, Overflow, Closed };

    Offer offer(const ChangeEventPtr& event);
    // Returns false if it was already closed.
    bool close(SubscriptionState reason);
    void signal();

    const std::string resource_;
    const std::size_t capacity_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ChangeEventPtr> queue_;
    SubscriptionState state_ = SubscriptionState::Active;
    ReadyHandler on_ready_;
};

} // namespace livestate::notify
