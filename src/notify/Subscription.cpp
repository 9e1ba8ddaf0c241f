#include "notify/Subscription.h"

#include <utility>

namespace livestate::notify {

const char* to_string(SubscriptionState s) noexcept {
    switch (s) {
        case SubscriptionState::Active:       return "Active";
        case SubscriptionState::Unsubscribed: return "Unsubscribed";
        case SubscriptionState::Disconnected: return "SubscriberDisconnected";
    }
    return "unknown";
}

Subscription::Subscription(std::string resource, std::size_t capacity)
    : resource_(std::move(resource)), capacity_(capacity == 0 ? 1 : capacity) {}

SubscriptionState Subscription::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::size_t Subscription::buffered() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

ChangeEventPtr Subscription::try_next() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != SubscriptionState::Active || queue_.empty()) return nullptr;
    ChangeEventPtr ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

ChangeEventPtr Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return state_ != SubscriptionState::Active || !queue_.empty(); });
    if (state_ != SubscriptionState::Active || queue_.empty()) return nullptr;
    ChangeEventPtr ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

void Subscription::set_ready_handler(ReadyHandler handler) {
    bool pending = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        on_ready_ = std::move(handler);
        pending = !queue_.empty() || state_ != SubscriptionState::Active;
    }
    if (pending) signal();
}

Subscription::Offer Subscription::offer(const ChangeEventPtr& event) {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != SubscriptionState::Active) return Offer::Closed;
    if (queue_.size() >= capacity_) return Offer::Overflow;
    queue_.push_back(event);
    return Offer::Queued;
}

bool Subscription::close(SubscriptionState reason) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ != SubscriptionState::Active) return false;
        state_ = reason;
        queue_.clear();
    }
    cv_.notify_all();
    return true;
}

void Subscription::signal() {
    ReadyHandler handler;
    {
        std::lock_guard<std::mutex> lk(mu_);
        handler = on_ready_;
    }
    cv_.notify_all();
    if (handler) handler();
}

} // namespace livestate::notify
