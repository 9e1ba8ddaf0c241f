#pragma once

#include "notify/ChangeNotifier.h"
#include "store/StoreGateway.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace livestate::notify {

struct FeedOptions {
    std::chrono::milliseconds wait{10000};
    std::chrono::milliseconds min_backoff{100};
    std::chrono::milliseconds max_backoff{5000};
    std::string since = "now";
};

// Tails the store's change feed through the gateway and republishes every
// committed write into the notifier with its store revision.
class ChangeFeed {
public:
    ChangeFeed(store::StoreGateway& gateway, ChangeNotifier& notifier, FeedOptions options = {});
    ~ChangeFeed();

    ChangeFeed(const ChangeFeed&) = delete;
    ChangeFeed& operator=(const ChangeFeed&) = delete;

    void start();
    void stop();

    // One long-poll round; returns the number of events published.
    // On error `ec` is set and the position is left unchanged.
    std::size_t poll_once(boost::system::error_code& ec);

    const std::string& position() const noexcept { return since_; }
    bool healthy() const noexcept { return healthy_.load(); }

private:
    void run();
    bool sleep_for(std::chrono::milliseconds delay);

    store::StoreGateway& gateway_;
    ChangeNotifier& notifier_;
    FeedOptions options_;

    std::string since_;
    std::atomic<bool> running_{false};
    std::atomic<bool> healthy_{true};
    std::thread thread_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool exited_ = true;
};

} // namespace livestate::notify
