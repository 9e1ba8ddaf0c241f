#include "notify/ChangeFeed.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace livestate::notify {

ChangeFeed::ChangeFeed(store::StoreGateway& gateway, ChangeNotifier& notifier, FeedOptions options)
    : gateway_(gateway), notifier_(notifier), options_(std::move(options)), since_(options_.since) {}

ChangeFeed::~ChangeFeed() { stop(); }

void ChangeFeed::start() {
    if (running_.exchange(true)) return;
    exited_ = false;
    thread_ = std::thread([this] { run(); });
}

void ChangeFeed::stop() {
    if (!running_.exchange(false)) return;

    // The feed thread may be about to enter a long poll; keep interrupting
    // until it has left the loop.
    std::unique_lock<std::mutex> lk(mu_);
    while (!exited_) {
        lk.unlock();
        gateway_.interrupt();
        cv_.notify_all();
        lk.lock();
        cv_.wait_for(lk, std::chrono::milliseconds(20), [this] { return exited_; });
    }
    lk.unlock();
    if (thread_.joinable()) thread_.join();
}

std::size_t ChangeFeed::poll_once(boost::system::error_code& ec) {
    store::ChangeBatch batch = gateway_.changes(since_, options_.wait, ec);
    if (ec) return 0;

    std::size_t published = 0;
    for (auto& change : batch.changes) {
        if (notifier_.publish(change.resource, change.revision, std::move(change.payload), change.committed_at)) {
            ++published;
        }
    }
    if (!batch.last_sequence.empty()) since_ = batch.last_sequence;
    return published;
}

void ChangeFeed::run() {
    spdlog::info("[ChangeFeed] tailing store changes from {}", since_);
    auto backoff = options_.min_backoff;

    while (running_) {
        boost::system::error_code ec;
        std::size_t n = poll_once(ec);
        if (!running_) break;

        if (ec) {
            if (healthy_.exchange(false)) {
                spdlog::warn("[ChangeFeed] store feed lost: {}; serving stale state", ec.message());
            }
            if (!sleep_for(backoff)) break;
            backoff = std::min(backoff * 2, options_.max_backoff);
            continue;
        }

        if (!healthy_.exchange(true)) spdlog::info("[ChangeFeed] store feed recovered at {}", since_);
        backoff = options_.min_backoff;
        if (n > 0) spdlog::debug("[ChangeFeed] published {} change(s), position {}", n, since_);
    }
    spdlog::info("[ChangeFeed] stopped");

    {
        std::lock_guard<std::mutex> lk(mu_);
        exited_ = true;
    }
    cv_.notify_all();
}

bool ChangeFeed::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_for(lk, delay, [this] { return !running_; });
}

} // namespace livestate::notify
