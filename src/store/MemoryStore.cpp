#include "store/MemoryStore.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace livestate::store {

MemoryStore::MemoryStore(std::size_t max_log) : max_log_(max_log == 0 ? 1 : max_log) {}

StoredDocument MemoryStore::get(const std::string& resource, boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lk(mu_);
    ++operations_;
    if (should_fail_locked()) {
        ec = errc::unavailable;
        return {};
    }

    auto it = docs_.find(resource);
    if (it == docs_.end()) {
        ec = errc::not_found;
        return {};
    }
    ec = {};
    return it->second;
}

StoredDocument MemoryStore::put(const std::string& resource,
                                const boost::json::value& payload,
                                std::optional<Revision> expected,
                                boost::system::error_code& ec) {
    StoredDocument committed;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++operations_;
        if (should_fail_locked()) {
            ec = errc::unavailable;
            return {};
        }

        auto& doc = docs_[resource];
        if (expected && *expected != doc.revision) {
            if (doc.revision == 0) docs_.erase(resource);
            ec = errc::conflict;
            return {};
        }

        doc.resource = resource;
        doc.revision += 1;
        doc.payload = payload;
        doc.committed_at = CommitClock::now();
        committed = doc;

        StoreChange change;
        change.resource = resource;
        change.revision = doc.revision;
        change.payload = payload;
        change.committed_at = doc.committed_at;
        change.sequence = std::to_string(++seq_);

        log_.push_back(std::move(change));
        while (log_.size() > max_log_) log_.pop_front();
    }
    cv_.notify_all();

    ec = {};
    return committed;
}

ChangeBatch MemoryStore::changes(const std::string& since,
                                 std::chrono::milliseconds wait,
                                 boost::system::error_code& ec) {
    std::unique_lock<std::mutex> lk(mu_);
    ++operations_;
    if (should_fail_locked()) {
        ec = errc::unavailable;
        return {};
    }

    const std::uint64_t from = parse_since_locked(since);
    const std::uint64_t interrupts = interrupts_;

    cv_.wait_for(lk, wait, [&] { return seq_ > from || interrupts_ != interrupts; });

    ChangeBatch batch;
    for (const auto& change : log_) {
        if (std::stoull(change.sequence) > from) batch.changes.push_back(change);
    }
    batch.last_sequence = std::to_string(seq_ > from ? seq_ : from);

    ec = {};
    return batch;
}

void MemoryStore::interrupt() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++interrupts_;
    }
    cv_.notify_all();
}

void MemoryStore::fail_next(int count) {
    std::lock_guard<std::mutex> lk(mu_);
    fail_next_ = count;
}

void MemoryStore::set_available(bool available) {
    std::lock_guard<std::mutex> lk(mu_);
    available_ = available;
}

std::size_t MemoryStore::operations() const {
    std::lock_guard<std::mutex> lk(mu_);
    return operations_;
}

bool MemoryStore::should_fail_locked() {
    if (!available_) return true;
    if (fail_next_ > 0) {
        --fail_next_;
        return true;
    }
    return false;
}

std::uint64_t MemoryStore::parse_since_locked(const std::string& since) const {
    if (since.empty() || since == "now") return seq_;
    try {
        return std::stoull(since);
    } catch (const std::exception&) {
        return seq_;
    }
}

} // namespace livestate::store
