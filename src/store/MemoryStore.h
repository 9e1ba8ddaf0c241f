#pragma once

#include "store/DocumentStore.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace livestate::store {

// In-process backend: used by tests and by the single-process mode.
// Keeps a bounded change log so changes() behaves like a real feed.
class MemoryStore : public DocumentStore {
public:
    explicit MemoryStore(std::size_t max_log = 4096);

    StoredDocument get(const std::string& resource, boost::system::error_code& ec) override;

    StoredDocument put(const std::string& resource,
                       const boost::json::value& payload,
                       std::optional<Revision> expected,
                       boost::system::error_code& ec) override;

    ChangeBatch changes(const std::string& since,
                        std::chrono::milliseconds wait,
                        boost::system::error_code& ec) override;

    void interrupt() override;

    // Fault injection.
    void fail_next(int count);
    void set_available(bool available);

    std::size_t operations() const;

private:
    bool should_fail_locked();
    std::uint64_t parse_since_locked(const std::string& since) const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;

    std::unordered_map<std::string, StoredDocument> docs_;
    std::deque<StoreChange> log_;
    std::size_t max_log_;
    std::uint64_t seq_ = 0;
    std::uint64_t interrupts_ = 0;

    bool available_ = true;
    int fail_next_ = 0;
    std::size_t operations_ = 0;
};

} // namespace livestate::store
