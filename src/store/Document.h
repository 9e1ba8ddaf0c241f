#pragma once

#include <boost/json/value.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace livestate::store {

// Per-resource, starts at 1 and only grows.
using Revision = std::uint64_t;

using CommitClock = std::chrono::system_clock;

struct StoredDocument {
    std::string resource;
    Revision revision = 0;
    boost::json::value payload;
    CommitClock::time_point committed_at{};
};

struct StoreChange {
    std::string resource;
    Revision revision = 0;
    boost::json::value payload;
    CommitClock::time_point committed_at{};
    std::string sequence;  // feed position of this change
};

// Commit times travel through the store as milliseconds since the epoch.
inline std::int64_t to_millis(CommitClock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline CommitClock::time_point from_millis(std::int64_t ms) {
    return CommitClock::time_point(std::chrono::milliseconds(ms));
}

// "42" -> 42. Empty input, anything but ASCII digits, or a value that does
// not fit a Revision yields nullopt.
inline std::optional<Revision> parse_revision_number(std::string_view digits) noexcept {
    if (digits.empty()) return std::nullopt;
    Revision n = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
        const auto d = static_cast<Revision>(c - '0');
        if (n > (std::numeric_limits<Revision>::max() - d) / 10) return std::nullopt;
        n = n * 10 + d;
    }
    return n;
}

struct ChangeBatch {
    std::vector<StoreChange> changes;
    std::string last_sequence;  // pass back as `since` to continue
};

} // namespace livestate::store
