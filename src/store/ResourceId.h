#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace livestate::store {

// Validated resource identifier, safe to use as a store document id.
class ResourceId {
public:
    static constexpr std::size_t kMaxLen = 128;

    // Trims surrounding whitespace; rejects empty, over-long, reserved
    // ("_" prefix) or ids with characters outside [A-Za-z0-9._:-].
    static std::optional<ResourceId> parse(std::string raw);

    const std::string& str() const noexcept { return value_; }

    friend bool operator==(const ResourceId& a, const ResourceId& b) { return a.value_ == b.value_; }
    friend bool operator!=(const ResourceId& a, const ResourceId& b) { return !(a == b); }

private:
    explicit ResourceId(std::string value) : value_(std::move(value)) {}

    static std::string trim_copy(std::string s);
    static bool is_space(char c) noexcept;
    static bool is_allowed(char c) noexcept;

private:
    std::string value_;
};

} // namespace livestate::store
