#include "store/ResourceId.h"

#include <algorithm>
#include <utility>

namespace livestate::store {

std::optional<ResourceId> ResourceId::parse(std::string raw) {
    std::string s = trim_copy(std::move(raw));

    if (s.empty() || s.size() > kMaxLen) return std::nullopt;
    if (s.front() == '_') return std::nullopt;
    if (!std::all_of(s.begin(), s.end(), is_allowed)) return std::nullopt;

    return ResourceId(std::move(s));
}

bool ResourceId::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool ResourceId::is_allowed(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == ':';
}

std::string ResourceId::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

} // namespace livestate::store
