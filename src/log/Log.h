#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace livestate::log {

// Process-wide logger: "2024-01-01 12:00:00.000 - info - [Component] message".
inline void init(const std::string& level) {
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e - %l - %v");
    spdlog::set_level(spdlog::level::from_str(level));
}

} // namespace livestate::log
