#pragma once

#include "store/Document.h"

#include <boost/json/value.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace livestate::notify {

using store::Revision;

// One committed mutation. Shared read-only between every subscriber.
struct ChangeEvent {
    using Clock = std::chrono::system_clock;

    std::string resource;
    Revision revision = 0;
    boost::json::value payload;
    Clock::time_point timestamp{};
};

using ChangeEventPtr = std::shared_ptr<const ChangeEvent>;

} // namespace livestate::notify
