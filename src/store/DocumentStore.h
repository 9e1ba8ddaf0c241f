#pragma once

#include "store/Document.h"
#include "store/StoreError.h"

#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace livestate::store {

// Backend seam for the shared document store. Implementations are
// thread-safe; every call may block on I/O.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // errc::not_found, errc::unavailable
    virtual StoredDocument get(const std::string& resource, boost::system::error_code& ec) = 0;

    // Commits `payload` as the next revision of `resource` and returns the
    // committed document. When `expected` is set the current revision must
    // match it (0 = must not exist yet).
    // errc::conflict, errc::unavailable
    virtual StoredDocument put(const std::string& resource,
                         const boost::json::value& payload,
                         std::optional<Revision> expected,
                         boost::system::error_code& ec) = 0;

    // Long-polls the change feed after `since` ("now" = current end).
    // Every committed revision appears once, in commit order per resource.
    // Returns an empty batch when `wait` elapses without changes.
    virtual ChangeBatch changes(const std::string& since,
                                std::chrono::milliseconds wait,
                                boost::system::error_code& ec) = 0;

    // Wakes callers blocked in changes(); used on shutdown.
    virtual void interrupt() {}
};

} // namespace livestate::store
