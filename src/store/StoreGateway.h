#pragma once

#include "store/Document.h"
#include "store/DocumentStore.h"
#include "store/RetryPolicy.h"

#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace livestate::store {

// The single write and read path to the shared store.
//
// errc::unavailable is retried according to the RetryPolicy; errc::conflict
// and errc::not_found are returned to the caller on the first occurrence.
// Nothing is cached: every read goes to the backend.
class StoreGateway {
public:
    // Called after every committed write, on the writing thread, with the
    // document as the store committed it.
    using WriteListener = std::function<void(const StoredDocument&)>;

    explicit StoreGateway(DocumentStore& store, RetryPolicy policy = {});

    StoreGateway(const StoreGateway&) = delete;
    StoreGateway& operator=(const StoreGateway&) = delete;

    Revision write(const std::string& resource,
                   const boost::json::value& document,
                   boost::system::error_code& ec);

    // Optimistic variant: fails with errc::conflict unless the stored
    // revision equals `expected`.
    Revision write(const std::string& resource,
                   const boost::json::value& document,
                   std::optional<Revision> expected,
                   boost::system::error_code& ec);

    StoredDocument read(const std::string& resource, boost::system::error_code& ec);

    // Change feed passthrough; not retried, the feed loop owns its backoff.
    ChangeBatch changes(const std::string& since,
                        std::chrono::milliseconds wait,
                        boost::system::error_code& ec);

    void set_write_listener(WriteListener listener);

    void interrupt() { store_.interrupt(); }

private:
    template <class Op>
    auto with_retry(const char* what, const std::string& resource, Op&& op,
                    boost::system::error_code& ec) -> decltype(op(ec));

    DocumentStore& store_;
    RetryPolicy policy_;

    std::mutex listener_mu_;
    WriteListener listener_;
};

} // namespace livestate::store
