#include "store/StoreGateway.h"

#include <spdlog/spdlog.h>

#include <thread>
#include <utility>

namespace livestate::store {

StoreGateway::StoreGateway(DocumentStore& store, RetryPolicy policy)
    : store_(store), policy_(policy) {
    if (policy_.attempts < 1) policy_.attempts = 1;
}

template <class Op>
auto StoreGateway::with_retry(const char* what, const std::string& resource, Op&& op,
                              boost::system::error_code& ec) -> decltype(op(ec)) {
    for (int attempt = 1;; ++attempt) {
        auto delay = policy_.delay_before(attempt);
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        auto result = op(ec);
        if (!is_transient(ec) || attempt >= policy_.attempts) {
            if (ec && is_transient(ec)) {
                spdlog::warn("[StoreGateway] {} {} gave up after {} attempts: {}",
                             what, resource, attempt, ec.message());
            }
            return result;
        }
        spdlog::debug("[StoreGateway] {} {} attempt {} failed: {}", what, resource, attempt, ec.message());
    }
}

Revision StoreGateway::write(const std::string& resource,
                             const boost::json::value& document,
                             boost::system::error_code& ec) {
    return write(resource, document, std::nullopt, ec);
}

Revision StoreGateway::write(const std::string& resource,
                             const boost::json::value& document,
                             std::optional<Revision> expected,
                             boost::system::error_code& ec) {
    StoredDocument committed = with_retry(
        "write", resource,
        [&](boost::system::error_code& op_ec) { return store_.put(resource, document, expected, op_ec); },
        ec);
    if (ec) return 0;

    WriteListener listener;
    {
        std::lock_guard<std::mutex> lk(listener_mu_);
        listener = listener_;
    }
    if (listener) listener(committed);

    return committed.revision;
}

StoredDocument StoreGateway::read(const std::string& resource, boost::system::error_code& ec) {
    return with_retry(
        "read", resource,
        [&](boost::system::error_code& op_ec) { return store_.get(resource, op_ec); },
        ec);
}

ChangeBatch StoreGateway::changes(const std::string& since,
                                  std::chrono::milliseconds wait,
                                  boost::system::error_code& ec) {
    return store_.changes(since, wait, ec);
}

void StoreGateway::set_write_listener(WriteListener listener) {
    std::lock_guard<std::mutex> lk(listener_mu_);
    listener_ = std::move(listener);
}

} // namespace livestate::store
