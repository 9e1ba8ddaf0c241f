#pragma once

#include "store/DocumentStore.h"

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace livestate::store {

struct CouchOptions {
    std::string host = "store";
    std::string port = "5984";
    std::string database = "livestate";
    std::string user;
    std::string password;
    std::chrono::milliseconds timeout{2000};
    std::size_t pool_size = 8;
};

// Client for a CouchDB-compatible document store over HTTP/1.1.
//
// Every committed revision is its own immutable document with the id
// "<resource>@<revision, 20 digits>" and the body
// {"resource": ..., "payload": ..., "committed_at": <ms since epoch>}.
// Creating the next id is the commit: a concurrent writer that got there
// first makes the create fail with 409. Because no document is ever
// updated, the native _changes feed (longpoll) lists every commit once.
// The current state of a resource is its highest-numbered document.
// Keep-alive connections are pooled.
class CouchStore : public DocumentStore {
public:
    explicit CouchStore(CouchOptions options);
    ~CouchStore() override;

    CouchStore(const CouchStore&) = delete;
    CouchStore& operator=(const CouchStore&) = delete;

    // Creates the database when it does not exist yet.
    void ensure_database(boost::system::error_code& ec);

    StoredDocument get(const std::string& resource, boost::system::error_code& ec) override;

    StoredDocument put(const std::string& resource,
                       const boost::json::value& payload,
                       std::optional<Revision> expected,
                       boost::system::error_code& ec) override;

    ChangeBatch changes(const std::string& since,
                        std::chrono::milliseconds wait,
                        boost::system::error_code& ec) override;

    void interrupt() override;

private:
    class Connection;
    struct Reply;

    StoredDocument put_once(const std::string& resource,
                            const boost::json::value& payload,
                            std::optional<Revision> expected,
                            boost::system::error_code& ec);

    // Newest revision document of `resource`; errc::not_found when none.
    StoredDocument latest(const std::string& resource, boost::system::error_code& ec);

    Reply exchange(boost::beast::http::verb verb, const std::string& target, std::string body,
                   boost::system::error_code& ec);
    Reply exchange_on(Connection& conn, boost::beast::http::verb verb, const std::string& target, const std::string& body,
                      std::chrono::milliseconds timeout, boost::system::error_code& ec);

    std::unique_ptr<Connection> acquire();
    void release(std::unique_ptr<Connection> conn);

    std::string db_target() const;

private:
    CouchOptions options_;
    std::string authorization_;

    std::mutex pool_mu_;
    std::vector<std::unique_ptr<Connection>> idle_;

    std::mutex feed_mu_;
    std::shared_ptr<Connection> feed_conn_;
};

namespace couch {

// "cart-42", 7 -> "cart-42@00000000000000000007"
std::string revision_doc_id(std::string_view resource, Revision revision);

// Inverse of revision_doc_id(). False for ids that are not revision
// documents, including revisions that overflow.
bool parse_revision_doc_id(std::string_view id, std::string& resource, Revision& revision);

// _all_docs query that returns the newest revision document of `resource`.
std::string latest_query(std::string_view resource);

std::string url_encode(std::string_view s);

// Maps a non-success HTTP status onto the store error taxonomy.
boost::system::error_code status_to_error(boost::beast::http::status status) noexcept;

// Parses a _changes response body into one change per committed revision.
// Deleted, design and foreign documents are skipped. Returns false when the
// body is not a changes response.
bool parse_changes(std::string_view body, ChangeBatch& out);

// Parses the reply to latest_query(). Returns false when the body is not an
// _all_docs response; `found` is false when `resource` has no revision yet.
bool parse_latest(std::string_view body, const std::string& resource, StoredDocument& out, bool& found);

} // namespace couch

} // namespace livestate::store
