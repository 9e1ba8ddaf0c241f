#include "store/CouchStore.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace livestate::store {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

struct CouchStore::Reply {
    http::status status = http::status::unknown;
    std::string body;
};

// One keep-alive connection. Beast operations run asynchronously on a
// private io_context so every step honours the stream timeout; the calling
// thread drives the context until the operation completes.
class CouchStore::Connection {
public:
    Connection(std::string host, std::string port)
        : host_(std::move(host)), port_(std::move(port)), stream_(ioc_) {}

    bool is_open() const noexcept { return open_; }
    bool reused() const noexcept { return exchanges_ > 0; }

    void exchange(const http::request<http::string_body>& req,
                  http::response<http::string_body>& res,
                  std::chrono::milliseconds timeout,
                  beast::error_code& ec) {
        if (!open_) {
            connect(timeout, ec);
            if (ec) return;
        }

        stream_.expires_after(timeout);
        http::async_write(stream_, req, [&ec](beast::error_code e, std::size_t) { ec = e; });
        drive();
        if (ec) return shutdown();

        http::async_read(stream_, buffer_, res, [&ec](beast::error_code e, std::size_t) { ec = e; });
        drive();
        if (ec) return shutdown();

        ++exchanges_;
        if (res.need_eof()) shutdown();
    }

    // Thread-safe: aborts whatever the owning thread is waiting on.
    void cancel() {
        asio::post(ioc_, [this] { stream_.cancel(); });
    }

private:
    void connect(std::chrono::milliseconds timeout, beast::error_code& ec) {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve(host_, port_, ec);
        if (ec) return;

        stream_.expires_after(timeout);
        stream_.async_connect(results, [&ec](beast::error_code e, const tcp::endpoint&) { ec = e; });
        drive();
        if (ec) return;

        open_ = true;
        exchanges_ = 0;
        buffer_.clear();
    }

    void drive() {
        ioc_.restart();
        ioc_.run();
    }

    void shutdown() {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        stream_.close();
        open_ = false;
    }

    std::string host_;
    std::string port_;

    asio::io_context ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;

    bool open_ = false;
    std::size_t exchanges_ = 0;
};

CouchStore::CouchStore(CouchOptions options) : options_(std::move(options)) {
    if (!options_.user.empty()) {
        const std::string credentials = options_.user + ":" + options_.password;
        std::string encoded(beast::detail::base64::encoded_size(credentials.size()), '\0');
        encoded.resize(beast::detail::base64::encode(encoded.data(), credentials.data(), credentials.size()));
        authorization_ = "Basic " + encoded;
    }
}

CouchStore::~CouchStore() = default;

void CouchStore::ensure_database(boost::system::error_code& ec) {
    auto reply = exchange(http::verb::put, db_target(), {}, ec);
    if (ec) return;

    // 412: already exists
    if (reply.status == http::status::created || reply.status == http::status::accepted ||
        reply.status == http::status::precondition_failed) {
        ec = {};
        return;
    }
    spdlog::error("[CouchStore] cannot create database {}: HTTP {}",
                  options_.database, static_cast<unsigned>(reply.status));
    ec = couch::status_to_error(reply.status);
}

StoredDocument CouchStore::get(const std::string& resource, boost::system::error_code& ec) {
    return latest(resource, ec);
}

StoredDocument CouchStore::latest(const std::string& resource, boost::system::error_code& ec) {
    auto reply = exchange(http::verb::get, db_target() + "/_all_docs?" + couch::latest_query(resource), {}, ec);
    if (ec) return {};
    if (reply.status != http::status::ok) {
        ec = couch::status_to_error(reply.status);
        return {};
    }

    StoredDocument out;
    bool found = false;
    if (!couch::parse_latest(reply.body, resource, out, found)) {
        spdlog::warn("[CouchStore] malformed _all_docs response for {}", resource);
        ec = errc::unavailable;
        return {};
    }
    ec = found ? boost::system::error_code{} : make_error_code(errc::not_found);
    return out;
}

StoredDocument CouchStore::put(const std::string& resource,
                               const json::value& payload,
                               std::optional<Revision> expected,
                               boost::system::error_code& ec) {
    // An unconditional write that loses the race against another writer is
    // simply re-based on the newer revision.
    constexpr int kMaxRebase = 5;
    for (int attempt = 1;; ++attempt) {
        StoredDocument committed = put_once(resource, payload, expected, ec);
        if (ec != errc::conflict || expected || attempt >= kMaxRebase) return committed;
        spdlog::debug("[CouchStore] {} changed underneath, retrying write", resource);
    }
}

StoredDocument CouchStore::put_once(const std::string& resource,
                                    const json::value& payload,
                                    std::optional<Revision> expected,
                                    boost::system::error_code& ec) {
    Revision current = 0;
    {
        boost::system::error_code read_ec;
        StoredDocument doc = latest(resource, read_ec);
        if (read_ec && read_ec != errc::not_found) {
            ec = read_ec;
            return {};
        }
        current = doc.revision;
    }

    if (expected && *expected != current) {
        ec = errc::conflict;
        return {};
    }

    StoredDocument committed;
    committed.resource = resource;
    committed.revision = current + 1;
    committed.payload = payload;
    committed.committed_at = CommitClock::now();

    json::object body;
    body["resource"] = json::value_from(resource);
    body["payload"] = payload;
    body["committed_at"] = to_millis(committed.committed_at);

    const std::string target =
        db_target() + "/" + couch::url_encode(couch::revision_doc_id(resource, committed.revision));

    // No _rev: this can only create. 409 means the revision is taken.
    auto reply = exchange(http::verb::put, target, json::serialize(body), ec);
    if (ec) return {};
    if (reply.status != http::status::created && reply.status != http::status::accepted) {
        ec = couch::status_to_error(reply.status);
        return {};
    }

    ec = {};
    return committed;
}

ChangeBatch CouchStore::changes(const std::string& since,
                                std::chrono::milliseconds wait,
                                boost::system::error_code& ec) {
    auto conn = std::make_shared<Connection>(options_.host, options_.port);
    {
        std::lock_guard<std::mutex> lk(feed_mu_);
        feed_conn_ = conn;
    }

    const std::string target = db_target() + "/_changes?feed=longpoll&include_docs=true&since=" + couch::url_encode(since) +
                               "&timeout=" + std::to_string(wait.count());

    auto reply = exchange_on(*conn, http::verb::get, target, {}, wait + options_.timeout, ec);
    {
        std::lock_guard<std::mutex> lk(feed_mu_);
        if (feed_conn_ == conn) feed_conn_.reset();
    }
    if (ec) return {};
    if (reply.status != http::status::ok) {
        ec = couch::status_to_error(reply.status);
        return {};
    }

    ChangeBatch batch;
    if (!couch::parse_changes(reply.body, batch)) {
        spdlog::warn("[CouchStore] malformed _changes response");
        ec = errc::unavailable;
        return {};
    }
    ec = {};
    return batch;
}

void CouchStore::interrupt() {
    std::lock_guard<std::mutex> lk(feed_mu_);
    if (feed_conn_) feed_conn_->cancel();
}

CouchStore::Reply CouchStore::exchange(http::verb verb, const std::string& target, std::string body,
                                       boost::system::error_code& ec) {
    auto conn = acquire();
    const bool reused = conn->is_open() && conn->reused();

    auto reply = exchange_on(*conn, verb, target, body, options_.timeout, ec);
    if (ec && reused) {
        // The server may have dropped an idle keep-alive connection.
        spdlog::debug("[CouchStore] stale pooled connection: {}", ec.message());
        reply = exchange_on(*conn, verb, target, body, options_.timeout, ec);
    }

    if (!ec) release(std::move(conn));
    return reply;
}

CouchStore::Reply CouchStore::exchange_on(Connection& conn, http::verb verb, const std::string& target,
                                          const std::string& body, std::chrono::milliseconds timeout,
                                          boost::system::error_code& ec) {
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, options_.host);
    req.set(http::field::user_agent, "livestate");
    req.set(http::field::accept, "application/json");
    if (!authorization_.empty()) req.set(http::field::authorization, authorization_);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.keep_alive(true);
    req.prepare_payload();

    http::response<http::string_body> res;
    beast::error_code io_ec;
    conn.exchange(req, res, timeout, io_ec);
    if (io_ec) {
        spdlog::debug("[CouchStore] request {} failed: {}", target, io_ec.message());
        ec = errc::unavailable;
        return {};
    }

    ec = {};
    return Reply{res.result(), std::move(res.body())};
}

std::unique_ptr<CouchStore::Connection> CouchStore::acquire() {
    {
        std::lock_guard<std::mutex> lk(pool_mu_);
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }
    }
    return std::make_unique<Connection>(options_.host, options_.port);
}

void CouchStore::release(std::unique_ptr<Connection> conn) {
    if (!conn->is_open()) return;
    std::lock_guard<std::mutex> lk(pool_mu_);
    if (idle_.size() < options_.pool_size) idle_.push_back(std::move(conn));
}

std::string CouchStore::db_target() const {
    return "/" + couch::url_encode(options_.database);
}

namespace couch {

namespace {

// Zero-padded so that id order is revision order.
constexpr std::size_t kRevisionDigits = 20;

} // namespace

std::string revision_doc_id(std::string_view resource, Revision revision) {
    std::string digits = std::to_string(revision);
    std::string id;
    id.reserve(resource.size() + 1 + kRevisionDigits);
    id.append(resource.data(), resource.size());
    id.push_back('@');
    id.append(kRevisionDigits - std::min(digits.size(), kRevisionDigits), '0');
    id.append(digits);
    return id;
}

bool parse_revision_doc_id(std::string_view id, std::string& resource, Revision& revision) {
    const auto at = id.rfind('@');
    if (at == std::string_view::npos || at == 0 || id.size() - at - 1 != kRevisionDigits) return false;

    auto parsed = parse_revision_number(id.substr(at + 1));
    if (!parsed || *parsed == 0) return false;

    resource.assign(id.data(), at);
    revision = *parsed;
    return true;
}

std::string latest_query(std::string_view resource) {
    const std::string low = std::string(resource) + "@";
    const std::string high = low + std::string(kRevisionDigits, '9');
    return "include_docs=true&descending=true&limit=1&startkey=" +
           url_encode(json::serialize(json::value_from(high))) +
           "&endkey=" + url_encode(json::serialize(json::value_from(low)));
}

std::string url_encode(std::string_view s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

boost::system::error_code status_to_error(http::status status) noexcept {
    switch (status) {
        case http::status::not_found:           return errc::not_found;
        case http::status::conflict:            return errc::conflict;
        case http::status::precondition_failed: return errc::conflict;
        default:                                return errc::unavailable;
    }
}

namespace {

std::string sequence_string(const json::value& seq) {
    if (seq.is_string()) return json::value_to<std::string>(seq);
    return json::serialize(seq);
}

// Fills resource, revision, payload and commit time from one revision
// document. False for anything else stored in the database.
bool read_revision_doc(const json::object& doc, std::string& resource, Revision& revision,
                       json::value& payload, CommitClock::time_point& committed_at) {
    const json::value* id = doc.if_contains("_id");
    if (!id || !id->is_string()) return false;
    if (!parse_revision_doc_id(json::value_to<std::string>(*id), resource, revision)) return false;

    const json::value* body_payload = doc.if_contains("payload");
    if (!body_payload) return false;
    payload = *body_payload;

    committed_at = {};
    if (const json::value* at = doc.if_contains("committed_at"); at && at->is_int64()) {
        committed_at = from_millis(at->as_int64());
    }
    return true;
}

} // namespace

bool parse_changes(std::string_view body, ChangeBatch& out) {
    boost::system::error_code ec;
    json::value root = json::parse(json::string_view(body.data(), body.size()), ec);
    if (ec || !root.is_object()) return false;

    const json::object& obj = root.as_object();
    const json::value* results = obj.if_contains("results");
    const json::value* last_seq = obj.if_contains("last_seq");
    if (!results || !results->is_array() || !last_seq) return false;

    out.changes.clear();
    out.last_sequence = sequence_string(*last_seq);

    for (const json::value& item : results->as_array()) {
        const json::object* row = item.if_object();
        if (!row) continue;

        if (const json::value* deleted = row->if_contains("deleted"); deleted && deleted->is_bool() && deleted->as_bool()) {
            continue;
        }

        const json::value* doc = row->if_contains("doc");
        const json::object* doc_obj = doc ? doc->if_object() : nullptr;
        if (!doc_obj) continue;

        StoreChange change;
        if (!read_revision_doc(*doc_obj, change.resource, change.revision, change.payload, change.committed_at)) {
            continue;
        }
        if (const json::value* seq = row->if_contains("seq")) change.sequence = sequence_string(*seq);
        out.changes.push_back(std::move(change));
    }
    return true;
}

bool parse_latest(std::string_view body, const std::string& resource, StoredDocument& out, bool& found) {
    found = false;

    boost::system::error_code ec;
    json::value root = json::parse(json::string_view(body.data(), body.size()), ec);
    if (ec || !root.is_object()) return false;

    const json::value* rows = root.as_object().if_contains("rows");
    if (!rows || !rows->is_array()) return false;

    for (const json::value& item : rows->as_array()) {
        const json::value* doc = item.is_object() ? item.as_object().if_contains("doc") : nullptr;
        const json::object* doc_obj = doc ? doc->if_object() : nullptr;
        if (!doc_obj) continue;

        StoredDocument candidate;
        if (!read_revision_doc(*doc_obj, candidate.resource, candidate.revision, candidate.payload,
                               candidate.committed_at)) {
            continue;
        }
        if (candidate.resource != resource) continue;

        out = std::move(candidate);
        found = true;
        return true;
    }
    return true;
}

} // namespace couch

} // namespace livestate::store
