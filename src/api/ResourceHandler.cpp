#include "api/ResourceHandler.h"

#include "store/ResourceId.h"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <ctime>

namespace livestate::api {

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

using networking::HttpRequest;
using networking::HttpResponse;

namespace {

constexpr std::string_view kResourcesPrefix = "/resources/";

HttpResponse make_json(const HttpRequest& req, http::status status, const json::value& body) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, "livestate");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

HttpResponse make_error(const HttpRequest& req, http::status status, const char* kind, const std::string& message) {
    return make_json(req, status, json::object{{"error", kind}, {"message", message}});
}

HttpResponse store_error(const HttpRequest& req, const boost::system::error_code& ec) {
    if (ec == store::errc::not_found) {
        return make_error(req, http::status::not_found, "not_found", ec.message());
    }
    if (ec == store::errc::conflict) {
        return make_error(req, http::status::conflict, "conflict", ec.message());
    }
    auto res = make_error(req, http::status::service_unavailable, "unavailable", ec.message());
    res.set(http::field::retry_after, "1");
    return res;
}

std::string_view to_view(beast::string_view s) { return {s.data(), s.size()}; }

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// If-Match: 3 or "3"
std::optional<store::Revision> parse_if_match(std::string_view v, bool& malformed) {
    malformed = false;
    if (v.empty()) return std::nullopt;
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);

    auto n = store::parse_revision_number(v);
    if (!n) malformed = true;
    return n;
}

bool is_form_urlencoded(std::string_view content_type) {
    auto media = content_type.substr(0, content_type.find(';'));
    while (!media.empty() && (media.back() == ' ' || media.back() == '\t')) media.remove_suffix(1);
    while (!media.empty() && (media.front() == ' ' || media.front() == '\t')) media.remove_prefix(1);
    return beast::iequals(beast::string_view(media.data(), media.size()), "application/x-www-form-urlencoded");
}

// "2024-01-01 12:00:00.000000", UTC.
std::string now_stamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm{};
    gmtime_r(&t, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%06lld", date, static_cast<long long>(micros));
    return out;
}

} // namespace

std::string url_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<json::object> parse_form(std::string_view body) {
    json::object out;
    std::size_t pos = 0;
    while (pos <= body.size()) {
        std::size_t amp = body.find('&', pos);
        if (amp == std::string_view::npos) amp = body.size();
        std::string_view pair = body.substr(pos, amp - pos);

        std::size_t eq = pair.find('=');
        if (eq == std::string_view::npos || pair.find('=', eq + 1) != std::string_view::npos) {
            return std::nullopt;
        }
        out[url_decode(pair.substr(0, eq))] = json::value_from(url_decode(pair.substr(eq + 1)));

        pos = amp + 1;
    }
    return out;
}

HttpResponse ResourceHandler::operator()(const HttpRequest& req) {
    std::string_view target = to_view(req.target());
    if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    if (target == "/health") {
        if (req.method() != http::verb::get) {
            return make_error(req, http::status::method_not_allowed, "method_not_allowed", "use GET");
        }
        return make_json(req, http::status::ok, json::object{{"status", "ok"}});
    }

    if (target.substr(0, kResourcesPrefix.size()) != kResourcesPrefix) {
        return make_error(req, http::status::not_found, "not_found", "no such route");
    }

    auto rid = store::ResourceId::parse(url_decode(target.substr(kResourcesPrefix.size())));
    if (!rid) {
        return make_error(req, http::status::bad_request, "bad_request", "invalid resource id");
    }

    switch (req.method()) {
        case http::verb::get:
            return read_resource(req, rid->str());
        case http::verb::put:
        case http::verb::post:
            return write_resource(req, rid->str());
        default:
            return make_error(req, http::status::method_not_allowed, "method_not_allowed", "use GET, PUT or POST");
    }
}

HttpResponse ResourceHandler::read_resource(const HttpRequest& req, const std::string& resource) {
    boost::system::error_code ec;
    store::StoredDocument doc = gateway_.read(resource, ec);
    if (ec) return store_error(req, ec);

    return make_json(req, http::status::ok, json::object{
        {"resource", doc.resource},
        {"revision", doc.revision},
        {"document", doc.payload}
    });
}

HttpResponse ResourceHandler::write_resource(const HttpRequest& req, const std::string& resource) {
    bool malformed = false;
    auto expected = parse_if_match(to_view(req[http::field::if_match]), malformed);
    if (malformed) {
        return make_error(req, http::status::bad_request, "bad_request", "If-Match must be a revision number");
    }

    json::value document;
    if (is_form_urlencoded(to_view(req[http::field::content_type]))) {
        auto form = parse_form(req.body());
        if (!form) {
            return make_error(req, http::status::bad_request, "bad_request", "malformed form body");
        }
        (*form)["date"] = json::value_from(now_stamp());
        document = std::move(*form);
    } else {
        boost::system::error_code parse_ec;
        document = json::parse(req.body(), parse_ec);
        if (parse_ec) {
            return make_error(req, http::status::bad_request, "bad_request", "invalid json: " + parse_ec.message());
        }
    }

    boost::system::error_code ec;
    store::Revision revision = gateway_.write(resource, document, expected, ec);
    if (ec) {
        spdlog::info("[ResourceHandler] write {} failed: {}", resource, ec.message());
        return store_error(req, ec);
    }

    spdlog::debug("[ResourceHandler] {} -> revision {}", resource, revision);
    return make_json(req, http::status::ok, json::object{{"resource", resource}, {"revision", revision}});
}

} // namespace livestate::api
