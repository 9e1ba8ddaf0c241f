#include "realtime/Protocol.h"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>

namespace livestate::realtime {

namespace json = boost::json;

namespace {

std::string dump(const json::object& obj) {
    return json::serialize(obj);
}

} // namespace

std::optional<ClientFrame> parse_client_frame(std::string_view text, std::string& error) {
    boost::system::error_code ec;
    json::value v = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        error = "invalid json";
        return std::nullopt;
    }

    auto* obj = v.if_object();
    const json::value* type_v = obj ? obj->if_contains("type") : nullptr;
    if (!type_v || !type_v->is_string()) {
        error = "missing type";
        return std::nullopt;
    }

    std::string type = json::value_to<std::string>(*type_v);

    ClientFrame frame;
    if (type == "heartbeat") {
        frame.type = FrameType::Heartbeat;
        return frame;
    }

    if (type == "subscribe") {
        frame.type = FrameType::Subscribe;
    } else if (type == "unsubscribe") {
        frame.type = FrameType::Unsubscribe;
    } else {
        error = "unknown type";
        return std::nullopt;
    }

    const json::value* resource = obj->if_contains("resource");
    if (!resource || !resource->is_string()) {
        error = "missing resource";
        return std::nullopt;
    }
    frame.resource = json::value_to<std::string>(*resource);
    return frame;
}

std::string encode_welcome(const std::string& session_id) {
    return dump({{"type", "welcome"}, {"session", session_id}});
}

std::string encode_subscribed(const std::string& resource) {
    return dump({{"type", "subscribed"}, {"resource", resource}});
}

std::string encode_unsubscribed(const std::string& resource) {
    return dump({{"type", "unsubscribed"}, {"resource", resource}});
}

std::string encode_snapshot(const store::StoredDocument& doc) {
    return dump({
        {"type", "snapshot"},
        {"resource", doc.resource},
        {"revision", doc.revision},
        {"payload", doc.payload}
    });
}

std::string encode_event(const notify::ChangeEvent& event) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(event.timestamp.time_since_epoch()).count();
    return dump({
        {"type", "event"},
        {"resource", event.resource},
        {"revision", event.revision},
        {"payload", event.payload},
        {"timestamp", static_cast<std::int64_t>(ms)}
    });
}

std::string encode_heartbeat() {
    return dump({{"type", "heartbeat"}});
}

std::string encode_error(const std::string& text) {
    return dump({{"type", "error"}, {"text", text}});
}

} // namespace livestate::realtime
