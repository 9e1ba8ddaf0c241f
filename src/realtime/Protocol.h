#pragma once

#include "notify/ChangeEvent.h"
#include "store/Document.h"

#include <optional>
#include <string>
#include <string_view>

namespace livestate::realtime {

// Client -> server frames.
enum class FrameType { Subscribe, Unsubscribe, Heartbeat };

struct ClientFrame {
    FrameType type = FrameType::Heartbeat;
    std::string resource;  // empty for Heartbeat
};

// Parses one text frame. On failure returns nullopt and sets `error` to a
// short description; the caller treats that as a protocol violation.
std::optional<ClientFrame> parse_client_frame(std::string_view text, std::string& error);

// Server -> client frames.
std::string encode_welcome(const std::string& session_id);
std::string encode_subscribed(const std::string& resource);
std::string encode_unsubscribed(const std::string& resource);
std::string encode_snapshot(const store::StoredDocument& doc);
std::string encode_event(const notify::ChangeEvent& event);
std::string encode_heartbeat();
std::string encode_error(const std::string& text);

} // namespace livestate::realtime
