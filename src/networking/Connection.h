#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace livestate::networking {

using ClientId = std::uint64_t;

enum class CloseReason {
    Normal,
    IdleTimeout,
    SubscriberDisconnected,
    ProtocolViolation,
    HandshakeFailure,
    TransportFailure,
    ServerShutdown,
};

const char* to_string(CloseReason reason) noexcept;

// Server side of one client connection, as application code sees it.
//
// Except for dispatch(), every member must be called on the connection's
// strand: from inside a ConnectionHandler callback or a dispatched function.
class Connection {
public:
    virtual ~Connection() = default;

    virtual ClientId id() const noexcept = 0;

    // Queues a text frame. Frames sharing a non-empty `tag` can be purged
    // with discard() while they still wait in the queue.
    virtual void send(std::string frame, std::string tag = {}) = 0;

    // Drops queued frames with `tag` that have not started writing.
    virtual std::size_t discard(const std::string& tag) = 0;

    // Frames queued and not yet fully written.
    virtual std::size_t queued() const noexcept = 0;

    // Flushes the queue (bounded by the flush timeout), then closes with
    // `reason` as the close frame reason. Further sends are ignored.
    virtual void close(CloseReason reason) = 0;

    // Thread-safe: runs `fn` on the connection's strand.
    virtual void dispatch(std::function<void()> fn) = 0;
};

// Application callbacks for one connection, all invoked on its strand.
class ConnectionHandler {
public:
    virtual ~ConnectionHandler() = default;

    // Handshake completed.
    virtual void on_open() = 0;

    virtual void on_message(const std::string& text) = 0;

    // The outbound queue became empty.
    virtual void on_drained() = 0;

    // Transport is gone; no callback follows.
    virtual void on_closed(CloseReason reason) = 0;
};

} // namespace livestate::networking
