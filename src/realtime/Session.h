#pragma once

#include "networking/Connection.h"
#include "notify/ChangeNotifier.h"
#include "store/Document.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace livestate::realtime {

enum class SessionState { Connecting, Active, Closing, Closed };

const char* to_string(SessionState s) noexcept;

struct SessionOptions {
    std::chrono::milliseconds idle_timeout{30000};
    std::size_t max_outbound = 64;  // frames queued on the transport
};

// Fetches the current document for a snapshot. `done` may be invoked on any
// thread, with nullopt when the resource does not exist or cannot be read.
using SnapshotLoader = std::function<void(const std::string& resource,
                                          std::function<void(std::optional<store::StoredDocument>)> done)>;

// One live socket connection: its subscriptions, delivery watermarks and
// lifecycle (Connecting -> Active -> Closing -> Closed).
//
// All members run on the connection's strand; event wakeups from the
// notifier are funnelled there through Connection::dispatch.
class Session : public networking::ConnectionHandler, public std::enable_shared_from_this<Session> {
public:
    using Clock = std::chrono::steady_clock;
    using FinishedHandler = std::function<void(const Session&)>;

    Session(std::string id,
            std::shared_ptr<networking::Connection> conn,
            notify::ChangeNotifier& notifier,
            SessionOptions options,
            SnapshotLoader loader = {});
    ~Session() override;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // networking::ConnectionHandler
    void on_open() override;
    void on_message(const std::string& text) override;
    void on_drained() override;
    void on_closed(networking::CloseReason reason) override;

    // Moves buffered events onto the transport while the outbound budget lasts.
    void drain();

    void check_idle(Clock::time_point now);

    // Active -> Closing: flushes what is buffered, drops every subscription
    // and asks the transport to close.
    void close(networking::CloseReason reason);

    void set_finished_handler(FinishedHandler handler) { on_finished_ = std::move(handler); }

    const std::string& id() const noexcept { return id_; }
    networking::Connection& connection() const noexcept { return *conn_; }

    SessionState state() const noexcept { return state_.load(); }
    std::optional<networking::CloseReason> close_reason() const { return close_reason_; }

    bool subscribed(const std::string& resource) const { return interests_.count(resource) != 0; }
    std::size_t subscription_count() const noexcept { return interests_.size(); }
    store::Revision watermark(const std::string& resource) const;
    bool snapshot_pending(const std::string& resource) const;
    Clock::time_point last_seen() const noexcept { return last_seen_; }

    std::size_t delivered() const noexcept { return delivered_; }
    std::size_t discarded() const noexcept { return discarded_; }

private:
    struct Interest {
        std::shared_ptr<notify::Subscription> sub;
        store::Revision watermark = 0;  // last revision pushed to the client

        // Events stay buffered until the snapshot read has set the watermark.
        bool snapshot_pending = false;
    };

    void handle_subscribe(const std::string& raw_resource);
    void handle_unsubscribe(const std::string& raw_resource);
    void on_snapshot(const std::shared_ptr<notify::Subscription>& sub,
                     std::optional<store::StoredDocument> doc);

    bool deliver(Interest& interest, const notify::ChangeEventPtr& ev);
    void schedule_drain();
    void release_subscriptions(bool flush);
    void finish();

    std::string id_;
    std::shared_ptr<networking::Connection> conn_;
    notify::ChangeNotifier& notifier_;
    SessionOptions options_;
    SnapshotLoader loader_;
    FinishedHandler on_finished_;

    std::atomic<SessionState> state_{SessionState::Connecting};
    std::optional<networking::CloseReason> close_reason_;

    std::unordered_map<std::string, Interest> interests_;

    Clock::time_point connected_at_{};
    Clock::time_point last_seen_{};

    std::atomic<bool> drain_scheduled_{false};
    std::size_t delivered_ = 0;
    std::size_t discarded_ = 0;
};

} // namespace livestate::realtime
