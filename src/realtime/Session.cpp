#include "realtime/Session.h"

#include "realtime/Protocol.h"
#include "store/ResourceId.h"

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace livestate::realtime {

using networking::CloseReason;

const char* to_string(SessionState s) noexcept {
    switch (s) {
        case SessionState::Connecting: return "Connecting";
        case SessionState::Active:     return "Active";
        case SessionState::Closing:    return "Closing";
        case SessionState::Closed:     return "Closed";
    }
    return "Unknown";
}

Session::Session(std::string id,
                 std::shared_ptr<networking::Connection> conn,
                 notify::ChangeNotifier& notifier,
                 SessionOptions options,
                 SnapshotLoader loader)
    : id_(std::move(id)),
      conn_(std::move(conn)),
      notifier_(notifier),
      options_(options),
      loader_(std::move(loader)) {
    if (options_.max_outbound == 0) options_.max_outbound = 1;
}

Session::~Session() {
    // Destroyed without a transport close (e.g. handshake never finished).
    for (auto& [resource, interest] : interests_) notifier_.unsubscribe(interest.sub);
}

void Session::on_open() {
    if (state_ != SessionState::Connecting) return;

    connected_at_ = last_seen_ = Clock::now();
    state_ = SessionState::Active;

    spdlog::info("[Session {}] active (client {})", id_, conn_->id());
    conn_->send(encode_welcome(id_));
}

void Session::on_message(const std::string& text) {
    if (state_ != SessionState::Active) return;
    last_seen_ = Clock::now();

    std::string error;
    auto frame = parse_client_frame(text, error);
    if (!frame) {
        spdlog::info("[Session {}] protocol violation: {}", id_, error);
        return close(CloseReason::ProtocolViolation);
    }

    switch (frame->type) {
        case FrameType::Heartbeat:
            conn_->send(encode_heartbeat());
            break;
        case FrameType::Subscribe:
            handle_subscribe(frame->resource);
            break;
        case FrameType::Unsubscribe:
            handle_unsubscribe(frame->resource);
            break;
    }
}

void Session::on_drained() { drain(); }

void Session::on_closed(CloseReason reason) {
    if (state_ == SessionState::Closed) return;

    // Peer close or transport failure: nothing left to flush.
    if (!close_reason_) close_reason_ = reason;
    release_subscriptions(false);
    state_ = SessionState::Closed;

    spdlog::info("[Session {}] closed ({})", id_, networking::to_string(*close_reason_));
    finish();
}

void Session::handle_subscribe(const std::string& raw_resource) {
    auto rid = store::ResourceId::parse(raw_resource);
    if (!rid) {
        conn_->send(encode_error("invalid resource"));
        return;
    }
    const std::string& resource = rid->str();

    if (interests_.count(resource)) {
        conn_->send(encode_subscribed(resource));
        return;
    }

    auto sub = notifier_.subscribe(resource);
    interests_.emplace(resource, Interest{sub, 0, static_cast<bool>(loader_)});

    std::weak_ptr<Session> weak = shared_from_this();
    sub->set_ready_handler([weak] {
        if (auto self = weak.lock()) self->schedule_drain();
    });

    conn_->send(encode_subscribed(resource));
    spdlog::debug("[Session {}] subscribed {}", id_, resource);

    if (loader_) {
        loader_(resource, [weak, sub](std::optional<store::StoredDocument> doc) {
            auto self = weak.lock();
            if (!self) return;
            self->conn_->dispatch([self, sub, doc = std::move(doc)]() mutable {
                self->on_snapshot(sub, std::move(doc));
            });
        });
    }
}

void Session::handle_unsubscribe(const std::string& raw_resource) {
    auto rid = store::ResourceId::parse(raw_resource);
    if (!rid) {
        conn_->send(encode_error("invalid resource"));
        return;
    }
    const std::string& resource = rid->str();

    auto it = interests_.find(resource);
    if (it != interests_.end()) {
        notifier_.unsubscribe(it->second.sub);
        interests_.erase(it);

        // Frames for this resource still waiting on the transport go too.
        std::size_t purged = conn_->discard(resource);
        if (purged > 0) spdlog::debug("[Session {}] purged {} queued frame(s) for {}", id_, purged, resource);
    }

    conn_->send(encode_unsubscribed(resource));
}

void Session::on_snapshot(const std::shared_ptr<notify::Subscription>& sub,
                          std::optional<store::StoredDocument> doc) {
    if (state_ != SessionState::Active) return;

    auto it = interests_.find(sub->resource());
    // Unsubscribed (or re-subscribed) while the read was in flight.
    if (it == interests_.end() || it->second.sub != sub) return;

    Interest& interest = it->second;
    interest.snapshot_pending = false;

    // Anything buffered at or below the snapshot revision was committed
    // before the snapshot was read and is dropped by the watermark.
    if (doc && doc->revision > interest.watermark) {
        interest.watermark = doc->revision;
        conn_->send(encode_snapshot(*doc), doc->resource);
    }
    drain();
}

void Session::drain() {
    if (state_ != SessionState::Active) return;

    for (auto& [resource, interest] : interests_) {
        if (interest.sub->state() == notify::SubscriptionState::Disconnected) {
            spdlog::warn("[Session {}] too slow for {}, disconnecting", id_, resource);
            return close(CloseReason::SubscriberDisconnected);
        }
    }

    // One event per resource per pass, so a busy resource cannot starve others.
    bool progressed = true;
    while (progressed && conn_->queued() < options_.max_outbound) {
        progressed = false;
        for (auto& [resource, interest] : interests_) {
            if (conn_->queued() >= options_.max_outbound) break;
            if (interest.snapshot_pending) continue;
            if (auto ev = interest.sub->try_next()) {
                deliver(interest, ev);
                progressed = true;
            }
        }
    }
}

bool Session::deliver(Interest& interest, const notify::ChangeEventPtr& ev) {
    if (ev->revision <= interest.watermark) {
        ++discarded_;
        spdlog::debug("[Session {}] {} revision {} already covered by {}, discarded",
                      id_, ev->resource, ev->revision, interest.watermark);
        return false;
    }
    if (interest.watermark != 0 && ev->revision > interest.watermark + 1) {
        spdlog::debug("[Session {}] {} jumped from revision {} to {}",
                      id_, ev->resource, interest.watermark, ev->revision);
    }

    interest.watermark = ev->revision;
    conn_->send(encode_event(*ev), ev->resource);
    ++delivered_;
    return true;
}

void Session::schedule_drain() {
    // Coalesce bursts of wakeups into one strand hop.
    if (drain_scheduled_.exchange(true)) return;

    std::weak_ptr<Session> weak = shared_from_this();
    conn_->dispatch([weak] {
        if (auto self = weak.lock()) {
            self->drain_scheduled_ = false;
            self->drain();
        }
    });
}

void Session::check_idle(Clock::time_point now) {
    if (state_ != SessionState::Active) return;
    if (now - last_seen_ > options_.idle_timeout) {
        spdlog::info("[Session {}] idle for more than {} ms", id_, options_.idle_timeout.count());
        close(CloseReason::IdleTimeout);
    }
}

void Session::close(CloseReason reason) {
    SessionState s = state_;
    if (s == SessionState::Closing || s == SessionState::Closed) return;

    state_ = SessionState::Closing;
    close_reason_ = reason;

    release_subscriptions(reason != CloseReason::TransportFailure);
    conn_->close(reason);
}

void Session::release_subscriptions(bool flush) {
    for (auto& [resource, interest] : interests_) {
        if (flush && !interest.snapshot_pending) {
            while (auto ev = interest.sub->try_next()) deliver(interest, ev);
        }
        notifier_.unsubscribe(interest.sub);
    }
    interests_.clear();
}

void Session::finish() {
    if (on_finished_) {
        auto handler = std::move(on_finished_);
        handler(*this);
    }
}

store::Revision Session::watermark(const std::string& resource) const {
    auto it = interests_.find(resource);
    return it == interests_.end() ? 0 : it->second.watermark;
}

bool Session::snapshot_pending(const std::string& resource) const {
    auto it = interests_.find(resource);
    return it != interests_.end() && it->second.snapshot_pending;
}

} // namespace livestate::realtime
