#include "realtime/SocketService.h"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace livestate::realtime {

namespace asio = boost::asio;

SocketService::SocketService(asio::io_context& ioc,
                             asio::thread_pool& workers,
                             notify::ChangeNotifier& notifier,
                             store::StoreGateway* gateway,
                             SocketServiceOptions options)
    : ioc_(ioc),
      workers_(workers),
      notifier_(notifier),
      gateway_(gateway),
      options_(options),
      sweep_timer_(ioc),
      reorder_timer_(ioc) {}

SocketService::~SocketService() = default;

std::shared_ptr<networking::ConnectionHandler> SocketService::accept(std::shared_ptr<networking::Connection> conn) {
    SnapshotLoader loader;
    if (gateway_) {
        loader = [this](const std::string& resource,
                        std::function<void(std::optional<store::StoredDocument>)> done) {
            load_snapshot(resource, std::move(done));
        };
    }

    auto session = std::make_shared<Session>(ids_.connectionID(), std::move(conn), notifier_,
                                             options_.session, std::move(loader));
    session->set_finished_handler([this](const Session& s) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(s.id());
    });

    {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_[session->id()] = session;
    }
    return session;
}

void SocketService::start() {
    running_ = true;
    arm_sweep();
    arm_reorder_flush();
}

void SocketService::stop() {
    running_ = false;
    sweep_timer_.cancel();
    reorder_timer_.cancel();

    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, weak] : sessions_) {
            if (auto s = weak.lock()) live.push_back(std::move(s));
        }
    }
    spdlog::info("[SocketService] closing {} session(s)", live.size());
    for (auto& s : live) {
        s->connection().dispatch([s] { s->close(networking::CloseReason::ServerShutdown); });
    }
}

void SocketService::sweep() {
    std::vector<std::shared_ptr<Session>> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (auto s = it->second.lock()) {
                live.push_back(std::move(s));
                ++it;
            } else {
                it = sessions_.erase(it);
            }
        }
    }

    const auto now = Session::Clock::now();
    for (auto& s : live) {
        s->connection().dispatch([s, now] { s->check_idle(now); });
    }
}

std::size_t SocketService::sessions() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

void SocketService::arm_sweep() {
    if (!running_) return;
    sweep_timer_.expires_after(options_.sweep_interval);
    sweep_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || !running_) return;
        sweep();
        arm_sweep();
    });
}

void SocketService::arm_reorder_flush() {
    const auto window = notifier_.options().reorder_window;
    if (!running_ || window.count() <= 0) return;

    reorder_timer_.expires_after(std::max(window / 2, std::chrono::milliseconds(10)));
    reorder_timer_.async_wait([this](boost::system::error_code ec) {
        if (ec || !running_) return;
        notifier_.flush_expired();
        arm_reorder_flush();
    });
}

void SocketService::load_snapshot(const std::string& resource,
                                  std::function<void(std::optional<store::StoredDocument>)> done) {
    asio::post(workers_, [this, resource, done = std::move(done)] {
        boost::system::error_code ec;
        store::StoredDocument doc = gateway_->read(resource, ec);
        if (ec) {
            if (ec != store::errc::not_found) {
                spdlog::warn("[SocketService] snapshot of {} unavailable: {}", resource, ec.message());
            }
            return done(std::nullopt);
        }
        done(std::move(doc));
    });
}

} // namespace livestate::realtime
