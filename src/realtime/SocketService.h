#pragma once

#include "networking/Connection.h"
#include "notify/ChangeNotifier.h"
#include "realtime/Session.h"
#include "store/StoreGateway.h"
#include "util/IDGenerator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace livestate::realtime {

struct SocketServiceOptions {
    SessionOptions session;
    std::chrono::milliseconds sweep_interval{1000};
};

// Owns the live sessions of the socket process: creates one per accepted
// connection, sweeps idle ones and closes them all on shutdown. While
// running it also releases revisions the notifier held back for reordering
// once their window has passed.
class SocketService {
public:
    // `gateway` serves subscribe snapshots; nullptr disables them.
    SocketService(boost::asio::io_context& ioc,
                  boost::asio::thread_pool& workers,
                  notify::ChangeNotifier& notifier,
                  store::StoreGateway* gateway,
                  SocketServiceOptions options);
    ~SocketService();

    SocketService(const SocketService&) = delete;
    SocketService& operator=(const SocketService&) = delete;

    // WebSocketServer handler factory.
    std::shared_ptr<networking::ConnectionHandler> accept(std::shared_ptr<networking::Connection> conn);

    void start();
    void stop();

    // Posts an idle check to every session.
    void sweep();

    std::size_t sessions() const;

private:
    void arm_sweep();
    void arm_reorder_flush();
    void load_snapshot(const std::string& resource,
                       std::function<void(std::optional<store::StoredDocument>)> done);

    boost::asio::io_context& ioc_;
    boost::asio::thread_pool& workers_;
    notify::ChangeNotifier& notifier_;
    store::StoreGateway* gateway_;
    SocketServiceOptions options_;

    util::IDGenerator ids_;
    boost::asio::steady_timer sweep_timer_;
    boost::asio::steady_timer reorder_timer_;
    std::atomic<bool> running_{false};

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::weak_ptr<Session>> sessions_;
};

} // namespace livestate::realtime
