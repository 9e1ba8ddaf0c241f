#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace livestate::config {

enum class Mode { Http, Socket, All };
enum class StoreBackend { Couch, Memory };
enum class NotifyMode { Feed, Local };

const char* to_string(Mode m) noexcept;

struct Config {
    Mode mode = Mode::All;

    std::string http_host = "0.0.0.0";
    std::uint16_t http_port = 3000;
    std::string socket_host = "0.0.0.0";
    std::uint16_t socket_port = 5000;

    StoreBackend store = StoreBackend::Couch;
    std::string store_host = "store";
    std::uint16_t store_port = 5984;
    std::string store_db = "livestate";
    std::string store_user;
    std::string store_password;
    std::chrono::milliseconds store_timeout{2000};
    std::size_t store_pool = 8;

    int retry_attempts = 3;
    std::chrono::milliseconds retry_base{50};
    std::chrono::milliseconds retry_max{1000};

    NotifyMode notify = NotifyMode::Feed;
    std::chrono::milliseconds feed_wait{10000};
    std::chrono::milliseconds reorder_window{200};

    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds flush_timeout{3000};
    std::size_t subscriber_buffer = 256;
    std::size_t max_outbound = 64;
    std::size_t max_body_bytes = 1024 * 1024;

    unsigned threads = 0;  // 0: hardware concurrency
    std::string log_level = "info";

    bool runs_http() const noexcept { return mode != Mode::Socket; }
    bool runs_socket() const noexcept { return mode != Mode::Http; }

    void dump(std::ostream& os) const;
};

struct ParseResult {
    Config config;
    bool ok = true;
    int exit_code = 0;  // meaningful when !ok (0 for --help)
};

// Command line with LIVESTATE_* environment fallbacks. Parse errors are
// printed to `err`, help to `out`.
ParseResult parse(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace livestate::config
