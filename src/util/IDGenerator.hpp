#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace livestate::util {

// Prefixed ULIDs ("conn-01J9Z...") for connection and request ids.
// 48-bit millisecond timestamp + 80 random bits, Crockford base32, 26 chars.
// Ids minted in the same millisecond increment the random part so they
// still sort in creation order.
class IDGenerator {
public:
    enum class Kind { Connection, Request };

    IDGenerator() : rng_(std::random_device{}()) {}

    std::string make(Kind kind) { return std::string(prefix_of(kind)) + "-" + next_ulid(); }

    std::string connectionID() { return make(Kind::Connection); }
    std::string requestID()    { return make(Kind::Request); }

    std::string next_ulid() {
        const std::uint64_t ts = now_ms();

        std::uint64_t hi;  // top 16 of the 80 random bits
        std::uint64_t lo;  // low 64 random bits
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts != last_ts_) {
                last_ts_ = ts;
                rand_hi_ = rng_() & 0xFFFF;
                rand_lo_ = rng_();
            } else if (++rand_lo_ == 0) {
                rand_hi_ = (rand_hi_ + 1) & 0xFFFF;
            }
            hi = rand_hi_;
            lo = rand_lo_;
        }

        // 128 bits as (ts:48 | hi:16) and lo:64, emitted 5 bits at a time
        // from the most significant end; 26 * 5 = 130, top 2 bits are zero.
        const std::uint64_t upper = (ts << 16) | hi;
        std::string out(26, '0');
        for (int i = 25; i >= 0; --i) {
            const int bit = (25 - i) * 5;  // offset from least significant end
            std::uint32_t v;
            if (bit + 5 <= 64) {
                v = static_cast<std::uint32_t>((lo >> bit) & 0x1F);
            } else if (bit < 64) {
                v = static_cast<std::uint32_t>(((lo >> bit) | (upper << (64 - bit))) & 0x1F);
            } else {
                v = static_cast<std::uint32_t>((upper >> (bit - 64)) & 0x1F);
            }
            out[static_cast<std::size_t>(i)] = kAlphabet[v];
        }
        return out;
    }

private:
    static constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Connection: return "conn";
            case Kind::Request:    return "req";
        }
        return "id";
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count()) & 0xFFFFFFFFFFFFull;
    }

private:
    std::mutex mu_;
    std::mt19937_64 rng_;
    std::uint64_t last_ts_ = 0;
    std::uint64_t rand_hi_ = 0;
    std::uint64_t rand_lo_ = 0;
};

} // namespace livestate::util
