#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace groupride {

// Prefixed ULIDs: 48-bit millisecond timestamp + 80 random bits, Crockford
// base32 (26 chars). Ids minted within the same millisecond increment the
// random part so they stay sortable.
class IdGenerator {
public:
    enum class Kind { Rider, Session, Race };

    IdGenerator() : rng_(seed()) {}

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + next_ulid();
    }

    std::string riderID()   { return make(Kind::Rider); }
    std::string sessionID() { return make(Kind::Session); }
    std::string raceID()    { return make(Kind::Race); }

private:
    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Rider:   return "rider";
            case Kind::Session: return "session";
            case Kind::Race:    return "race";
        }
        return "id";
    }

    std::string next_ulid() {
        using namespace std::chrono;
        const auto ts_ms = static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());

        std::array<std::uint8_t, 16> bytes{};
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts_ms != last_ts_ms_) {
                last_ts_ms_ = ts_ms;
                rand_hi_ = static_cast<std::uint16_t>(rng_() & 0xFFFF);
                rand_lo_ = rng_();
            } else if (++rand_lo_ == 0) {
                ++rand_hi_;
            }

            for (int i = 0; i < 6; ++i) {
                bytes[static_cast<std::size_t>(i)] =
                    static_cast<std::uint8_t>(ts_ms >> (8 * (5 - i)));
            }
            bytes[6] = static_cast<std::uint8_t>(rand_hi_ >> 8);
            bytes[7] = static_cast<std::uint8_t>(rand_hi_);
            for (int i = 0; i < 8; ++i) {
                bytes[static_cast<std::size_t>(8 + i)] =
                    static_cast<std::uint8_t>(rand_lo_ >> (8 * (7 - i)));
            }
        }
        return encode(bytes);
    }

    // 128 bits read as a 130-bit big-endian number with two leading zero bits.
    static std::string encode(const std::array<std::uint8_t, 16>& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out(26, '0');
        std::uint32_t acc = 0;
        int bits = 2;  // the implicit leading zeros
        std::size_t pos = 0;

        for (std::uint8_t byte : bytes) {
            acc = (acc << 8) | byte;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                out[pos++] = alphabet[(acc >> bits) & 0x1F];
            }
            acc &= (1u << bits) - 1u;
        }
        return out;
    }

    static std::mt19937_64 seed() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::steady_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

private:
    std::mt19937_64 rng_;

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    std::uint16_t rand_hi_ = 0;
    std::uint64_t rand_lo_ = 0;
};

} // namespace groupride
