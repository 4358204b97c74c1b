#pragma once

#include <boost/asio/ip/udp.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace groupride {

using RiderId   = std::string;  // "rider-<ulid>"
using SessionId = std::string;  // "session-<ulid>"
using RaceId    = std::string;  // "race-<ulid>"

using Endpoint = boost::asio::ip::udp::endpoint;

// All component cores take "now" as an argument; the engine feeds Clock::now().
// Wall time is used so instants can travel on the wire and be compared after
// clock-offset correction.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

inline std::int64_t to_wire_ms(TimePoint t) noexcept {
    return std::chrono::duration_cast<Millis>(t.time_since_epoch()).count();
}

inline TimePoint from_wire_ms(std::int64_t ms) noexcept {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(Millis(ms)));
}

} // namespace groupride
