#pragma once

#include "core/Types.h"
#include "protocol/Message.h"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace groupride::clock {

struct ClockSample {
    double offset_ms = 0.0;      // peer clock minus local clock
    double round_trip_ms = 0.0;
};

struct ClockEstimate {
    double offset_ms = 0.0;      // smoothed
    double round_trip_ms = 0.0;  // smoothed
    int samples = 0;
    TimePoint updated_at{};
};

// NTP-style offset estimation from Ping/Pong exchanges, assuming symmetric
// latency, smoothed with an exponential moving average per peer.
class ClockOffsetEstimator {
public:
    ClockOffsetEstimator(Millis rtt_ceiling, double smoothing);

    static ClockSample measure(TimePoint probe_sent, TimePoint peer_time, TimePoint reply_received);

    // Answer to a peer's probe.
    static protocol::Pong answer(const protocol::Ping& ping, TimePoint now);

    // Starts a probe towards a peer and remembers it as outstanding.
    protocol::Ping make_probe(const RiderId& peer, TimePoint now);

    // Matches a reply to its outstanding probe and applies it.
    // Unsolicited, expired or over-ceiling replies are discarded (nullopt).
    std::optional<ClockSample> on_pong(const RiderId& peer, const protocol::Pong& pong, TimePoint received);

    // Applies one exchange. Returns the raw sample, or nullopt when the
    // round trip exceeds the ceiling and the sample is thrown away.
    std::optional<ClockSample> record(const RiderId& peer, TimePoint probe_sent,
                                      TimePoint peer_time, TimePoint reply_received);

    std::optional<ClockEstimate> estimate(const RiderId& peer) const;

    // Local instant expressed on the peer's clock (local + offset).
    TimePoint to_peer_time(const RiderId& peer, TimePoint local) const;

    // Drops probes older than the ceiling; they resolve as lost.
    void expire_probes(TimePoint now);

    void forget(const RiderId& peer);

private:
    static constexpr std::size_t kMaxOutstanding = 8;

    Millis rtt_ceiling_;
    double smoothing_;
    std::unordered_map<RiderId, std::vector<std::int64_t>> outstanding_;
    std::unordered_map<RiderId, ClockEstimate> estimates_;
};

} // namespace groupride::clock
