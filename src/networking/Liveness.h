#pragma once

#include "core/Types.h"
#include "protocol/Message.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

namespace groupride::networking {

// Per-peer heartbeat bookkeeping. Any received message counts as a heartbeat.
// A peer is disconnected once it has been silent for interval * miss_threshold.
class LivenessTracker {
public:
    LivenessTracker(Millis interval, int miss_threshold);

    enum class Touch { New, Alive, Recovered };

    Touch touch(const RiderId& peer, TimePoint now);

    // Peers that crossed the timeout since the last sweep. Each disconnect is
    // reported once; the peer comes back through touch() -> Recovered.
    std::vector<RiderId> sweep(TimePoint now);

    bool connected(const RiderId& peer) const;
    void forget(const RiderId& peer);

    Millis timeout() const noexcept { return timeout_; }

private:
    struct Entry {
        TimePoint last_seen;
        bool connected = true;
    };

    Millis timeout_;
    std::unordered_map<RiderId, Entry> peers_;
};

// "Latest value wins" filter for unordered snapshot traffic: a packet whose
// sent_at is not newer than the last applied one for (peer, kind) is stale.
class StalenessFilter {
public:
    bool accept(const RiderId& peer, protocol::MessageTag kind, std::int64_t sent_at);
    void forget(const RiderId& peer);

private:
    std::map<std::pair<RiderId, protocol::MessageTag>, std::int64_t> last_applied_;
};

// Minimum spacing between sends; used to cap metric snapshots per second.
class RateLimiter {
public:
    explicit RateLimiter(Millis min_interval) : min_interval_(min_interval) {}

    bool allow(TimePoint now);

private:
    Millis min_interval_;
    TimePoint last_{};
    bool primed_ = false;
};

} // namespace groupride::networking
