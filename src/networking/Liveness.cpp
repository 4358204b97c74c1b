#include "networking/Liveness.h"

namespace groupride::networking {

LivenessTracker::LivenessTracker(Millis interval, int miss_threshold)
    : timeout_(interval * miss_threshold) {}

LivenessTracker::Touch LivenessTracker::touch(const RiderId& peer, TimePoint now) {
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
        peers_.emplace(peer, Entry{now, true});
        return Touch::New;
    }

    auto& e = it->second;
    if (now > e.last_seen) e.last_seen = now;
    if (!e.connected) {
        e.connected = true;
        return Touch::Recovered;
    }
    return Touch::Alive;
}

std::vector<RiderId> LivenessTracker::sweep(TimePoint now) {
    std::vector<RiderId> lost;
    for (auto& [id, e] : peers_) {
        if (e.connected && now - e.last_seen >= timeout_) {
            e.connected = false;
            lost.push_back(id);
        }
    }
    return lost;
}

bool LivenessTracker::connected(const RiderId& peer) const {
    auto it = peers_.find(peer);
    return it != peers_.end() && it->second.connected;
}

void LivenessTracker::forget(const RiderId& peer) { peers_.erase(peer); }

bool StalenessFilter::accept(const RiderId& peer, protocol::MessageTag kind, std::int64_t sent_at) {
    auto key = std::make_pair(peer, kind);
    auto it = last_applied_.find(key);
    if (it != last_applied_.end() && sent_at <= it->second) return false;
    last_applied_[key] = sent_at;
    return true;
}

void StalenessFilter::forget(const RiderId& peer) {
    for (auto it = last_applied_.begin(); it != last_applied_.end();) {
        if (it->first.first == peer) {
            it = last_applied_.erase(it);
        } else {
            ++it;
        }
    }
}

bool RateLimiter::allow(TimePoint now) {
    if (primed_ && now - last_ < min_interval_) return false;
    primed_ = true;
    last_ = now;
    return true;
}

} // namespace groupride::networking
