#include "clock/ClockOffsetEstimator.h"

#include "core/Log.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace groupride::clock {

namespace {

constexpr const char* kTag = "Clock";

double ms_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

ClockOffsetEstimator::ClockOffsetEstimator(Millis rtt_ceiling, double smoothing)
    : rtt_ceiling_(rtt_ceiling),
      smoothing_(std::clamp(smoothing, 0.0, 1.0)) {}

ClockSample ClockOffsetEstimator::measure(TimePoint probe_sent, TimePoint peer_time,
                                          TimePoint reply_received) {
    ClockSample s;
    s.round_trip_ms = ms_between(probe_sent, reply_received);
    s.offset_ms = ms_between(probe_sent, peer_time) - s.round_trip_ms / 2.0;
    return s;
}

protocol::Pong ClockOffsetEstimator::answer(const protocol::Ping& ping, TimePoint now) {
    return protocol::Pong{ping.timestamp, to_wire_ms(now)};
}

protocol::Ping ClockOffsetEstimator::make_probe(const RiderId& peer, TimePoint now) {
    auto& pending = outstanding_[peer];
    if (pending.size() >= kMaxOutstanding) pending.erase(pending.begin());
    pending.push_back(to_wire_ms(now));
    return protocol::Ping{pending.back()};
}

std::optional<ClockSample> ClockOffsetEstimator::on_pong(const RiderId& peer, const protocol::Pong& pong,
                                                         TimePoint received) {
    auto it = outstanding_.find(peer);
    if (it == outstanding_.end()) return std::nullopt;

    auto& pending = it->second;
    auto match = std::find(pending.begin(), pending.end(), pong.echoed_timestamp);
    if (match == pending.end()) {
        log::debug(kTag) << "unsolicited pong from " << peer;
        return std::nullopt;
    }
    pending.erase(match);

    return record(peer, from_wire_ms(pong.echoed_timestamp), from_wire_ms(pong.local_time), received);
}

std::optional<ClockSample> ClockOffsetEstimator::record(const RiderId& peer, TimePoint probe_sent,
                                                        TimePoint peer_time, TimePoint reply_received) {
    const auto s = measure(probe_sent, peer_time, reply_received);

    if (s.round_trip_ms < 0.0 || s.round_trip_ms > static_cast<double>(rtt_ceiling_.count())) {
        log::debug(kTag) << "discarding sample from " << peer << ", rtt " << s.round_trip_ms << " ms";
        return std::nullopt;
    }

    auto& est = estimates_[peer];
    if (est.samples == 0) {
        est.offset_ms = s.offset_ms;
        est.round_trip_ms = s.round_trip_ms;
    } else {
        est.offset_ms += smoothing_ * (s.offset_ms - est.offset_ms);
        est.round_trip_ms += smoothing_ * (s.round_trip_ms - est.round_trip_ms);
    }
    ++est.samples;
    est.updated_at = reply_received;
    return s;
}

std::optional<ClockEstimate> ClockOffsetEstimator::estimate(const RiderId& peer) const {
    auto it = estimates_.find(peer);
    if (it == estimates_.end()) return std::nullopt;
    return it->second;
}

TimePoint ClockOffsetEstimator::to_peer_time(const RiderId& peer, TimePoint local) const {
    auto est = estimate(peer);
    if (!est) return local;
    auto shift = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(est->offset_ms));
    return local + shift;
}

void ClockOffsetEstimator::expire_probes(TimePoint now) {
    const auto cutoff = to_wire_ms(now - rtt_ceiling_);
    for (auto& [peer, pending] : outstanding_) {
        pending.erase(std::remove_if(pending.begin(), pending.end(),
                                     [cutoff](std::int64_t sent) { return sent < cutoff; }),
                      pending.end());
    }
}

void ClockOffsetEstimator::forget(const RiderId& peer) {
    outstanding_.erase(peer);
    estimates_.erase(peer);
}

} // namespace groupride::clock
