#include "SimNetwork.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>

using namespace groupride;
using groupride::race::RaceStatus;
using groupride::race::RacerStatus;
using groupride::session::SessionState;
using sim::SimNetwork;
using sim::SimNode;

namespace {

double ms_between(TimePoint a, TimePoint b) {
    return std::chrono::duration<double, std::milli>(b - a).count();
}

std::size_t metrics_from(const SimNode& n, const RiderId& rider) {
    std::size_t count = 0;
    for (const auto& [at, ev] : n.observed<events::MetricsReceived>()) {
        if (ev.rider_id == rider) ++count;
    }
    return count;
}

// Network time at which a node first saw its race reach `status`.
std::optional<TimePoint> reached(const SimNode& n, RaceStatus status) {
    for (const auto& [at, ev] : n.observed<events::RaceStatusChanged>()) {
        if (ev.race.status == status) return at;
    }
    return std::nullopt;
}

// Streams metric snapshots while in a session; the session rate-limits them.
void ride(SimNode& n, double speed_mps) {
    n.every_step = [speed_mps, distance = 0.0](SimNode& node, TimePoint local) mutable {
        if (node.session.state() != SessionState::Active) return;
        distance += speed_mps * 0.01;
        protocol::RiderMetrics m;
        m.power_watts = static_cast<std::uint16_t>(speed_mps * 20);
        m.cadence_rpm = 90;
        m.speed_kmh = static_cast<float>(speed_mps * 3.6);
        m.distance_m = distance;
        const auto ec = node.session.broadcast_metrics(m, local);
        assert(!ec);
    };
}

// Rides the race at a constant speed from the corrected start, reporting
// position every 50 ms.
void race_at(SimNode& n, double speed_mps) {
    n.every_step = [speed_mps, last = TimePoint{}](SimNode& node, TimePoint local) mutable {
        const auto& r = node.race.race();
        if (!r || r->status != RaceStatus::InProgress) return;
        const auto* me = node.race.participant(node.id());
        if (!me || me->status != RacerStatus::Racing) return;
        if (local - last < Millis(50)) return;
        last = local;

        const double elapsed_s = ms_between(r->scheduled_start, node.race.organizer_time(local)) / 1000.0;
        const auto ec = node.race.update_position(std::min(r->distance_m, speed_mps * elapsed_s), local);
        assert(!ec);
    };
}

} // namespace

int main() {
    printf("=== scenario test suite ===\n");
    log::set_level(log::Level::warn);

    // --- Host, join, ride, leave ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        ride(a, 10.0);
        ride(b, 9.0);

        assert(!a.session.host("watopia", a.local(net.now())));
        const auto sid = a.session.session()->id;

        // B sees the session within one discovery cycle and joins.
        assert(net.run_until([&] { return !b.session.available_sessions().empty(); }, a.config.announce_interval));
        assert(b.session.available_sessions()[0].id == sid);
        assert(!b.session.join(sid, b.local(net.now())));
        assert(net.run_until([&] { return b.session.state() == SessionState::Active; }, a.config.announce_interval));

        net.run_for(Millis(1000));
        assert(metrics_from(a, b.id()) >= 5);
        assert(metrics_from(b, a.id()) >= 5);

        for (const auto& p : a.session.roster()) {
            if (p.rider_id == b.id()) assert(p.last_metrics && p.last_metrics->cadence_rpm == 90);
        }

        const auto left_at = net.now();
        assert(!b.session.leave(b.local(net.now())));
        auto gone = [&] {
            for (const auto& p : a.session.participants()) {
                if (p.rider_id == b.id() && p.left_at) return true;
            }
            return false;
        };
        assert(net.run_until(gone, a.config.liveness_timeout()));
        assert(net.now() - left_at < a.config.heartbeat_interval);

        assert(!a.session.leave(a.local(net.now())));
        assert(a.history.size() == 1);
        const auto& record = a.history[0];
        assert(record.info.id == sid);
        assert(record.participants.size() == 2);
        for (const auto& p : record.participants) assert(p.left_at.has_value());
        assert(std::any_of(record.participants.begin(), record.participants.end(),
                           [&](const session::Participant& p) { return p.rider_id == b.id(); }));
        printf("  [OK] Host, join, exchange metrics, leave\n");
    }

    // --- Synchronized race start across skewed clocks ---
    {
        SimNetwork net;
        auto& a = net.add("alice", Millis(0));
        auto& b = net.add("bob", Millis(250));
        auto& c = net.add("carol", Millis(-400));

        assert(!a.session.host("watopia", a.local(net.now())));
        net.run_for(Millis(50));
        for (auto* n : {&b, &c}) assert(!n->session.join(a.session.session()->id, n->local(net.now())));
        net.run_for(Millis(3000));

        // offsets converge on the configured skews
        auto offset = [](const SimNode& n, const SimNode& peer) { return n.clock.estimate(peer.id())->offset_ms; };
        assert(std::abs(offset(c, b) - 650.0) < 20.0);
        assert(std::abs(offset(a, b) - 250.0) < 20.0);
        assert(std::abs(offset(b, c) + 650.0) < 20.0);

        // B organizes on its own (fast) clock
        race::RaceSpec spec;
        spec.name = "Volcano sprint";
        spec.course_id = "volcano-flat";
        spec.distance_m = 300.0;
        spec.scheduled_start = b.local(net.now()) + Millis(10000);
        spec.countdown = Millis(5000);

        const auto created = net.now();
        assert(!b.race.create(spec, b.local(net.now())));
        net.run_for(Millis(100));
        const auto race_id = b.race.race()->id;
        assert(!a.race.join(race_id, a.local(net.now())));
        assert(!c.race.join(race_id, c.local(net.now())));

        race_at(a, 12.0);
        race_at(b, 10.0);
        race_at(c, 11.0);

        net.run_for(Millis(11000));

        const auto boundary = created + Millis(5000);
        std::vector<TimePoint> starts;
        for (auto* n : {&a, &b, &c}) {
            const auto countdown = reached(*n, RaceStatus::Countdown);
            assert(countdown);
            assert(std::abs(ms_between(boundary, *countdown)) <= 1000.0);
            assert(n->count<events::RaceCountdownTick>() >= 5);

            const auto started = reached(*n, RaceStatus::InProgress);
            assert(started);
            starts.push_back(*started);
        }
        const auto [first, last] = std::minmax_element(starts.begin(), starts.end());
        assert(ms_between(*first, *last) <= 500.0);
        assert(std::abs(ms_between(created + Millis(10000), *first)) <= 500.0);

        // everyone finishes; every node agrees on the result
        assert(net.run_until([&] {
            return reached(a, RaceStatus::Finished) && reached(b, RaceStatus::Finished) &&
                   reached(c, RaceStatus::Finished);
        }, Millis(40000)));

        std::map<RiderId, Millis> times;
        for (auto* n : {&a, &b, &c}) {
            auto ready = n->observed<events::RaceResultsReady>();
            assert(ready.size() == 1);
            const auto& fin = ready[0].second.results.finishers;
            assert(fin.size() == 3);
            assert(fin[0].rider_id == a.id());
            assert(fin[1].rider_id == c.id());
            assert(fin[2].rider_id == b.id());
            assert(ready[0].second.results.dnf.empty());
            for (const auto& f : fin) {
                auto [it, fresh] = times.emplace(f.rider_id, f.finish_time);
                assert(fresh || it->second == f.finish_time);
            }
        }
        // 300 m at 12 m/s: 25 s from the corrected start
        assert(std::abs(times[a.id()].count() - 25000) <= 100);
        printf("  [OK] Race starts together on skewed clocks\n");
    }

    // --- Lossy link: chat still gets through, roster still converges ---
    {
        SimNetwork net(SimNetwork::Link{Millis(5), Millis(20), 0.1}, 3);
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        auto& c = net.add("carol");

        assert(!a.session.host("watopia", a.local(net.now())));
        assert(net.run_until([&] {
            return !b.session.available_sessions().empty() && !c.session.available_sessions().empty();
        }, Millis(5000)));
        const auto sid = a.session.session()->id;
        for (auto* n : {&b, &c}) assert(!n->session.join(sid, n->local(net.now())));
        assert(net.run_until([&] {
            return a.session.members().size() == 3 && b.session.members() == a.session.members() &&
                   c.session.members() == a.session.members();
        }, Millis(6000)));

        for (int i = 0; i < 5; ++i) {
            assert(!b.chat.send("msg " + std::to_string(i), b.local(net.now())));
            net.run_for(Millis(100));
        }
        net.run_for(Millis(12000));

        for (auto* n : {&a, &c}) {
            std::vector<std::string> texts;
            for (const auto& [at, ev] : n->observed<events::ChatReceived>()) texts.push_back(ev.entry.text);
            std::sort(texts.begin(), texts.end());
            assert(std::adjacent_find(texts.begin(), texts.end()) == texts.end());
            assert(texts.size() >= 4 && texts.size() <= 5);
        }
        std::size_t delivered = 0;
        for (const auto& e : b.chat.log()) {
            if (e.status == chat::ChatStatus::Delivered) ++delivered;
        }
        assert(delivered >= 4);
        assert(net.dropped() > 0);
        printf("  [OK] Lossy link\n");
    }

    printf("=== all scenario tests passed ===\n");
    return 0;
}
