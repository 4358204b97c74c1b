#include "SimNetwork.hpp"

#include "core/Error.h"

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <memory>

using namespace groupride;
using groupride::race::RaceCoordinator;
using groupride::race::RaceSpec;
using groupride::race::RaceStatus;
using groupride::race::RacerStatus;
using groupride::session::SessionState;
using sim::SimNetwork;
using sim::SimNode;

namespace {

void form_session(SimNetwork& net, std::vector<SimNode*> nodes) {
    auto& host = *nodes[0];
    assert(!host.session.host("watopia", host.local(net.now())));
    net.run_for(Millis(50));
    for (std::size_t i = 1; i < nodes.size(); ++i) {
        assert(!nodes[i]->session.join(host.session.session()->id, nodes[i]->local(net.now())));
    }
    const bool ok = net.run_until([&] {
        return std::all_of(nodes.begin(), nodes.end(), [&](SimNode* n) {
            return n->session.state() == SessionState::Active && n->session.members().size() == nodes.size();
        });
    }, Millis(2000));
    assert(ok);
}

RaceSpec spec_at(TimePoint start, Millis countdown, double distance = 10000.0) {
    RaceSpec s;
    s.name = "Sprint";
    s.course_id = "volcano-flat";
    s.distance_m = distance;
    s.scheduled_start = start;
    s.countdown = countdown;
    return s;
}

std::vector<events::RacerStatusChanged> racer_events(const SimNode& n, const RiderId& rider) {
    std::vector<events::RacerStatusChanged> out;
    for (const auto& [at, ev] : n.observed<events::RacerStatusChanged>()) {
        if (ev.rider_id == rider) out.push_back(ev);
    }
    return out;
}

// An organizer or member coordinator driven by hand.
struct Hand {
    IdGenerator ids;
    Config cfg;
    sim::RecordingOutbox out;
    Rider me;
    RaceCoordinator race{me, cfg, out, ids};
    std::vector<events::Event> events;
    TimePoint t0 = sim::epoch();

    explicit Hand(const RiderId& id = "rider-a") : me(id, id.substr(6)) {
        race.set_on_event([this](const events::Event& e) { events.push_back(e); });
        race.set_session(SessionId("session-1"));
    }

    template <class T>
    protocol::Message from(const RiderId& rider, Millis at, T body) const {
        return protocol::make_message(rider, t0 + at, std::move(body));
    }

    template <class T>
    std::vector<T> seen() const {
        std::vector<T> v;
        for (const auto& e : events) {
            if (auto* x = std::get_if<T>(&e)) v.push_back(*x);
        }
        return v;
    }
};

} // namespace

int main() {
    printf("=== race test suite ===\n");
    log::set_level(log::Level::error);

    // --- Error cases ---
    {
        IdGenerator ids;
        Config cfg;
        sim::RecordingOutbox out;
        Rider me(RiderId("rider-a"), "alice");
        RaceCoordinator race(me, cfg, out, ids);
        const auto t0 = sim::epoch();

        assert(race.create(spec_at(t0 + Millis(10000), Millis(5000)), t0) == make_error_code(errc::not_in_session));
        assert(race.cancel(t0) == make_error_code(errc::no_race));
        assert(race.end(t0) == make_error_code(errc::no_race));

        race.set_session(SessionId("session-1"));
        assert(race.create(spec_at(t0 - Millis(1), Millis(5000)), t0) == make_error_code(errc::invalid_schedule));
        assert(race.create(spec_at(t0 + Millis(10000), Millis(5000), 0.0), t0) ==
               make_error_code(errc::invalid_schedule));

        assert(!race.create(spec_at(t0 + Millis(10000), Millis(5000)), t0));
        assert(race.race()->organizer == "rider-a");
        assert(race.race()->status == RaceStatus::Scheduled);
        assert(race.participant("rider-a")->status == RacerStatus::Registered);
        assert(out.bodies<protocol::RaceAnnounce>().size() == 1);

        assert(race.create(spec_at(t0 + Millis(20000), Millis(5000)), t0) == make_error_code(errc::race_exists));
        assert(race.join("race-other", t0) == make_error_code(errc::race_not_found));
        assert(race.join(race.race()->id, t0) == make_error_code(errc::already_registered));
        assert(race.end(t0) == make_error_code(errc::invalid_transition));

        assert(!race.cancel(t0 + Millis(100)));
        assert(race.race()->status == RaceStatus::Cancelled);
        auto ctl = out.bodies<protocol::RaceControl>();
        assert(ctl.size() == 1 && ctl[0].action == protocol::RaceAction::Cancel);

        // a finished race makes room for the next one
        assert(!race.create(spec_at(t0 + Millis(20000), Millis(5000)), t0 + Millis(200)));
        printf("  [OK] Race operation errors\n");
    }

    // --- Member side: announce, registration limits, organizer-only controls ---
    {
        Hand member("rider-m");
        member.cfg.max_racers = 2;

        protocol::RaceAnnounce a;
        a.race_id = "race-1";
        a.name = "Sprint";
        a.distance_m = 5000;
        a.scheduled_start = to_wire_ms(member.t0 + Millis(30000));
        a.countdown_ms = 10000;
        a.status = static_cast<std::uint8_t>(RaceStatus::Scheduled);
        a.roster = {"rider-o", "rider-x"};
        member.race.handle(member.from("rider-o", Millis(0), a), member.t0);

        assert(member.race.race()->id == "race-1");
        assert(member.race.race()->organizer == "rider-o");
        assert(member.race.race()->countdown == Millis(10000));
        assert(member.race.participant("rider-x"));
        assert(member.race.join("race-1", member.t0) == make_error_code(errc::race_full));
        assert(member.race.cancel(member.t0) == make_error_code(errc::not_organizer));
        assert(member.race.end(member.t0) == make_error_code(errc::not_organizer));

        // an announce from anyone else does not replace the open race
        a.race_id = "race-2";
        member.race.handle(member.from("rider-x", Millis(10), a), member.t0 + Millis(10));
        assert(member.race.race()->id == "race-1");

        member.race.handle(member.from("rider-o", Millis(20),
                                       protocol::RaceControl{"race-1", protocol::RaceAction::Cancel}),
                           member.t0 + Millis(20));
        assert(member.race.race()->status == RaceStatus::Cancelled);
        printf("  [OK] Member view of a race\n");
    }

    // --- Late registration is refused ---
    {
        Hand member("rider-m");
        protocol::RaceAnnounce a;
        a.race_id = "race-1";
        a.distance_m = 5000;
        a.scheduled_start = to_wire_ms(member.t0 + Millis(3000));
        a.countdown_ms = 5000;
        member.race.handle(member.from("rider-o", Millis(0), a), member.t0);
        member.race.tick(member.t0 + Millis(100));
        assert(member.race.race()->status == RaceStatus::Countdown);
        assert(member.race.join("race-1", member.t0 + Millis(100)) == make_error_code(errc::race_already_started));
        printf("  [OK] Registration closes at countdown\n");
    }

    // --- Finish order, standings, results ---
    {
        Hand org;
        const auto start = org.t0 + Millis(10000);
        assert(!org.race.create(spec_at(start, Millis(5000), 1000.0), org.t0));
        const auto id = org.race.race()->id;

        org.race.handle(org.from("rider-b", Millis(100), protocol::RaceJoin{id, "rider-b", "bob"}), org.t0 + Millis(100));
        org.race.handle(org.from("rider-c", Millis(200), protocol::RaceJoin{id, "rider-c", "carol"}), org.t0 + Millis(200));
        assert(org.out.bodies<protocol::RaceAnnounce>().back().roster.size() == 3);

        org.race.tick(org.t0 + Millis(5000));
        assert(org.race.race()->status == RaceStatus::Countdown);
        assert(!org.seen<events::RaceCountdownTick>().empty());
        assert(org.out.bodies<protocol::RaceCountdown>().back().start_at == to_wire_ms(start));

        org.race.tick(start);
        assert(org.race.race()->status == RaceStatus::InProgress);
        for (const char* r : {"rider-a", "rider-b", "rider-c"}) {
            assert(org.race.participant(r)->status == RacerStatus::Racing);
        }

        org.race.handle(org.from("rider-b", Millis(20000), protocol::RacePosition{id, 500.0, 10000}),
                        start + Millis(10000));
        org.race.handle(org.from("rider-c", Millis(20000), protocol::RacePosition{id, 800.0, 10000}),
                        start + Millis(10000));
        // stale position snapshot
        org.race.handle(org.from("rider-c", Millis(19000), protocol::RacePosition{id, 100.0, 9000}),
                        start + Millis(10000));
        auto st = org.race.standings();
        assert(st.size() == 3);
        assert(st[0].rider_id == "rider-c" && st[0].distance_m == 800.0);
        assert(st[1].rider_id == "rider-b");
        assert(st[2].rider_id == "rider-a");

        org.race.handle(org.from("rider-c", Millis(70000), protocol::RaceFinish{id, 60000}), start + Millis(60000));
        org.race.handle(org.from("rider-b", Millis(70000), protocol::RaceFinish{id, 59000}), start + Millis(60000));
        assert(org.race.participant("rider-b")->finish_rank == 1);
        assert(org.race.participant("rider-c")->finish_rank == 2);
        assert(org.race.race()->status == RaceStatus::InProgress);

        assert(!org.race.update_position(400.0, start + Millis(65000)));
        assert(org.race.participant("rider-a")->status == RacerStatus::Racing);
        assert(!org.race.update_position(1000.0, start + Millis(70000)));
        assert(org.race.participant("rider-a")->finish_time == Millis(70000));
        assert(org.race.participant("rider-a")->finish_rank == 3);
        assert(org.out.bodies<protocol::RaceFinish>().size() == 1);

        assert(org.race.race()->status == RaceStatus::Finished);
        auto results = org.seen<events::RaceResultsReady>();
        assert(results.size() == 1);
        const auto& fin = results[0].results.finishers;
        assert(fin.size() == 3);
        assert(fin[0].rider_id == "rider-b" && fin[0].gap_to_winner == Millis(0));
        assert(fin[1].rider_id == "rider-c" && fin[1].gap_to_winner == Millis(1000));
        assert(fin[2].rider_id == "rider-a" && fin[2].gap_to_winner == Millis(11000));
        assert(results[0].results.dnf.empty());
        printf("  [OK] Finish order and results\n");
    }

    // --- Organizer ends the race early ---
    {
        Hand org;
        const auto start = org.t0 + Millis(10000);
        assert(!org.race.create(spec_at(start, Millis(5000), 1000.0), org.t0));
        const auto id = org.race.race()->id;
        org.race.handle(org.from("rider-b", Millis(100), protocol::RaceJoin{id, "rider-b", "bob"}), org.t0 + Millis(100));
        org.race.tick(start);

        org.race.handle(org.from("rider-b", Millis(20000), protocol::RaceFinish{id, 9000}), start + Millis(9000));
        assert(!org.race.end(start + Millis(20000)));
        assert(org.race.race()->status == RaceStatus::Finished);
        assert(org.race.participant("rider-a")->status == RacerStatus::Dnf);

        auto results = org.seen<events::RaceResultsReady>();
        assert(results.size() == 1);
        assert(results[0].results.finishers.size() == 1);
        assert(results[0].results.dnf == std::vector<RiderId>{"rider-a"});
        assert(org.out.bodies<protocol::RaceControl>().back().action == protocol::RaceAction::End);
        printf("  [OK] Forced end marks the rest DNF\n");
    }

    // --- Leaving the session cancels an open race ---
    {
        Hand org;
        assert(!org.race.create(spec_at(org.t0 + Millis(10000), Millis(5000)), org.t0));
        org.race.set_session(std::nullopt);
        assert(org.race.race()->status == RaceStatus::Cancelled);
        assert(org.race.create(spec_at(org.t0 + Millis(10000), Millis(5000)), org.t0) ==
               make_error_code(errc::not_in_session));
        printf("  [OK] Session close cancels the race\n");
    }

    // --- Silent racer: pending disconnect, then DNF after the grace period ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        auto& c = net.add("carol");
        form_session(net, {&a, &b, &c});

        assert(!a.race.create(spec_at(a.local(net.now()) + Millis(3000), Millis(2000)), a.local(net.now())));
        net.run_for(Millis(100));
        const auto race_id = a.race.race()->id;
        assert(b.race.race() && b.race.race()->id == race_id);
        assert(!b.race.join(race_id, b.local(net.now())));
        assert(!c.race.join(race_id, c.local(net.now())));

        assert(net.run_until([&] { return a.race.race()->status == RaceStatus::InProgress; }, Millis(4000)));
        net.run_for(Millis(100));
        assert(a.race.participant(b.id())->status == RacerStatus::Racing);

        net.set_online(b, false);
        net.run_for(Millis(59000));
        assert(a.race.participant(b.id())->status == RacerStatus::Racing);
        assert(a.race.participant(c.id())->status == RacerStatus::Racing);
        auto seen = racer_events(a, b.id());
        assert(seen.back().pending_disconnect);
        const auto st = a.race.standings();
        auto bs = std::find_if(st.begin(), st.end(), [&](const race::Standing& s) { return s.rider_id == b.id(); });
        assert(bs != st.end() && bs->pending_disconnect);

        net.run_for(Millis(2000));
        assert(a.race.participant(b.id())->status == RacerStatus::Dnf);
        auto dnf = [&] {
            std::size_t n = 0;
            for (const auto& e : racer_events(a, b.id())) {
                if (e.status == RacerStatus::Dnf) ++n;
            }
            return n;
        };
        assert(dnf() == 1);

        // the DNF'd rider comes back and reports a finish: still DNF
        net.set_online(b, true);
        net.run_for(Millis(100));
        assert(!b.race.update_position(10000.0, b.local(net.now())));
        net.run_for(Millis(500));
        assert(a.race.participant(b.id())->status == RacerStatus::Dnf);
        assert(dnf() == 1);
        assert(a.race.participant(c.id())->status == RacerStatus::Racing);
        printf("  [OK] Silent racer goes DNF once after the grace period\n");
    }

    // --- Silent racer who comes back inside the grace period keeps racing ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        form_session(net, {&a, &b});

        assert(!a.race.create(spec_at(a.local(net.now()) + Millis(3000), Millis(2000)), a.local(net.now())));
        net.run_for(Millis(100));
        assert(!b.race.join(a.race.race()->id, b.local(net.now())));
        assert(net.run_until([&] { return a.race.race()->status == RaceStatus::InProgress; }, Millis(4000)));
        net.run_for(Millis(100));

        net.set_online(b, false);
        net.run_for(Millis(59000));
        assert(racer_events(a, b.id()).back().pending_disconnect);

        net.set_online(b, true);
        net.run_for(Millis(3000));
        assert(a.race.participant(b.id())->status == RacerStatus::Racing);
        assert(!a.race.participant(b.id())->disconnected_since);
        assert(!racer_events(a, b.id()).back().pending_disconnect);
        const auto st = a.race.standings();
        auto bs = std::find_if(st.begin(), st.end(), [&](const race::Standing& s) { return s.rider_id == b.id(); });
        assert(bs != st.end() && !bs->pending_disconnect);
        printf("  [OK] Racer back within the grace period resumes\n");
    }

    // --- A lost RaceJoin is sent again when the roster leaves us out ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        form_session(net, {&a, &b});

        auto joins = std::make_shared<int>(0);
        net.drop_if([joins, &b](const SimNode& from, const SimNode&, const protocol::Message& msg) {
            return from.id() == b.id() && msg.as<protocol::RaceJoin>() && (*joins)++ == 0;
        });

        assert(!a.race.create(spec_at(a.local(net.now()) + Millis(5000), Millis(2000)), a.local(net.now())));
        net.run_for(Millis(100));
        const auto race_id = a.race.race()->id;
        assert(!b.race.join(race_id, b.local(net.now())));
        net.run_for(Millis(200));
        assert(!a.race.participant(b.id()));

        // the next periodic announce omits bob, who registers again
        assert(net.run_until([&] { return a.race.participant(b.id()) != nullptr; }, Millis(1500)));
        assert(*joins == 2);

        assert(net.run_until([&] { return a.race.race()->status == RaceStatus::InProgress; }, Millis(6000)));
        net.run_for(Millis(100));
        assert(a.race.participant(b.id())->status == RacerStatus::Racing);
        assert(b.race.participant(a.id())->status == RacerStatus::Racing);
        // listed on every later announce, so no further joins
        assert(*joins == 2);
        printf("  [OK] Lost registration recovered from the announce roster\n");
    }

    // --- A lost RaceFinish is repeated until the grace period ends ---
    {
        SimNetwork net;
        auto& a = net.add("alice");
        auto& b = net.add("bob");
        form_session(net, {&a, &b});

        auto finishes = std::make_shared<int>(0);
        net.drop_if([finishes, &b](const SimNode& from, const SimNode&, const protocol::Message& msg) {
            return from.id() == b.id() && msg.as<protocol::RaceFinish>() && (*finishes)++ == 0;
        });

        assert(!a.race.create(spec_at(a.local(net.now()) + Millis(3000), Millis(2000), 1000.0), a.local(net.now())));
        net.run_for(Millis(100));
        assert(!b.race.join(a.race.race()->id, b.local(net.now())));
        assert(net.run_until([&] { return a.race.race()->status == RaceStatus::InProgress; }, Millis(4000)));
        net.run_for(Millis(100));

        assert(!b.race.update_position(1000.0, b.local(net.now())));
        net.run_for(Millis(100));
        assert(b.race.participant(b.id())->status == RacerStatus::Finished);
        assert(a.race.participant(b.id())->status == RacerStatus::Racing);

        assert(net.run_until([&] { return a.race.participant(b.id())->status == RacerStatus::Finished; },
                             Millis(1500)));
        assert(a.race.participant(b.id())->finish_time == b.race.participant(b.id())->finish_time);

        assert(!a.race.update_position(1000.0, a.local(net.now())));
        net.run_for(Millis(100));
        assert(a.race.race()->status == RaceStatus::Finished);
        assert(b.race.race()->status == RaceStatus::Finished);
        const auto results = a.observed<events::RaceResultsReady>();
        assert(results.size() == 1);
        assert(results[0].second.results.finishers.size() == 2);
        assert(results[0].second.results.finishers[0].rider_id == b.id());
        assert(results[0].second.results.dnf.empty());

        // repeats stop once the grace period has passed
        net.run_for(Millis(61000));
        const int sent = *finishes;
        assert(sent > 2);
        net.run_for(Millis(3000));
        assert(*finishes == sent);
        assert(a.race.participant(b.id())->status == RacerStatus::Finished);
        assert(a.observed<events::RaceResultsReady>().size() == 1);
        printf("  [OK] Finish survives a lost datagram\n");
    }

    printf("=== all race tests passed ===\n");
    return 0;
}
