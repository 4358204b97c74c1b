#include "clock/ClockOffsetEstimator.h"

#include <cassert>
#include <cmath>
#include <cstdio>

using namespace groupride;
using groupride::clock::ClockOffsetEstimator;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

} // namespace

int main() {
    printf("=== clock test suite ===\n");
    const TimePoint t0 = from_wire_ms(1'700'000'000'000);

    // --- Symmetric-latency estimate ---
    {
        // Peer runs 300 ms ahead; 20 ms each way.
        auto s = ClockOffsetEstimator::measure(t0, t0 + Millis(20 + 300), t0 + Millis(40));
        assert(near(s.round_trip_ms, 40.0));
        assert(near(s.offset_ms, 300.0));

        // Peer behind.
        s = ClockOffsetEstimator::measure(t0, t0 + Millis(10) - Millis(750), t0 + Millis(20));
        assert(near(s.offset_ms, -750.0));

        // Asymmetric paths land within half the asymmetry.
        s = ClockOffsetEstimator::measure(t0, t0 + Millis(30), t0 + Millis(40));
        assert(near(s.offset_ms, 10.0));
        printf("  [OK] Offset and round trip from one exchange\n");
    }

    // --- Probe and answer ---
    {
        ClockOffsetEstimator local(Millis(1000), 0.25);
        auto ping = local.make_probe("rider-b", t0);
        assert(ping.timestamp == to_wire_ms(t0));

        auto pong = ClockOffsetEstimator::answer(ping, t0 + Millis(5) + Millis(200));
        assert(pong.echoed_timestamp == ping.timestamp);

        auto s = local.on_pong("rider-b", pong, t0 + Millis(10));
        assert(s && near(s->offset_ms, 200.0));
        auto est = local.estimate("rider-b");
        assert(est && est->samples == 1);
        assert(near(est->offset_ms, 200.0));
        assert(est->updated_at == t0 + Millis(10));

        assert(local.to_peer_time("rider-b", t0) == t0 + Millis(200));
        assert(local.to_peer_time("rider-unknown", t0) == t0);

        // the same reply twice is unsolicited the second time
        assert(!local.on_pong("rider-b", pong, t0 + Millis(12)));
        // never probed
        assert(!local.on_pong("rider-c", pong, t0 + Millis(12)));
        assert(local.estimate("rider-b")->samples == 1);
        printf("  [OK] Probe matched to its reply once\n");
    }

    // --- Exponential smoothing ---
    {
        ClockOffsetEstimator est(Millis(1000), 0.25);
        est.record("rider-b", t0, t0 + Millis(100 + 10), t0 + Millis(20));
        assert(near(est.estimate("rider-b")->offset_ms, 100.0));

        est.record("rider-b", t0, t0 + Millis(200 + 10), t0 + Millis(20));
        assert(near(est.estimate("rider-b")->offset_ms, 125.0));

        est.record("rider-b", t0, t0 + Millis(200 + 10), t0 + Millis(20));
        assert(near(est.estimate("rider-b")->offset_ms, 143.75));
        assert(est.estimate("rider-b")->samples == 3);
        printf("  [OK] Samples smoothed\n");
    }

    // --- Round-trip ceiling ---
    {
        ClockOffsetEstimator est(Millis(500), 0.5);
        est.record("rider-b", t0, t0 + Millis(10), t0 + Millis(20));
        const double before = est.estimate("rider-b")->offset_ms;

        // a congested exchange with a wild offset
        assert(!est.record("rider-b", t0, t0 + Millis(5000), t0 + Millis(501)));
        assert(near(est.estimate("rider-b")->offset_ms, before));
        assert(est.estimate("rider-b")->samples == 1);

        // exactly at the ceiling still counts
        assert(est.record("rider-b", t0, t0 + Millis(250), t0 + Millis(500)));

        // a reply that comes back before the probe went out
        assert(!est.record("rider-b", t0, t0, t0 - Millis(1)));
        printf("  [OK] Over-ceiling samples discarded\n");
    }

    // --- Expired probes resolve as lost ---
    {
        ClockOffsetEstimator est(Millis(1000), 0.25);
        auto old_ping = est.make_probe("rider-b", t0);
        auto new_ping = est.make_probe("rider-b", t0 + Millis(1500));

        est.expire_probes(t0 + Millis(1600));
        assert(!est.on_pong("rider-b", ClockOffsetEstimator::answer(old_ping, t0), t0 + Millis(1700)));
        assert(est.on_pong("rider-b", ClockOffsetEstimator::answer(new_ping, t0 + Millis(1550)), t0 + Millis(1600)));

        est.forget("rider-b");
        assert(!est.estimate("rider-b"));
        printf("  [OK] Expired probes dropped\n");
    }

    printf("=== all clock tests passed ===\n");
    return 0;
}
