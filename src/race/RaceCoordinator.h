#pragma once

#include "core/Config.h"
#include "core/IdGenerator.hpp"
#include "core/Rider.h"
#include "core/Types.h"
#include "engine/Events.h"
#include "networking/Liveness.h"
#include "networking/Outbox.h"
#include "protocol/Message.h"
#include "race/RaceTypes.h"

#include <boost/system/error_code.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace groupride::race {

// Race lifecycle within a session: schedule, countdown, start, progress,
// finish ordering and disconnect handling.
//
// The organizer's clock is the reference. Every node converts its own clock
// through the estimated offset to the organizer before comparing against the
// scheduled start, so all riders start within the offset error.
class RaceCoordinator {
public:
    using error_code = boost::system::error_code;

    RaceCoordinator(const Rider& self, const Config& config,
                    networking::Outbox& outbox, IdGenerator& ids);

    void set_on_event(events::EventHandler handler);

    // Races live inside a session; clearing it cancels any open race.
    void set_session(std::optional<SessionId> session_id);

    error_code create(const RaceSpec& spec, TimePoint now);
    error_code join(const RaceId& race_id, TimePoint now);
    error_code cancel(TimePoint now);
    error_code end(TimePoint now);

    // Local rider progress; finishing is detected here.
    error_code update_position(double distance_m, TimePoint now);

    void handle(const protocol::Message& msg, TimePoint now);

    // Any traffic from a rider counts as a sign of life for the grace period.
    void note_activity(const RiderId& rider, TimePoint now);

    // Estimated (peer clock - local clock); the organizer's entry is used.
    void set_clock_offset(const RiderId& peer, double offset_ms);

    void tick(TimePoint now);

    const std::optional<RaceEvent>& race() const noexcept { return race_; }
    const RaceParticipant* participant(const RiderId& rider) const;
    std::vector<Standing> standings() const;
    RaceResults results() const;

    // Local instant on the organizer's clock.
    TimePoint organizer_time(TimePoint local) const;

private:
    void handle_announce(const protocol::Message& msg, const protocol::RaceAnnounce& a, TimePoint now);
    void handle_join(const protocol::RaceJoin& j, TimePoint now);
    void handle_countdown(const protocol::Message& msg, const protocol::RaceCountdown& c);
    void handle_position(const protocol::Message& msg, const protocol::RacePosition& p, TimePoint now);
    void handle_finish(const protocol::Message& msg, const protocol::RaceFinish& f);
    void handle_control(const protocol::Message& msg, const protocol::RaceControl& c);

    bool is_organizer() const noexcept;
    bool add_participant(const RiderId& rider, const std::string& name, TimePoint now);

    error_code transition(RaceParticipant& p, RacerStatus to);
    void set_status(RaceStatus status);
    void start(TimePoint now);
    void finish_rider(RaceParticipant& p, Millis finish_time);
    void force_end();
    void rerank();
    void maybe_complete();
    void sweep_disconnects(TimePoint now);
    void resend_finish(TimePoint now);

    void announce(TimePoint now);
    protocol::RaceAnnounce announcement() const;

    void emit(events::Event ev);
    void emit_racer(const RaceParticipant& p);

private:
    Rider self_;
    const Config& config_;
    networking::Outbox& outbox_;
    IdGenerator& ids_;
    events::EventHandler on_event_;

    std::optional<SessionId> session_;
    std::optional<RaceEvent> race_;
    std::map<RiderId, RaceParticipant> participants_;
    std::unordered_map<RiderId, double> clock_offsets_;

    TimePoint last_announce_{};
    std::optional<long long> last_countdown_second_;
    std::optional<TimePoint> finished_at_;
    TimePoint last_finish_sent_{};
    bool standings_dirty_ = false;

    networking::StalenessFilter position_filter_;
};

} // namespace groupride::race
