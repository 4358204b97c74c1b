#include "race/RaceCoordinator.h"

#include "core/Error.h"
#include "core/Log.h"

#include <algorithm>
#include <chrono>
#include <utility>

namespace groupride::race {

namespace {

constexpr const char* kTag = "Race";

Millis ms_of(Clock::duration d) {
    return std::chrono::duration_cast<Millis>(d);
}

} // namespace

const char* to_string(RaceStatus status) noexcept {
    switch (status) {
        case RaceStatus::Scheduled:  return "scheduled";
        case RaceStatus::Countdown:  return "countdown";
        case RaceStatus::InProgress: return "in_progress";
        case RaceStatus::Finished:   return "finished";
        case RaceStatus::Cancelled:  return "cancelled";
    }
    return "unknown";
}

const char* to_string(RacerStatus status) noexcept {
    switch (status) {
        case RacerStatus::Registered: return "registered";
        case RacerStatus::Racing:     return "racing";
        case RacerStatus::Finished:   return "finished";
        case RacerStatus::Dnf:        return "dnf";
    }
    return "unknown";
}

RaceCoordinator::RaceCoordinator(const Rider& self, const Config& config,
                                 networking::Outbox& outbox, IdGenerator& ids)
    : self_(self),
      config_(config),
      outbox_(outbox),
      ids_(ids) {}

void RaceCoordinator::set_on_event(events::EventHandler handler) {
    on_event_ = std::move(handler);
}

void RaceCoordinator::set_session(std::optional<SessionId> session_id) {
    if (session_id == session_) return;

    if (race_ && !is_terminal(race_->status)) {
        log::info(kTag) << "session closed, cancelling " << race_->id;
        set_status(RaceStatus::Cancelled);
    }
    session_ = std::move(session_id);
    if (session_) {
        race_.reset();
        participants_.clear();
        finished_at_.reset();
    }
}

TimePoint RaceCoordinator::organizer_time(TimePoint local) const {
    if (!race_ || is_organizer()) return local;
    auto it = clock_offsets_.find(race_->organizer);
    if (it == clock_offsets_.end()) return local;
    return local + std::chrono::duration_cast<Clock::duration>(
                       std::chrono::duration<double, std::milli>(it->second));
}

void RaceCoordinator::set_clock_offset(const RiderId& peer, double offset_ms) {
    clock_offsets_[peer] = offset_ms;
}

bool RaceCoordinator::is_organizer() const noexcept {
    return race_ && race_->organizer == self_.id();
}

// ---- operations ----

RaceCoordinator::error_code RaceCoordinator::create(const RaceSpec& spec, TimePoint now) {
    if (!session_) return errc::not_in_session;
    if (race_ && !is_terminal(race_->status)) return errc::race_exists;
    if (spec.scheduled_start <= now || spec.distance_m <= 0.0) return errc::invalid_schedule;

    RaceEvent r;
    r.id = ids_.raceID();
    r.organizer = self_.id();
    r.session_id = *session_;
    r.name = spec.name;
    r.course_id = spec.course_id;
    r.distance_m = spec.distance_m;
    r.scheduled_start = spec.scheduled_start;
    r.countdown = spec.countdown.count() > 0 ? spec.countdown : Millis(config_.race_countdown);
    r.status = RaceStatus::Scheduled;

    race_ = r;
    participants_.clear();
    position_filter_ = networking::StalenessFilter{};
    last_countdown_second_.reset();
    finished_at_.reset();

    log::info(kTag) << "created " << r.id << " '" << r.name << "' over " << r.distance_m << " m";
    emit(events::RaceStatusChanged{r});

    add_participant(self_.id(), self_.name(), now);
    announce(now);
    tick(now);
    return {};
}

RaceCoordinator::error_code RaceCoordinator::join(const RaceId& race_id, TimePoint now) {
    if (!race_ || race_->id != race_id) return errc::race_not_found;
    if (race_->status != RaceStatus::Scheduled) return errc::race_already_started;
    if (participants_.count(self_.id())) return errc::already_registered;
    if (participants_.size() >= config_.max_racers) return errc::race_full;

    add_participant(self_.id(), self_.name(), now);
    outbox_.broadcast(protocol::make_message(self_.id(), now,
                                             protocol::RaceJoin{race_id, self_.id(), self_.name()}));
    log::info(kTag) << "registered for " << race_id;
    return {};
}

RaceCoordinator::error_code RaceCoordinator::cancel(TimePoint now) {
    if (!race_) return errc::no_race;
    if (!is_organizer()) return errc::not_organizer;
    if (race_->status != RaceStatus::Scheduled && race_->status != RaceStatus::Countdown) {
        return errc::race_already_started;
    }

    outbox_.broadcast(protocol::make_message(self_.id(), now,
                                             protocol::RaceControl{race_->id, protocol::RaceAction::Cancel}));
    log::info(kTag) << "cancelled " << race_->id;
    set_status(RaceStatus::Cancelled);
    return {};
}

RaceCoordinator::error_code RaceCoordinator::end(TimePoint now) {
    if (!race_) return errc::no_race;
    if (!is_organizer()) return errc::not_organizer;
    if (race_->status != RaceStatus::InProgress) return errc::invalid_transition;

    outbox_.broadcast(protocol::make_message(self_.id(), now,
                                             protocol::RaceControl{race_->id, protocol::RaceAction::End}));
    log::info(kTag) << "force-ending " << race_->id;
    force_end();
    return {};
}

RaceCoordinator::error_code RaceCoordinator::update_position(double distance_m, TimePoint now) {
    if (!race_) return errc::no_race;
    auto it = participants_.find(self_.id());
    if (it == participants_.end()) return errc::race_not_found;
    if (race_->status != RaceStatus::InProgress) return {};

    auto& me = it->second;
    if (me.status != RacerStatus::Racing) return {};

    const auto elapsed = ms_of(organizer_time(now) - race_->scheduled_start);
    me.distance_m = distance_m;
    me.elapsed = elapsed;
    me.last_heard = now;
    standings_dirty_ = true;

    protocol::RacePosition pos{race_->id, distance_m,
                               static_cast<std::uint32_t>(std::max<Millis::rep>(elapsed.count(), 0))};
    outbox_.broadcast(protocol::make_message(self_.id(), now, pos));

    if (distance_m >= race_->distance_m) {
        finish_rider(me, elapsed);
        finished_at_ = now;
        last_finish_sent_ = now;
        outbox_.broadcast(protocol::make_message(self_.id(), now,
                                                 protocol::RaceFinish{race_->id, pos.elapsed_ms}));
        log::info(kTag) << "finished " << race_->id << " in " << elapsed.count() << " ms";
        maybe_complete();
    }
    return {};
}

// ---- inbound ----

void RaceCoordinator::handle(const protocol::Message& msg, TimePoint now) {
    if (msg.sender == self_.id() || !session_) return;

    if (auto* a = msg.as<protocol::RaceAnnounce>()) {
        handle_announce(msg, *a, now);
        return;
    }
    if (!race_) return;

    if (auto* j = msg.as<protocol::RaceJoin>()) {
        handle_join(*j, now);
    } else if (auto* c = msg.as<protocol::RaceCountdown>()) {
        handle_countdown(msg, *c);
    } else if (auto* p = msg.as<protocol::RacePosition>()) {
        handle_position(msg, *p, now);
    } else if (auto* f = msg.as<protocol::RaceFinish>()) {
        handle_finish(msg, *f);
    } else if (auto* ctl = msg.as<protocol::RaceControl>()) {
        handle_control(msg, *ctl);
    }
}

void RaceCoordinator::handle_announce(const protocol::Message& msg, const protocol::RaceAnnounce& a,
                                      TimePoint now) {
    if (race_ && race_->id != a.race_id && !is_terminal(race_->status)) return;

    if (!race_ || race_->id != a.race_id) {
        RaceEvent r;
        r.id = a.race_id;
        r.organizer = msg.sender;
        r.session_id = *session_;
        r.name = a.name;
        r.course_id = a.course_id;
        r.distance_m = a.distance_m;
        r.scheduled_start = from_wire_ms(a.scheduled_start);
        r.countdown = Millis(a.countdown_ms);
        r.status = RaceStatus::Scheduled;

        race_ = r;
        participants_.clear();
        position_filter_ = networking::StalenessFilter{};
        last_countdown_second_.reset();
        finished_at_.reset();

        log::info(kTag) << "race " << r.id << " '" << r.name << "' announced by " << msg.sender;
        emit(events::RaceStatusChanged{r});
    }
    if (msg.sender != race_->organizer) return;

    race_->scheduled_start = from_wire_ms(a.scheduled_start);
    for (const auto& rider : a.roster) add_participant(rider, {}, now);

    // Registered here but missing from the organizer's roster: our RaceJoin was lost.
    const bool listed = std::find(a.roster.begin(), a.roster.end(), self_.id()) != a.roster.end();
    const bool registering = race_->status == RaceStatus::Scheduled || race_->status == RaceStatus::Countdown;
    if (!listed && registering && participants_.count(self_.id())) {
        log::debug(kTag) << "not on the roster of " << race_->id << " yet, registering again";
        outbox_.broadcast(protocol::make_message(self_.id(), now,
                                                 protocol::RaceJoin{race_->id, self_.id(), self_.name()}));
    }

    if (static_cast<RaceStatus>(a.status) == RaceStatus::Cancelled && !is_terminal(race_->status)) {
        set_status(RaceStatus::Cancelled);
    }
}

void RaceCoordinator::handle_join(const protocol::RaceJoin& j, TimePoint now) {
    if (j.race_id != race_->id) return;
    if (add_participant(j.rider_id, j.rider_name, now)) {
        log::info(kTag) << j.rider_name << " registered for " << j.race_id;
        if (is_organizer()) announce(now);
    }
}

void RaceCoordinator::handle_countdown(const protocol::Message& msg, const protocol::RaceCountdown& c) {
    if (c.race_id != race_->id || msg.sender != race_->organizer) return;
    race_->scheduled_start = from_wire_ms(c.start_at);
}

void RaceCoordinator::handle_position(const protocol::Message& msg, const protocol::RacePosition& p,
                                      TimePoint now) {
    if (p.race_id != race_->id) return;
    auto it = participants_.find(msg.sender);
    if (it == participants_.end()) return;

    auto& rp = it->second;
    if (rp.status != RacerStatus::Registered && rp.status != RacerStatus::Racing) return;
    if (!position_filter_.accept(msg.sender, protocol::MessageTag::RacePosition, msg.sent_at)) return;

    rp.distance_m = p.distance_m;
    rp.elapsed = Millis(p.elapsed_ms);
    if (now > rp.last_heard) rp.last_heard = now;
    standings_dirty_ = true;
}

void RaceCoordinator::handle_finish(const protocol::Message& msg, const protocol::RaceFinish& f) {
    if (f.race_id != race_->id) return;
    auto it = participants_.find(msg.sender);
    if (it == participants_.end()) return;

    auto& rp = it->second;
    if (rp.status == RacerStatus::Finished && rp.finish_time == Millis(f.finish_time_ms)) return;  // resent
    if (rp.status == RacerStatus::Dnf) {
        log::debug(kTag) << "finish from " << msg.sender << " after DNF ignored";
        return;
    }
    if (rp.status == RacerStatus::Registered && race_->status == RaceStatus::Countdown) {
        transition(rp, RacerStatus::Racing);
    }
    if (transition(rp, RacerStatus::Finished)) return;

    rp.finish_time = Millis(f.finish_time_ms);
    rp.distance_m = std::max(rp.distance_m, race_->distance_m);
    rerank();
    emit_racer(rp);
    standings_dirty_ = true;
    maybe_complete();
}

void RaceCoordinator::handle_control(const protocol::Message& msg, const protocol::RaceControl& c) {
    if (c.race_id != race_->id || msg.sender != race_->organizer) return;
    if (is_terminal(race_->status)) return;

    switch (c.action) {
        case protocol::RaceAction::Cancel:
            log::info(kTag) << "organizer cancelled " << race_->id;
            set_status(RaceStatus::Cancelled);
            break;
        case protocol::RaceAction::End:
            if (race_->status == RaceStatus::InProgress) {
                log::info(kTag) << "organizer ended " << race_->id;
                force_end();
            } else {
                set_status(RaceStatus::Cancelled);
            }
            break;
    }
}

void RaceCoordinator::note_activity(const RiderId& rider, TimePoint now) {
    auto it = participants_.find(rider);
    if (it == participants_.end()) return;

    auto& p = it->second;
    if (now > p.last_heard) p.last_heard = now;
    if (p.disconnected_since && p.status == RacerStatus::Racing) {
        p.disconnected_since.reset();
        log::info(kTag) << rider << " resumed";
        emit_racer(p);
    }
}

// ---- timers ----

void RaceCoordinator::tick(TimePoint now) {
    if (!race_) return;
    resend_finish(now);
    if (is_terminal(race_->status)) return;

    const auto t = organizer_time(now);
    const auto& start_at = race_->scheduled_start;

    if (race_->status == RaceStatus::Scheduled && t >= start_at - race_->countdown) {
        set_status(RaceStatus::Countdown);
    }

    if (race_->status == RaceStatus::Countdown) {
        if (t >= start_at) {
            start(now);
        } else {
            const auto remaining = ms_of(start_at - t);
            const auto second = (remaining.count() + 999) / 1000;
            if (!last_countdown_second_ || *last_countdown_second_ != second) {
                last_countdown_second_ = second;
                emit(events::RaceCountdownTick{race_->id, remaining});
                if (is_organizer()) {
                    protocol::RaceCountdown c{race_->id, static_cast<std::int32_t>(remaining.count()),
                                              to_wire_ms(start_at)};
                    outbox_.broadcast(protocol::make_message(self_.id(), now, c));
                }
            }
        }
    }

    if (is_organizer() && (race_->status == RaceStatus::Scheduled || race_->status == RaceStatus::Countdown) &&
        now - last_announce_ >= config_.heartbeat_interval) {
        announce(now);
    }

    if (race_->status == RaceStatus::InProgress) {
        sweep_disconnects(now);
        maybe_complete();
    }

    if (standings_dirty_) {
        standings_dirty_ = false;
        emit(events::RaceStandings{race_->id, standings()});
    }
}

// Our finish is repeated once a heartbeat for the grace period after crossing
// the line; receivers drop copies with the same finish time.
void RaceCoordinator::resend_finish(TimePoint now) {
    if (!finished_at_ || race_->status == RaceStatus::Cancelled) return;
    if (now - *finished_at_ > config_.race_grace_period) return;
    if (now - last_finish_sent_ < config_.heartbeat_interval) return;

    const auto* me = participant(self_.id());
    if (!me || me->status != RacerStatus::Finished || !me->finish_time) return;

    const auto ms = static_cast<std::uint32_t>(std::max<Millis::rep>(me->finish_time->count(), 0));
    outbox_.broadcast(protocol::make_message(self_.id(), now, protocol::RaceFinish{race_->id, ms}));
    last_finish_sent_ = now;
}

void RaceCoordinator::start(TimePoint now) {
    set_status(RaceStatus::InProgress);
    for (auto& [id, p] : participants_) {
        if (p.status != RacerStatus::Registered) continue;
        if (!transition(p, RacerStatus::Racing)) {
            p.last_heard = std::max(p.last_heard, now);
            emit_racer(p);
        }
    }
    standings_dirty_ = true;
    log::info(kTag) << race_->id << " started with " << participants_.size() << " rider(s)";
}

void RaceCoordinator::sweep_disconnects(TimePoint now) {
    const Millis grace = config_.race_grace_period;
    for (auto& [id, p] : participants_) {
        if (id == self_.id() || p.status != RacerStatus::Racing) continue;

        const auto silence = now - p.last_heard;
        if (silence >= grace) {
            if (!transition(p, RacerStatus::Dnf)) {
                log::info(kTag) << id << " marked DNF after " << ms_of(silence).count() << " ms of silence";
                emit_racer(p);
                standings_dirty_ = true;
            }
        } else if (silence >= config_.liveness_timeout() && !p.disconnected_since) {
            p.disconnected_since = p.last_heard;
            log::info(kTag) << id << " pending disconnect";
            emit_racer(p);
            standings_dirty_ = true;
        }
    }
}

void RaceCoordinator::maybe_complete() {
    if (!race_ || race_->status != RaceStatus::InProgress || participants_.empty()) return;
    const bool all_done = std::all_of(participants_.begin(), participants_.end(),
                                      [](const auto& kv) { return is_terminal(kv.second.status); });
    if (!all_done) return;

    set_status(RaceStatus::Finished);
    emit(events::RaceResultsReady{results()});
}

void RaceCoordinator::force_end() {
    for (auto& [id, p] : participants_) {
        if (is_terminal(p.status)) continue;
        if (!transition(p, RacerStatus::Dnf)) emit_racer(p);
    }
    standings_dirty_ = true;
    set_status(RaceStatus::Finished);
    emit(events::RaceResultsReady{results()});
}

// ---- participants ----

bool RaceCoordinator::add_participant(const RiderId& rider, const std::string& name, TimePoint now) {
    auto it = participants_.find(rider);
    if (it != participants_.end()) {
        if (it->second.name.empty()) it->second.name = name;
        return false;
    }
    if (race_->status != RaceStatus::Scheduled && race_->status != RaceStatus::Countdown) return false;
    if (participants_.size() >= config_.max_racers) {
        log::warn(kTag) << "race full, ignoring registration of " << rider;
        return false;
    }

    RaceParticipant p;
    p.rider_id = rider;
    p.name = name;
    p.status = RacerStatus::Registered;
    p.last_heard = now;
    participants_.emplace(rider, std::move(p));
    standings_dirty_ = true;
    return true;
}

RaceCoordinator::error_code RaceCoordinator::transition(RaceParticipant& p, RacerStatus to) {
    bool ok = false;
    switch (p.status) {
        case RacerStatus::Registered:
            ok = to == RacerStatus::Racing || to == RacerStatus::Dnf;
            break;
        case RacerStatus::Racing:
            ok = to == RacerStatus::Finished || to == RacerStatus::Dnf;
            break;
        case RacerStatus::Finished:
        case RacerStatus::Dnf:
            break;
    }
    if (!ok) {
        log::error(kTag) << "rejected transition " << to_string(p.status) << " -> " << to_string(to)
                         << " for " << p.rider_id;
        return errc::invalid_transition;
    }
    p.status = to;
    if (is_terminal(to)) p.disconnected_since.reset();
    return {};
}

void RaceCoordinator::finish_rider(RaceParticipant& p, Millis finish_time) {
    if (transition(p, RacerStatus::Finished)) return;
    p.finish_time = finish_time;
    p.distance_m = std::max(p.distance_m, race_->distance_m);
    rerank();
    emit_racer(p);
    standings_dirty_ = true;
}

void RaceCoordinator::rerank() {
    std::vector<RaceParticipant*> done;
    for (auto& [id, p] : participants_) {
        if (p.status == RacerStatus::Finished && p.finish_time) done.push_back(&p);
    }
    std::sort(done.begin(), done.end(), [](const RaceParticipant* a, const RaceParticipant* b) {
        if (*a->finish_time != *b->finish_time) return *a->finish_time < *b->finish_time;
        return a->rider_id < b->rider_id;
    });
    for (std::size_t i = 0; i < done.size(); ++i) done[i]->finish_rank = static_cast<int>(i + 1);
}

const RaceParticipant* RaceCoordinator::participant(const RiderId& rider) const {
    auto it = participants_.find(rider);
    return it == participants_.end() ? nullptr : &it->second;
}

std::vector<Standing> RaceCoordinator::standings() const {
    std::vector<const RaceParticipant*> finished;
    std::vector<const RaceParticipant*> riding;
    for (const auto& [id, p] : participants_) {
        if (p.status == RacerStatus::Finished) {
            finished.push_back(&p);
        } else if (p.status != RacerStatus::Dnf) {
            riding.push_back(&p);
        }
    }
    std::sort(finished.begin(), finished.end(), [](const RaceParticipant* a, const RaceParticipant* b) {
        if (a->finish_rank != b->finish_rank) return a->finish_rank.value_or(0) < b->finish_rank.value_or(0);
        return a->rider_id < b->rider_id;
    });
    std::sort(riding.begin(), riding.end(), [](const RaceParticipant* a, const RaceParticipant* b) {
        if (a->distance_m != b->distance_m) return a->distance_m > b->distance_m;
        return a->rider_id < b->rider_id;
    });

    std::vector<Standing> out;
    out.reserve(finished.size() + riding.size());
    auto push = [&](const RaceParticipant* p) {
        Standing s;
        s.position = static_cast<int>(out.size() + 1);
        s.rider_id = p->rider_id;
        s.name = p->name;
        s.status = p->status;
        s.distance_m = p->distance_m;
        s.finish_time = p->finish_time;
        s.pending_disconnect = p->disconnected_since.has_value();
        out.push_back(std::move(s));
    };
    for (const auto* p : finished) push(p);
    for (const auto* p : riding) push(p);
    return out;
}

RaceResults RaceCoordinator::results() const {
    RaceResults r;
    if (!race_) return r;
    r.race = *race_;

    for (const auto& s : standings()) {
        if (s.status != RacerStatus::Finished || !s.finish_time) continue;
        RaceResult res;
        res.rank = s.position;
        res.rider_id = s.rider_id;
        res.name = s.name;
        res.finish_time = *s.finish_time;
        res.gap_to_winner = r.finishers.empty() ? Millis(0) : *s.finish_time - r.finishers.front().finish_time;
        r.finishers.push_back(std::move(res));
    }
    for (const auto& [id, p] : participants_) {
        if (p.status == RacerStatus::Dnf) r.dnf.push_back(id);
    }
    return r;
}

// ---- outbound ----

void RaceCoordinator::announce(TimePoint now) {
    outbox_.broadcast(protocol::make_message(self_.id(), now, announcement()));
    last_announce_ = now;
}

protocol::RaceAnnounce RaceCoordinator::announcement() const {
    protocol::RaceAnnounce a;
    a.race_id = race_->id;
    a.name = race_->name;
    a.course_id = race_->course_id;
    a.distance_m = race_->distance_m;
    a.scheduled_start = to_wire_ms(race_->scheduled_start);
    a.countdown_ms = static_cast<std::uint32_t>(race_->countdown.count());
    a.status = static_cast<std::uint8_t>(race_->status);
    for (const auto& [id, p] : participants_) a.roster.push_back(id);
    return a;
}

void RaceCoordinator::set_status(RaceStatus status) {
    race_->status = status;
    log::debug(kTag) << race_->id << " -> " << to_string(status);
    emit(events::RaceStatusChanged{*race_});
}

void RaceCoordinator::emit(events::Event ev) {
    if (on_event_) on_event_(ev);
}

void RaceCoordinator::emit_racer(const RaceParticipant& p) {
    emit(events::RacerStatusChanged{race_->id, p.rider_id, p.status, p.disconnected_since.has_value()});
}

} // namespace groupride::race
