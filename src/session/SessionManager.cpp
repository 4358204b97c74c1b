#include "session/SessionManager.h"

#include "core/Error.h"
#include "core/Log.h"

#include <algorithm>
#include <utility>

namespace groupride::session {

namespace {

constexpr const char* kTag = "Session";

errc to_errc(protocol::RejectReason reason) {
    switch (reason) {
        case protocol::RejectReason::UnknownSession: return errc::unknown_session;
        case protocol::RejectReason::SessionFull:    return errc::session_full;
        case protocol::RejectReason::SessionEnded:   return errc::session_ended;
        case protocol::RejectReason::DuplicateJoin:  return errc::duplicate_join;
    }
    return errc::unknown_session;
}

std::uint8_t clamp_u8(std::size_t n) {
    return static_cast<std::uint8_t>(std::min<std::size_t>(n, 255));
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle:    return "idle";
        case SessionState::Hosting: return "hosting";
        case SessionState::Joining: return "joining";
        case SessionState::Active:  return "active";
        case SessionState::Ended:   return "ended";
    }
    return "unknown";
}

const char* to_string(LeaveReason reason) noexcept {
    switch (reason) {
        case LeaveReason::Left:         return "left";
        case LeaveReason::TimedOut:     return "timed_out";
        case LeaveReason::SessionEnded: return "session_ended";
    }
    return "unknown";
}

SessionManager::SessionManager(const Rider& self, const Config& config,
                               networking::Outbox& outbox, IdGenerator& ids)
    : self_(self),
      config_(config),
      outbox_(outbox),
      ids_(ids),
      metric_limiter_(config.metric_interval()) {}

void SessionManager::set_on_event(events::EventHandler handler) {
    on_event_ = std::move(handler);
}

bool SessionManager::is_host() const noexcept {
    return info_ && info_->host_id == self_.id();
}

// ---- operations ----

SessionManager::error_code SessionManager::host(const std::string& world_id, TimePoint now) {
    if (state_ != SessionState::Idle && state_ != SessionState::Ended) {
        return errc::already_in_session;
    }
    reset_session();

    SessionInfo info;
    info.id = ids_.sessionID();
    info.host_id = self_.id();
    info.host_name = self_.name();
    info.world_id = world_id;
    info.created_at = now;
    info.max_participants = config_.max_participants;
    info_ = info;

    set_state(SessionState::Hosting, info.id);
    apply_join(self_.id(), self_.name(), to_wire_ms(now), Endpoint{}, now);
    set_state(SessionState::Active, info.id);

    log::info(kTag) << "hosting " << info.id << " in world '" << world_id << "'";
    announce(now);
    emit_roster();
    return {};
}

SessionManager::error_code SessionManager::join(const SessionId& session_id, TimePoint now) {
    if (state_ != SessionState::Idle && state_ != SessionState::Ended) {
        return errc::already_in_session;
    }
    auto it = announced_.find(session_id);
    if (it == announced_.end()) return errc::unknown_session;

    reset_session();

    PendingJoin p;
    p.session_id = session_id;
    p.host_id = it->second.host_id;
    p.host_name = it->second.host_name;
    p.host_address = it->second.host_address;
    p.capacity = it->second.capacity;
    p.joined_at = to_wire_ms(now);
    p.deadline = now + config_.join_timeout;
    p.next_retry = now + config_.join_retry;
    pending_ = p;

    set_state(SessionState::Joining, session_id);
    log::info(kTag) << "joining " << session_id << " hosted by " << p.host_name
                    << " at " << p.host_address;
    send_join(now);
    return {};
}

SessionManager::error_code SessionManager::leave(TimePoint now) {
    switch (state_) {
        case SessionState::Idle:
        case SessionState::Ended:
            return errc::not_in_session;

        case SessionState::Joining: {
            const auto id = pending_ ? pending_->session_id : SessionId{};
            reset_session();
            set_state(SessionState::Idle, id);
            return {};
        }

        case SessionState::Hosting:
        case SessionState::Active:
            break;
    }

    const auto id = info_->id;
    if (is_host()) {
        auto msg = protocol::make_message(self_.id(), now, protocol::SessionEnded{id});
        send_to_members(msg);
        outbox_.broadcast(msg);
        end_locally(now, LeaveReason::SessionEnded);
        log::info(kTag) << "ended " << id;
    } else {
        const auto left_at = to_wire_ms(now);
        send_to_members(protocol::make_message(self_.id(), now,
                                               protocol::SessionLeave{id, self_.id(), left_at}));
        apply_leave(self_.id(), left_at, LeaveReason::Left);
        pending_.reset();
        ended_at_ = now;
        log::info(kTag) << "left " << id;
    }
    set_state(SessionState::Ended, id);
    return {};
}

SessionManager::error_code SessionManager::broadcast_metrics(const protocol::RiderMetrics& metrics,
                                                             TimePoint now) {
    if (state_ != SessionState::Active) return errc::not_in_session;
    if (!metric_limiter_.allow(now)) return {};

    if (auto* me = open_entry(self_.id())) {
        me->last_metrics = metrics;
        me->touch(now);
    }
    outbox_.broadcast(protocol::make_message(self_.id(), now,
                                             protocol::MetricUpdate{info_->id, metrics}));
    return {};
}

void SessionManager::on_network_restored(TimePoint now) {
    if (state_ != SessionState::Active) return;

    if (is_host()) {
        announce(now);
        return;
    }

    log::info(kTag) << "network restored, rejoining " << info_->id;
    resync(now);
}

void SessionManager::resync(TimePoint now) {
    auto addr = host_address();
    if (!addr) {
        log::warn(kTag) << "host address unknown, cannot rejoin";
        return;
    }

    PendingJoin p;
    p.session_id = info_->id;
    p.host_id = info_->host_id;
    p.host_name = info_->host_name;
    p.host_address = *addr;
    p.capacity = info_->max_participants;
    p.joined_at = to_wire_ms(now);
    p.rejoin = true;
    p.deadline = now + config_.join_timeout;
    p.next_retry = now + config_.join_retry;
    pending_ = p;
    send_join(now);
}

// ---- inbound ----

void SessionManager::handle(const protocol::Message& msg, const Endpoint& from, TimePoint now) {
    if (msg.sender == self_.id()) return;

    if (auto* a = msg.as<protocol::SessionAnnounce>()) {
        handle_announce(msg, *a, from, now);
    } else if (auto* j = msg.as<protocol::SessionJoin>()) {
        handle_join(msg, *j, from, now);
    } else if (auto* acc = msg.as<protocol::JoinAccepted>()) {
        handle_accepted(msg, *acc, from, now);
    } else if (auto* rej = msg.as<protocol::JoinRejected>()) {
        handle_rejected(*rej, now);
    } else if (auto* l = msg.as<protocol::SessionLeave>()) {
        handle_leave(msg, *l, now);
    } else if (auto* e = msg.as<protocol::SessionEnded>()) {
        handle_ended(msg, *e, now);
    } else if (auto* h = msg.as<protocol::Heartbeat>()) {
        handle_heartbeat(msg, *h, now);
    } else if (auto* m = msg.as<protocol::MetricUpdate>()) {
        handle_metrics(msg, *m, now);
    }
}

void SessionManager::on_discovered(const RiderId& host, const std::string& host_name,
                                   const SessionId& session_id, const std::string& world_id,
                                   const Endpoint& address, TimePoint now) {
    if (host == self_.id() || session_id.empty()) return;

    auto& s = announced_[session_id];
    const bool fresh = s.id.empty();
    s.id = session_id;
    s.host_id = host;
    s.host_name = host_name;
    s.world_id = world_id;
    s.host_address = address;
    if (s.capacity == 0) s.capacity = config_.max_participants;
    s.last_seen = now;
    if (fresh) emit(events::SessionAvailable{s});
}

void SessionManager::handle_announce(const protocol::Message& msg, const protocol::SessionAnnounce& a,
                                     const Endpoint& from, TimePoint now) {
    auto& s = announced_[a.session_id];
    const bool fresh = s.id.empty();
    s.id = a.session_id;
    s.host_id = msg.sender;
    s.host_name = a.host_name;
    s.world_id = a.world_id;
    s.host_address = from;
    s.participants = a.participant_count;
    s.capacity = a.max_participants;
    s.last_seen = now;
    if (fresh) {
        log::debug(kTag) << "session " << a.session_id << " announced by " << a.host_name;
        emit(events::SessionAvailable{s});
    }

    if (state_ == SessionState::Active && info_ && info_->id == a.session_id) {
        if (auto* p = open_entry(msg.sender)) {
            p->touch(now);
            p->address = from;
        }
    }
}

void SessionManager::handle_join(const protocol::Message& msg, const protocol::SessionJoin& j,
                                 const Endpoint& from, TimePoint now) {
    if (j.rider_id == msg.sender) {
        handle_join_request(j, from, now);
        return;
    }

    // Relayed by the host.
    if (state_ != SessionState::Active || !info_ || j.session_id != info_->id) return;
    if (msg.sender != info_->host_id || j.rider_id == self_.id()) return;

    auto m = membership_.find(j.rider_id);
    const bool returning = m != membership_.end() && m->second.reason == LeaveReason::TimedOut;

    if (apply_join(j.rider_id, j.rider_name, j.joined_at, Endpoint{}, now) == Applied::Added) {
        if (returning || j.rejoin) {
            emit(events::ParticipantReconnected{info_->id, j.rider_id});
        } else {
            emit(events::ParticipantJoined{info_->id, j.rider_id, j.rider_name});
        }
        emit_roster();
    }
}

void SessionManager::handle_join_request(const protocol::SessionJoin& j, const Endpoint& from,
                                         TimePoint now) {
    if (!is_host()) return;

    auto reject = [&](protocol::RejectReason reason) {
        outbox_.send_to(from, protocol::make_message(self_.id(), now,
                                                     protocol::JoinRejected{j.session_id, j.rider_id, reason}));
    };

    if (j.session_id != info_->id) {
        reject(protocol::RejectReason::UnknownSession);
        return;
    }
    if (state_ == SessionState::Ended) {
        reject(protocol::RejectReason::SessionEnded);
        return;
    }
    if (state_ != SessionState::Active) return;

    auto accept = [&] {
        outbox_.send_to(from, protocol::make_message(self_.id(), now, snapshot()));
    };

    if (auto* p = open_entry(j.rider_id)) {
        if (j.rejoin || p->address == from) {
            p->touch(now);
            p->address = from;
            accept();
        } else {
            log::info(kTag) << "duplicate join for " << j.rider_id << " from " << from
                            << " (already at " << p->address << ")";
            reject(protocol::RejectReason::DuplicateJoin);
        }
        return;
    }

    if (active_count() >= info_->max_participants) {
        log::info(kTag) << "rejecting " << j.rider_name << ", session full";
        reject(protocol::RejectReason::SessionFull);
        return;
    }

    auto m = membership_.find(j.rider_id);
    const bool returning = m != membership_.end() && m->second.reason == LeaveReason::TimedOut;

    const auto applied = apply_join(j.rider_id, j.rider_name, j.joined_at, from, now);
    if (applied == Applied::Stale) {
        log::debug(kTag) << "ignoring stale join from " << j.rider_id;
        return;
    }

    log::info(kTag) << j.rider_name << " (" << j.rider_id << ") joined from " << from;

    auto relay = j;
    send_to_members(protocol::make_message(self_.id(), now, relay), j.rider_id);
    accept();

    if (returning || j.rejoin) {
        emit(events::ParticipantReconnected{info_->id, j.rider_id});
    } else {
        emit(events::ParticipantJoined{info_->id, j.rider_id, j.rider_name});
    }
    emit_roster();
}

void SessionManager::handle_accepted(const protocol::Message& msg, const protocol::JoinAccepted& a,
                                     const Endpoint& from, TimePoint now) {
    if (!pending_ || a.session_id != pending_->session_id) return;
    if (msg.sender != pending_->host_id) return;

    const bool initial = state_ == SessionState::Joining;
    const auto joined_at = pending_->joined_at;

    if (initial) {
        SessionInfo info;
        info.id = a.session_id;
        info.host_id = a.host_id;
        info.host_name = pending_->host_name;
        info.world_id = a.world_id;
        info.created_at = now;
        info.max_participants = pending_->capacity ? pending_->capacity : config_.max_participants;
        for (const auto& p : a.roster) {
            if (p.rider_id == a.host_id) info.created_at = from_wire_ms(p.joined_at);
        }
        info_ = info;
    } else if (state_ != SessionState::Active) {
        return;
    }
    pending_.reset();

    bool self_listed = false;
    for (const auto& p : a.roster) {
        if (p.rider_id == self_.id()) self_listed = true;
        const auto addr = p.rider_id == a.host_id ? from : Endpoint{};

        auto stamp = p.joined_at;
        bool returning = false;
        if (!initial) {
            auto m = membership_.find(p.rider_id);
            if (m != membership_.end() && !m->second.present && m->second.reason == LeaveReason::TimedOut) {
                stamp = std::max(to_wire_ms(now), m->second.stamp + 1);
                returning = true;
            }
        }

        if (apply_join(p.rider_id, p.rider_name, stamp, addr, now) == Applied::Added && !initial) {
            if (returning) {
                emit(events::ParticipantReconnected{info_->id, p.rider_id});
            } else {
                emit(events::ParticipantJoined{info_->id, p.rider_id, p.rider_name});
            }
        }
    }
    if (!self_listed) apply_join(self_.id(), self_.name(), joined_at, Endpoint{}, now);

    if (initial) {
        log::info(kTag) << "joined " << info_->id << " (" << active_count() << " riders)";
        set_state(SessionState::Active, info_->id);
    } else {
        // The host's snapshot is authoritative for riders we missed leaving.
        for (const auto& rider : members()) {
            if (rider == self_.id()) continue;
            const bool listed = std::any_of(a.roster.begin(), a.roster.end(),
                                            [&](const protocol::ParticipantInfo& p) { return p.rider_id == rider; });
            if (!listed) apply_leave(rider, msg.sent_at, LeaveReason::Left);
        }
        log::info(kTag) << "roster resynced with host of " << info_->id;
    }
    emit_roster();
}

void SessionManager::handle_rejected(const protocol::JoinRejected& r, TimePoint now) {
    if (!pending_ || r.session_id != pending_->session_id || r.rider_id != self_.id()) return;

    const boost::system::error_code ec = to_errc(r.reason);
    log::warn(kTag) << "join " << r.session_id << " rejected: " << ec.message();

    if (state_ == SessionState::Joining) {
        const auto id = pending_->session_id;
        reset_session();
        set_state(SessionState::Idle, id, ec);
        return;
    }

    pending_.reset();
    if (state_ == SessionState::Active && (r.reason == protocol::RejectReason::SessionEnded ||
                                           r.reason == protocol::RejectReason::UnknownSession)) {
        const auto id = info_->id;
        end_locally(now, LeaveReason::SessionEnded);
        set_state(SessionState::Ended, id, ec);
    }
}

void SessionManager::handle_leave(const protocol::Message& msg, const protocol::SessionLeave& l,
                                  TimePoint now) {
    if (state_ != SessionState::Active || !info_ || l.session_id != info_->id) return;
    if (l.rider_id == self_.id()) return;

    if (!apply_leave(l.rider_id, l.left_at, LeaveReason::Left)) return;
    log::info(kTag) << l.rider_id << " left " << l.session_id;

    if (is_host() && msg.sender == l.rider_id) {
        send_to_members(protocol::make_message(self_.id(), now, l), l.rider_id);
    }
    emit_roster();
}

void SessionManager::handle_ended(const protocol::Message& msg, const protocol::SessionEnded& e,
                                  TimePoint now) {
    if (state_ == SessionState::Joining && pending_ && pending_->session_id == e.session_id &&
        msg.sender == pending_->host_id) {
        reset_session();
        set_state(SessionState::Idle, e.session_id, errc::session_ended);
        return;
    }

    announced_.erase(e.session_id);

    if (state_ != SessionState::Active || !info_ || e.session_id != info_->id) return;
    if (msg.sender != info_->host_id) return;

    log::info(kTag) << "host ended " << e.session_id;
    end_locally(now, LeaveReason::SessionEnded);
    set_state(SessionState::Ended, e.session_id);
}

void SessionManager::handle_heartbeat(const protocol::Message& msg, const protocol::Heartbeat& h,
                                      TimePoint now) {
    if (state_ != SessionState::Active || !info_ || h.session_id != info_->id) return;
    if (auto* p = open_entry(msg.sender)) {
        p->touch(now);
        return;
    }
    // A member whose join notice we missed; the host's snapshot fills it in.
    if (!is_host() && !pending_ && membership_.find(msg.sender) == membership_.end()) {
        log::debug(kTag) << "heartbeat from unknown member " << msg.sender << ", resyncing roster";
        resync(now);
    }
}

void SessionManager::handle_metrics(const protocol::Message& msg, const protocol::MetricUpdate& m,
                                    TimePoint now) {
    if (state_ != SessionState::Active || !info_ || m.session_id != info_->id) return;

    auto* p = open_entry(msg.sender);
    if (!p) return;
    if (!metric_filter_.accept(msg.sender, protocol::MessageTag::MetricUpdate, msg.sent_at)) return;

    p->last_metrics = m.metrics;
    p->touch(now);
    emit(events::MetricsReceived{msg.sender, m.metrics, from_wire_ms(msg.sent_at)});
}

void SessionManager::on_peer_lost(const RiderId& rider, TimePoint now) {
    if (state_ != SessionState::Active || rider == self_.id()) return;
    if (!open_entry(rider)) return;

    if (apply_leave(rider, to_wire_ms(now), LeaveReason::TimedOut)) {
        if (info_->host_id == rider) {
            log::warn(kTag) << "host " << rider << " timed out";
        } else {
            log::info(kTag) << rider << " timed out";
        }
        emit_roster();
    }
}

void SessionManager::on_peer_recovered(const RiderId& rider, TimePoint now) {
    if (state_ != SessionState::Active) return;

    auto m = membership_.find(rider);
    if (m == membership_.end() || m->second.present || m->second.reason != LeaveReason::TimedOut) return;

    std::string name;
    for (const auto& p : participants_) {
        if (p.rider_id == rider) name = p.name;
    }

    const auto stamp = std::max(to_wire_ms(now), m->second.stamp + 1);
    if (apply_join(rider, name, stamp, Endpoint{}, now) == Applied::Added) {
        log::info(kTag) << name << " (" << rider << ") is back";
        emit(events::ParticipantReconnected{info_->id, rider});
        emit_roster();
    }
}

void SessionManager::tick(TimePoint now) {
    if (pending_) {
        if (now >= pending_->deadline) {
            const auto id = pending_->session_id;
            if (state_ == SessionState::Joining) {
                log::warn(kTag) << "join " << id << " timed out";
                reset_session();
                set_state(SessionState::Idle, id, errc::join_timeout);
            } else {
                log::warn(kTag) << "rejoin " << id << " got no answer";
                pending_.reset();
            }
        } else if (now >= pending_->next_retry) {
            send_join(now);
            pending_->next_retry = now + config_.join_retry;
        }
    }

    if (state_ == SessionState::Active && is_host() && now - last_announce_ >= config_.heartbeat_interval) {
        announce(now);
    }

    for (auto it = announced_.begin(); it != announced_.end();) {
        if (now - it->second.last_seen >= config_.peer_expiry) {
            it = announced_.erase(it);
        } else {
            ++it;
        }
    }
}

// ---- queries ----

std::vector<Participant> SessionManager::roster() const {
    std::vector<Participant> out;
    for (const auto& p : participants_) {
        if (p.active()) out.push_back(p);
    }
    std::sort(out.begin(), out.end(),
              [](const Participant& a, const Participant& b) { return a.rider_id < b.rider_id; });
    return out;
}

std::vector<RiderId> SessionManager::members() const {
    std::vector<RiderId> out;
    for (const auto& p : roster()) out.push_back(p.rider_id);
    return out;
}

std::vector<AnnouncedSession> SessionManager::available_sessions() const {
    std::vector<AnnouncedSession> out;
    out.reserve(announced_.size());
    for (const auto& [id, s] : announced_) out.push_back(s);
    return out;
}

SessionRecord SessionManager::record() const {
    SessionRecord r;
    if (info_) r.info = *info_;
    r.participants = participants_;
    r.ended_at = ended_at_;
    return r;
}

// ---- roster register ----

SessionManager::Applied SessionManager::apply_join(const RiderId& rider, const std::string& name,
                                                   std::int64_t joined_at, const Endpoint& address,
                                                   TimePoint now) {
    auto [it, inserted] = membership_.try_emplace(rider);
    auto& m = it->second;

    if (!inserted && joined_at <= m.stamp) {
        // Older than the latest leave: keep the stint for the record only.
        if (!m.present && joined_at < m.stamp) {
            const auto left = from_wire_ms(m.stamp);
            const bool known = std::any_of(participants_.begin(), participants_.end(), [&](const Participant& p) {
                return p.rider_id == rider && p.joined_at == from_wire_ms(joined_at);
            });
            if (!known) {
                Participant p;
                p.rider_id = rider;
                p.name = name;
                p.session_id = info_ ? info_->id : SessionId{};
                p.joined_at = from_wire_ms(joined_at);
                p.left_at = left;
                p.leave_reason = m.reason;
                p.last_heartbeat = now;
                p.is_host = info_ && info_->host_id == rider;
                participants_.push_back(std::move(p));
            }
        }
        return Applied::Stale;
    }

    m.stamp = joined_at;
    m.present = true;
    m.reason.reset();

    if (auto* p = open_entry(rider)) {
        p->touch(now);
        if (address.port() != 0) p->address = address;
        return Applied::Refreshed;
    }

    Participant p;
    p.rider_id = rider;
    p.name = name;
    p.session_id = info_ ? info_->id : SessionId{};
    p.joined_at = from_wire_ms(joined_at);
    p.last_heartbeat = now;
    p.address = address;
    p.is_host = info_ && info_->host_id == rider;
    participants_.push_back(std::move(p));
    return Applied::Added;
}

bool SessionManager::apply_leave(const RiderId& rider, std::int64_t left_at, LeaveReason reason) {
    auto [it, inserted] = membership_.try_emplace(rider);
    auto& m = it->second;

    if (!inserted && (left_at < m.stamp || (left_at == m.stamp && !m.present))) return false;

    m.stamp = left_at;
    m.present = false;
    m.reason = reason;

    auto* p = open_entry(rider);
    if (!p) return true;

    p->left_at = from_wire_ms(left_at);
    p->leave_reason = reason;
    if (rider != self_.id()) emit(events::ParticipantLeft{p->session_id, rider, reason});
    return true;
}

Participant* SessionManager::open_entry(const RiderId& rider) {
    for (auto& p : participants_) {
        if (p.rider_id == rider && p.active()) return &p;
    }
    return nullptr;
}

const Participant* SessionManager::open_entry(const RiderId& rider) const {
    for (const auto& p : participants_) {
        if (p.rider_id == rider && p.active()) return &p;
    }
    return nullptr;
}

std::size_t SessionManager::active_count() const {
    return static_cast<std::size_t>(
        std::count_if(participants_.begin(), participants_.end(), [](const Participant& p) { return p.active(); }));
}

// ---- helpers ----

void SessionManager::reset_session() {
    info_.reset();
    participants_.clear();
    membership_.clear();
    pending_.reset();
    metric_filter_ = networking::StalenessFilter{};
    last_announce_ = TimePoint{};
    ended_at_ = TimePoint{};
}

void SessionManager::end_locally(TimePoint now, LeaveReason reason) {
    const auto stamp = to_wire_ms(now);
    for (auto& p : participants_) {
        if (!p.active()) continue;
        p.left_at = now;
        p.leave_reason = reason;
        auto& m = membership_[p.rider_id];
        m.stamp = std::max(m.stamp, stamp);
        m.present = false;
        m.reason = reason;
    }
    pending_.reset();
    ended_at_ = now;
}

void SessionManager::send_join(TimePoint now) {
    protocol::SessionJoin j;
    j.session_id = pending_->session_id;
    j.rider_id = self_.id();
    j.rider_name = self_.name();
    j.joined_at = pending_->joined_at;
    j.rejoin = pending_->rejoin;
    outbox_.send_to(pending_->host_address, protocol::make_message(self_.id(), now, j));
}

void SessionManager::send_to_members(const protocol::Message& msg, const RiderId& except) {
    for (const auto& p : participants_) {
        if (!p.active() || p.rider_id == self_.id() || p.rider_id == except) continue;
        outbox_.send_to(p.rider_id, msg);
    }
}

protocol::JoinAccepted SessionManager::snapshot() const {
    protocol::JoinAccepted a;
    a.session_id = info_->id;
    a.world_id = info_->world_id;
    a.host_id = info_->host_id;
    for (const auto& p : roster()) {
        const auto& m = membership_.at(p.rider_id);
        a.roster.push_back(protocol::ParticipantInfo{p.rider_id, p.name, m.stamp});
    }
    return a;
}

void SessionManager::announce(TimePoint now) {
    protocol::SessionAnnounce a;
    a.session_id = info_->id;
    a.host_name = self_.name();
    a.world_id = info_->world_id;
    a.participant_count = clamp_u8(active_count());
    a.max_participants = clamp_u8(info_->max_participants);
    outbox_.broadcast(protocol::make_message(self_.id(), now, a));
    last_announce_ = now;
}

std::optional<Endpoint> SessionManager::host_address() const {
    if (!info_) return std::nullopt;
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        if (it->rider_id == info_->host_id && it->address.port() != 0) return it->address;
    }
    auto a = announced_.find(info_->id);
    if (a != announced_.end()) return a->second.host_address;
    return std::nullopt;
}

void SessionManager::set_state(SessionState state, const SessionId& id, error_code error) {
    state_ = state;
    log::debug(kTag) << "state " << to_string(state) << (id.empty() ? "" : " ") << id;
    emit(events::SessionStateChanged{state, id, error});
}

void SessionManager::emit(events::Event ev) {
    if (on_event_) on_event_(ev);
}

void SessionManager::emit_roster() {
    if (!info_) return;
    emit(events::RosterChanged{info_->id, members()});
}

} // namespace groupride::session
