#pragma once

#include "core/Config.h"
#include "core/IdGenerator.hpp"
#include "core/Rider.h"
#include "core/Types.h"
#include "engine/Events.h"
#include "networking/Liveness.h"
#include "networking/Outbox.h"
#include "protocol/Message.h"
#include "session/Participant.h"

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace groupride::session {

// Session lifecycle and roster for the local rider.
//
// Not thread-safe: the engine drives one instance from a single strand.
// Membership is a last-writer-wins register per rider keyed on the join/leave
// instant, so every member converges on the same roster whatever order the
// notices arrive in.
class SessionManager {
public:
    using error_code = boost::system::error_code;

    SessionManager(const Rider& self, const Config& config,
                   networking::Outbox& outbox, IdGenerator& ids);

    void set_on_event(events::EventHandler handler);

    // Idle|Ended -> Hosting -> Active.
    error_code host(const std::string& world_id, TimePoint now);

    // Idle|Ended -> Joining; Active on JoinAccepted, back to Idle on
    // rejection or join_timeout.
    error_code join(const SessionId& session_id, TimePoint now);

    // Active -> Ended. A leaving host ends the session for everyone.
    error_code leave(TimePoint now);

    // Rate-limited metric snapshot to the session group.
    error_code broadcast_metrics(const protocol::RiderMetrics& metrics, TimePoint now);

    // Network came back: re-join the host with the same rider id.
    void on_network_restored(TimePoint now);

    // Inbound session traffic (announce, join, leave, heartbeat, metrics).
    void handle(const protocol::Message& msg, const Endpoint& from, TimePoint now);

    // A session host seen through service discovery.
    void on_discovered(const RiderId& host, const std::string& host_name,
                       const SessionId& session_id, const std::string& world_id,
                       const Endpoint& address, TimePoint now);

    void on_peer_lost(const RiderId& rider, TimePoint now);
    void on_peer_recovered(const RiderId& rider, TimePoint now);

    // Join retries/timeouts and the host's periodic announce.
    void tick(TimePoint now);

    SessionState state() const noexcept { return state_; }
    bool is_host() const noexcept;
    const std::optional<SessionInfo>& session() const noexcept { return info_; }

    // Active participants, one per rider.
    std::vector<Participant> roster() const;
    std::vector<RiderId> members() const;

    // Every stint, including closed ones.
    const std::vector<Participant>& participants() const noexcept { return participants_; }

    std::vector<AnnouncedSession> available_sessions() const;

    // Snapshot for the history sink; valid once the session has ended.
    SessionRecord record() const;

private:
    struct Membership {
        std::int64_t stamp = 0;  // instant of the last applied join/leave
        bool present = false;
        std::optional<LeaveReason> reason;
    };

    enum class Applied { Added, Refreshed, Stale };

    struct PendingJoin {
        SessionId session_id;
        RiderId host_id;
        std::string host_name;
        Endpoint host_address;
        std::size_t capacity = 0;
        std::int64_t joined_at = 0;
        bool rejoin = false;
        TimePoint deadline{};
        TimePoint next_retry{};
    };

    void handle_announce(const protocol::Message& msg, const protocol::SessionAnnounce& a,
                         const Endpoint& from, TimePoint now);
    void handle_join(const protocol::Message& msg, const protocol::SessionJoin& j,
                     const Endpoint& from, TimePoint now);
    void handle_join_request(const protocol::SessionJoin& j, const Endpoint& from, TimePoint now);
    void handle_accepted(const protocol::Message& msg, const protocol::JoinAccepted& a,
                         const Endpoint& from, TimePoint now);
    void handle_rejected(const protocol::JoinRejected& r, TimePoint now);
    void handle_leave(const protocol::Message& msg, const protocol::SessionLeave& l, TimePoint now);
    void handle_ended(const protocol::Message& msg, const protocol::SessionEnded& e, TimePoint now);
    void handle_heartbeat(const protocol::Message& msg, const protocol::Heartbeat& h, TimePoint now);
    void handle_metrics(const protocol::Message& msg, const protocol::MetricUpdate& m, TimePoint now);

    Applied apply_join(const RiderId& rider, const std::string& name, std::int64_t joined_at,
                       const Endpoint& address, TimePoint now);
    bool apply_leave(const RiderId& rider, std::int64_t left_at, LeaveReason reason);

    Participant* open_entry(const RiderId& rider);
    const Participant* open_entry(const RiderId& rider) const;
    std::size_t active_count() const;

    void reset_session();
    void end_locally(TimePoint now, LeaveReason reason);
    void send_join(TimePoint now);
    void resync(TimePoint now);
    void send_to_members(const protocol::Message& msg, const RiderId& except = {});
    protocol::JoinAccepted snapshot() const;
    void announce(TimePoint now);

    std::optional<Endpoint> host_address() const;

    void set_state(SessionState state, const SessionId& id, error_code error = {});
    void emit(events::Event ev);
    void emit_roster();

private:
    Rider self_;
    const Config& config_;
    networking::Outbox& outbox_;
    IdGenerator& ids_;
    events::EventHandler on_event_;

    SessionState state_ = SessionState::Idle;
    std::optional<SessionInfo> info_;
    std::vector<Participant> participants_;
    std::unordered_map<RiderId, Membership> membership_;
    std::optional<PendingJoin> pending_;
    TimePoint last_announce_{};
    TimePoint ended_at_{};

    std::map<SessionId, AnnouncedSession> announced_;

    networking::StalenessFilter metric_filter_;
    networking::RateLimiter metric_limiter_;
};

} // namespace groupride::session
