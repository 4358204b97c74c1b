#pragma once

#include "core/Types.h"
#include "protocol/Message.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace groupride::session {

enum class SessionState { Idle, Hosting, Joining, Active, Ended };

const char* to_string(SessionState state) noexcept;

struct SessionInfo {
    SessionId id;
    RiderId host_id;
    std::string host_name;
    std::string world_id;
    TimePoint created_at{};
    std::size_t max_participants = 0;
};

enum class LeaveReason { Left, TimedOut, SessionEnded };

const char* to_string(LeaveReason reason) noexcept;

// One stint of a rider in a session. A rider who drops out and comes back
// gets a fresh entry; the closed one stays for the history record.
struct Participant {
    RiderId rider_id;
    std::string name;
    SessionId session_id;
    TimePoint joined_at{};
    std::optional<TimePoint> left_at;
    std::optional<LeaveReason> leave_reason;
    std::optional<protocol::RiderMetrics> last_metrics;
    TimePoint last_heartbeat{};
    Endpoint address;
    bool is_host = false;

    bool active() const noexcept { return !left_at.has_value(); }
    void touch(TimePoint now) noexcept {
        if (now > last_heartbeat) last_heartbeat = now;
    }
};

// A session some host is advertising on the sync group.
struct AnnouncedSession {
    SessionId id;
    RiderId host_id;
    std::string host_name;
    std::string world_id;
    Endpoint host_address;
    std::size_t participants = 0;
    std::size_t capacity = 0;
    TimePoint last_seen{};
};

// What the history sink receives once a session ends.
struct SessionRecord {
    SessionInfo info;
    std::vector<Participant> participants;
    TimePoint ended_at{};
};

} // namespace groupride::session
