#pragma once

#include "chat/ChatTypes.h"
#include "core/Types.h"
#include "discovery/PeerTable.h"
#include "protocol/Message.h"
#include "race/RaceTypes.h"
#include "session/Participant.h"

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace groupride::events {

// ---- discovery ----

struct PeerAppeared {
    discovery::PeerInfo peer;
};

struct PeerVanished {
    RiderId rider_id;
    std::string name;
};

struct SessionAvailable {
    session::AnnouncedSession session;
};

// ---- session ----

struct SessionStateChanged {
    session::SessionState state = session::SessionState::Idle;
    SessionId session_id;
    boost::system::error_code error;  // set when a join failed
};

struct ParticipantJoined {
    SessionId session_id;
    RiderId rider_id;
    std::string name;
};

struct ParticipantLeft {
    SessionId session_id;
    RiderId rider_id;
    session::LeaveReason reason = session::LeaveReason::Left;
};

struct ParticipantReconnected {
    SessionId session_id;
    RiderId rider_id;
};

// Active members after any roster change, self included.
struct RosterChanged {
    SessionId session_id;
    std::vector<RiderId> members;
};

struct MetricsReceived {
    RiderId rider_id;
    protocol::RiderMetrics metrics;
    TimePoint sent_at{};
};

// ---- chat ----

struct ChatReceived {
    chat::ChatEntry entry;
};

struct ChatStatusChanged {
    std::uint32_t message_id = 0;
    chat::ChatStatus status = chat::ChatStatus::Pending;
    std::size_t acked = 0;
    std::size_t recipients = 0;
};

// ---- race ----

struct RaceStatusChanged {
    race::RaceEvent race;
};

struct RaceCountdownTick {
    RaceId race_id;
    Millis remaining{0};
};

struct RacerStatusChanged {
    RaceId race_id;
    RiderId rider_id;
    race::RacerStatus status = race::RacerStatus::Registered;
    bool pending_disconnect = false;
};

struct RaceStandings {
    RaceId race_id;
    std::vector<race::Standing> standings;
};

struct RaceResultsReady {
    race::RaceResults results;
};

// ---- engine ----

struct ClockSyncUpdated {
    RiderId peer;
    double offset_ms = 0.0;
    double round_trip_ms = 0.0;
};

// A component could not start; the engine keeps running without it.
struct ComponentDegraded {
    std::string component;
    boost::system::error_code error;
};

using Event = std::variant<
    PeerAppeared, PeerVanished, SessionAvailable,
    SessionStateChanged, ParticipantJoined, ParticipantLeft, ParticipantReconnected,
    RosterChanged, MetricsReceived,
    ChatReceived, ChatStatusChanged,
    RaceStatusChanged, RaceCountdownTick, RacerStatusChanged, RaceStandings, RaceResultsReady,
    ClockSyncUpdated, ComponentDegraded>;

using EventHandler = std::function<void(const Event&)>;

const char* event_name(const Event& ev) noexcept;

} // namespace groupride::events
