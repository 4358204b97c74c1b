#pragma once

#include "core/Types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace groupride::protocol {

constexpr std::uint8_t kProtocolVersion = 1;
constexpr std::size_t kMaxMessageSize = 1400;  // one datagram, no fragmentation

enum class MessageTag : std::uint8_t {
    SessionAnnounce = 1,
    SessionJoin     = 2,
    JoinAccepted    = 3,
    JoinRejected    = 4,
    SessionLeave    = 5,
    SessionEnded    = 6,
    Heartbeat       = 7,
    MetricUpdate    = 8,
    ChatMessage     = 9,
    ChatAck         = 10,
    RaceAnnounce    = 11,
    RaceJoin        = 12,
    RaceCountdown   = 13,
    RacePosition    = 14,
    RaceFinish      = 15,
    RaceControl     = 16,
    Ping            = 17,
    Pong            = 18,
};

const char* tag_name(MessageTag tag) noexcept;

// ---- session control ----

struct SessionAnnounce {
    SessionId session_id;
    std::string host_name;
    std::string world_id;
    std::uint8_t participant_count = 0;
    std::uint8_t max_participants = 0;
};

struct SessionJoin {
    SessionId session_id;
    RiderId rider_id;
    std::string rider_name;
    std::int64_t joined_at = 0;  // original instant, kept when the host relays
    bool rejoin = false;
};

struct ParticipantInfo {
    RiderId rider_id;
    std::string rider_name;
    std::int64_t joined_at = 0;
};

struct JoinAccepted {
    SessionId session_id;
    std::string world_id;
    RiderId host_id;
    std::vector<ParticipantInfo> roster;
};

enum class RejectReason : std::uint8_t {
    UnknownSession = 1,
    SessionFull    = 2,
    SessionEnded   = 3,
    DuplicateJoin  = 4,
};

struct JoinRejected {
    SessionId session_id;
    RiderId rider_id;
    RejectReason reason = RejectReason::UnknownSession;
};

struct SessionLeave {
    SessionId session_id;
    RiderId rider_id;
    std::int64_t left_at = 0;
};

struct SessionEnded {
    SessionId session_id;
};

struct Heartbeat {
    SessionId session_id;  // empty when not in a session
};

// ---- metrics ----

struct RiderMetrics {
    std::uint16_t power_watts = 0;
    std::uint8_t cadence_rpm = 0;     // 0 = no sensor
    std::uint8_t heart_rate_bpm = 0;  // 0 = no sensor
    float speed_kmh = 0.f;
    double distance_m = 0.0;          // position along the route
};

struct MetricUpdate {
    SessionId session_id;
    RiderMetrics metrics;
};

// ---- chat ----

struct ChatMessage {
    std::uint32_t message_id = 0;  // per-sender, increasing
    std::string text;
};

struct ChatAck {
    RiderId original_sender;
    std::uint32_t message_id = 0;
};

// ---- race ----

struct RaceAnnounce {
    RaceId race_id;
    std::string name;
    std::string course_id;
    double distance_m = 0.0;
    std::int64_t scheduled_start = 0;
    std::uint32_t countdown_ms = 0;
    std::uint8_t status = 0;
    std::vector<RiderId> roster;
};

struct RaceJoin {
    RaceId race_id;
    RiderId rider_id;
    std::string rider_name;
};

struct RaceCountdown {
    RaceId race_id;
    std::int32_t remaining_ms = 0;
    std::int64_t start_at = 0;  // organizer clock
};

struct RacePosition {
    RaceId race_id;
    double distance_m = 0.0;
    std::uint32_t elapsed_ms = 0;
};

struct RaceFinish {
    RaceId race_id;
    std::uint32_t finish_time_ms = 0;
};

enum class RaceAction : std::uint8_t { Cancel = 1, End = 2 };

struct RaceControl {
    RaceId race_id;
    RaceAction action = RaceAction::Cancel;
};

// ---- clock probes ----

struct Ping {
    std::int64_t timestamp = 0;
};

struct Pong {
    std::int64_t echoed_timestamp = 0;
    std::int64_t local_time = 0;
};

// Alternative order must match MessageTag (index + 1).
using Payload = std::variant<
    SessionAnnounce, SessionJoin, JoinAccepted, JoinRejected, SessionLeave, SessionEnded,
    Heartbeat, MetricUpdate, ChatMessage, ChatAck,
    RaceAnnounce, RaceJoin, RaceCountdown, RacePosition, RaceFinish, RaceControl,
    Ping, Pong>;

static_assert(std::variant_size_v<Payload> == static_cast<std::size_t>(MessageTag::Pong),
              "Payload alternatives and MessageTag out of sync");

struct Message {
    RiderId sender;
    std::int64_t sent_at = 0;  // sender clock, ms since epoch
    Payload payload;

    MessageTag tag() const noexcept {
        return static_cast<MessageTag>(payload.index() + 1);
    }

    template <class T>
    const T* as() const noexcept { return std::get_if<T>(&payload); }
};

template <class T>
Message make_message(const RiderId& sender, TimePoint now, T body) {
    return Message{sender, to_wire_ms(now), Payload(std::move(body))};
}

} // namespace groupride::protocol
