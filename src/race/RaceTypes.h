#pragma once

#include "core/Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace groupride::race {

enum class RaceStatus : std::uint8_t { Scheduled = 1, Countdown, InProgress, Finished, Cancelled };

// Registered -> Racing -> Finished | Dnf. Finished and Dnf are terminal.
enum class RacerStatus { Registered, Racing, Finished, Dnf };

const char* to_string(RaceStatus status) noexcept;
const char* to_string(RacerStatus status) noexcept;

inline bool is_terminal(RaceStatus s) noexcept {
    return s == RaceStatus::Finished || s == RaceStatus::Cancelled;
}

inline bool is_terminal(RacerStatus s) noexcept {
    return s == RacerStatus::Finished || s == RacerStatus::Dnf;
}

struct RaceSpec {
    std::string name;
    std::string course_id;
    double distance_m = 0.0;
    TimePoint scheduled_start{};
    Millis countdown{0};
};

struct RaceEvent {
    RaceId id;
    RiderId organizer;
    SessionId session_id;
    std::string name;
    std::string course_id;
    double distance_m = 0.0;
    TimePoint scheduled_start{};  // organizer clock
    Millis countdown{0};
    RaceStatus status = RaceStatus::Scheduled;
};

struct RaceParticipant {
    RiderId rider_id;
    std::string name;
    RacerStatus status = RacerStatus::Registered;
    double distance_m = 0.0;
    Millis elapsed{0};
    std::optional<Millis> finish_time;
    std::optional<int> finish_rank;
    std::optional<TimePoint> disconnected_since;  // pending-disconnect
    TimePoint last_heard{};
};

struct Standing {
    int position = 0;
    RiderId rider_id;
    std::string name;
    RacerStatus status = RacerStatus::Registered;
    double distance_m = 0.0;
    std::optional<Millis> finish_time;
    bool pending_disconnect = false;
};

struct RaceResult {
    int rank = 0;
    RiderId rider_id;
    std::string name;
    Millis finish_time{0};
    Millis gap_to_winner{0};
};

struct RaceResults {
    RaceEvent race;
    std::vector<RaceResult> finishers;
    std::vector<RiderId> dnf;
};

} // namespace groupride::race
