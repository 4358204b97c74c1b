#include "engine/Events.h"

namespace groupride::events {

namespace {

struct NameOf {
    const char* operator()(const PeerAppeared&) const { return "peer_appeared"; }
    const char* operator()(const PeerVanished&) const { return "peer_vanished"; }
    const char* operator()(const SessionAvailable&) const { return "session_available"; }
    const char* operator()(const SessionStateChanged&) const { return "session_state"; }
    const char* operator()(const ParticipantJoined&) const { return "participant_joined"; }
    const char* operator()(const ParticipantLeft&) const { return "participant_left"; }
    const char* operator()(const ParticipantReconnected&) const { return "participant_reconnected"; }
    const char* operator()(const RosterChanged&) const { return "roster"; }
    const char* operator()(const MetricsReceived&) const { return "metrics"; }
    const char* operator()(const ChatReceived&) const { return "chat"; }
    const char* operator()(const ChatStatusChanged&) const { return "chat_status"; }
    const char* operator()(const RaceStatusChanged&) const { return "race_status"; }
    const char* operator()(const RaceCountdownTick&) const { return "race_countdown"; }
    const char* operator()(const RacerStatusChanged&) const { return "racer_status"; }
    const char* operator()(const RaceStandings&) const { return "race_standings"; }
    const char* operator()(const RaceResultsReady&) const { return "race_results"; }
    const char* operator()(const ClockSyncUpdated&) const { return "clock_sync"; }
    const char* operator()(const ComponentDegraded&) const { return "degraded"; }
};

} // namespace

const char* event_name(const Event& ev) noexcept {
    return std::visit(NameOf{}, ev);
}

} // namespace groupride::events
