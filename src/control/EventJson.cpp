#include "control/EventJson.h"

#include "chat/ChatTypes.h"

#include <boost/json/array.hpp>

#include <optional>
#include <variant>

namespace groupride::control {

namespace json = boost::json;

namespace {

json::string endpoint_text(const Endpoint& ep) {
    return json::string(ep.address().to_string() + ":" + std::to_string(ep.port()));
}

json::array ids(const std::vector<RiderId>& riders) {
    json::array out;
    out.reserve(riders.size());
    for (const auto& r : riders) out.emplace_back(r);
    return out;
}

json::value optional_ms(const std::optional<Millis>& v) {
    if (!v) return nullptr;
    return v->count();
}

json::object error_fields(const boost::system::error_code& ec) {
    return {
        {"code", ec.value()},
        {"category", ec.category().name()},
        {"text", ec.message()},
    };
}

struct Serializer {
    json::object& out;

    void operator()(const events::PeerAppeared& e) const {
        out["peer"] = to_json(e.peer);
    }

    void operator()(const events::PeerVanished& e) const {
        out["rider_id"] = e.rider_id;
        out["name"] = e.name;
    }

    void operator()(const events::SessionAvailable& e) const {
        out["session"] = to_json(e.session);
    }

    void operator()(const events::SessionStateChanged& e) const {
        out["state"] = session::to_string(e.state);
        out["session_id"] = e.session_id;
        if (e.error) out["error"] = error_fields(e.error);
    }

    void operator()(const events::ParticipantJoined& e) const {
        out["session_id"] = e.session_id;
        out["rider_id"] = e.rider_id;
        out["name"] = e.name;
    }

    void operator()(const events::ParticipantLeft& e) const {
        out["session_id"] = e.session_id;
        out["rider_id"] = e.rider_id;
        out["reason"] = session::to_string(e.reason);
    }

    void operator()(const events::ParticipantReconnected& e) const {
        out["session_id"] = e.session_id;
        out["rider_id"] = e.rider_id;
    }

    void operator()(const events::RosterChanged& e) const {
        out["session_id"] = e.session_id;
        out["members"] = ids(e.members);
    }

    void operator()(const events::MetricsReceived& e) const {
        out["rider_id"] = e.rider_id;
        out["metrics"] = to_json(e.metrics);
        out["sent_at"] = to_wire_ms(e.sent_at);
    }

    void operator()(const events::ChatReceived& e) const {
        const auto& c = e.entry;
        out["sender"] = c.sender;
        out["message_id"] = c.message_id;
        out["text"] = c.text;
        out["sent_at"] = to_wire_ms(c.sent_at);
        out["received_at"] = to_wire_ms(c.received_at);
        out["status"] = chat::to_string(c.status);
    }

    void operator()(const events::ChatStatusChanged& e) const {
        out["message_id"] = e.message_id;
        out["status"] = chat::to_string(e.status);
        out["acked"] = e.acked;
        out["recipients"] = e.recipients;
    }

    void operator()(const events::RaceStatusChanged& e) const {
        out["race"] = to_json(e.race);
    }

    void operator()(const events::RaceCountdownTick& e) const {
        out["race_id"] = e.race_id;
        out["remaining_ms"] = e.remaining.count();
    }

    void operator()(const events::RacerStatusChanged& e) const {
        out["race_id"] = e.race_id;
        out["rider_id"] = e.rider_id;
        out["status"] = race::to_string(e.status);
        out["pending_disconnect"] = e.pending_disconnect;
    }

    void operator()(const events::RaceStandings& e) const {
        out["race_id"] = e.race_id;
        json::array rows;
        rows.reserve(e.standings.size());
        for (const auto& s : e.standings) {
            rows.emplace_back(json::object{
                {"position", s.position},
                {"rider_id", s.rider_id},
                {"name", s.name},
                {"status", race::to_string(s.status)},
                {"distance_m", s.distance_m},
                {"finish_time_ms", optional_ms(s.finish_time)},
                {"pending_disconnect", s.pending_disconnect},
            });
        }
        out["standings"] = std::move(rows);
    }

    void operator()(const events::RaceResultsReady& e) const {
        const auto& r = e.results;
        out["race"] = to_json(r.race);
        json::array finishers;
        finishers.reserve(r.finishers.size());
        for (const auto& f : r.finishers) {
            finishers.emplace_back(json::object{
                {"rank", f.rank},
                {"rider_id", f.rider_id},
                {"name", f.name},
                {"finish_time_ms", f.finish_time.count()},
                {"gap_ms", f.gap_to_winner.count()},
            });
        }
        out["finishers"] = std::move(finishers);
        out["dnf"] = ids(r.dnf);
    }

    void operator()(const events::ClockSyncUpdated& e) const {
        out["peer"] = e.peer;
        out["offset_ms"] = e.offset_ms;
        out["round_trip_ms"] = e.round_trip_ms;
    }

    void operator()(const events::ComponentDegraded& e) const {
        out["component"] = e.component;
        out["error"] = error_fields(e.error);
    }
};

} // namespace

json::object to_json(const events::Event& ev) {
    json::object out{{"type", events::event_name(ev)}};
    std::visit(Serializer{out}, ev);
    return out;
}

json::object to_json(const discovery::PeerInfo& peer) {
    json::object out{
        {"rider_id", peer.rider_id},
        {"name", peer.name},
        {"address", endpoint_text(peer.address)},
        {"last_seen", to_wire_ms(peer.last_seen)},
    };
    out["session_id"] = peer.session_id ? json::value(*peer.session_id) : json::value(nullptr);
    out["world_id"] = peer.world_id ? json::value(*peer.world_id) : json::value(nullptr);
    return out;
}

json::object to_json(const session::AnnouncedSession& s) {
    return {
        {"session_id", s.id},
        {"host_id", s.host_id},
        {"host_name", s.host_name},
        {"world_id", s.world_id},
        {"host_address", endpoint_text(s.host_address)},
        {"participants", s.participants},
        {"capacity", s.capacity},
    };
}

json::object to_json(const protocol::RiderMetrics& m) {
    return {
        {"power_watts", m.power_watts},
        {"cadence_rpm", m.cadence_rpm},
        {"heart_rate_bpm", m.heart_rate_bpm},
        {"speed_kmh", static_cast<double>(m.speed_kmh)},
        {"distance_m", m.distance_m},
    };
}

json::object to_json(const race::RaceEvent& r) {
    return {
        {"race_id", r.id},
        {"organizer", r.organizer},
        {"session_id", r.session_id},
        {"name", r.name},
        {"course_id", r.course_id},
        {"distance_m", r.distance_m},
        {"scheduled_start", to_wire_ms(r.scheduled_start)},
        {"countdown_ms", r.countdown.count()},
        {"status", race::to_string(r.status)},
    };
}

json::object peers_reply(const std::vector<discovery::PeerInfo>& peers) {
    json::array list;
    list.reserve(peers.size());
    for (const auto& p : peers) list.emplace_back(to_json(p));
    return {{"type", "peers"}, {"peers", std::move(list)}};
}

json::object sessions_reply(const std::vector<session::AnnouncedSession>& sessions) {
    json::array list;
    list.reserve(sessions.size());
    for (const auto& s : sessions) list.emplace_back(to_json(s));
    return {{"type", "sessions"}, {"sessions", std::move(list)}};
}

json::object error_reply(const std::string& command, const boost::system::error_code& ec) {
    json::object out{{"type", "error"}, {"command", command}};
    out["code"] = ec.value();
    out["text"] = ec.message();
    return out;
}

json::object error_reply(const std::string& command, const std::string& text) {
    return {{"type", "error"}, {"command", command}, {"text", text}};
}

json::object ok_reply(const std::string& command, json::object extra) {
    extra["type"] = "ok";
    extra["command"] = command;
    return extra;
}

} // namespace groupride::control
