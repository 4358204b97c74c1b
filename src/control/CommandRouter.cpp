#include "control/CommandRouter.h"

#include "control/EventJson.h"
#include "core/Log.h"

#include <boost/json.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace groupride::control {

namespace json = boost::json;

namespace {

constexpr const char* kTag = "Control";

const json::value& field(const json::object& args, const char* key) {
    const auto* v = args.if_contains(key);
    if (!v) throw std::invalid_argument(std::string("missing ") + key);
    return *v;
}

std::string string_arg(const json::object& args, const char* key) {
    const auto& v = field(args, key);
    if (!v.is_string()) throw std::invalid_argument(std::string(key) + " must be a string");
    return json::value_to<std::string>(v);
}

double number_arg(const json::object& args, const char* key) {
    const auto& v = field(args, key);
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    throw std::invalid_argument(std::string(key) + " must be a number");
}

double number_arg(const json::object& args, const char* key, double fallback) {
    return args.contains(key) ? number_arg(args, key) : fallback;
}

template <class T>
T bounded(const char* key, double v, double hi) {
    if (!std::isfinite(v) || v < 0.0 || v > hi) {
        throw std::invalid_argument(std::string(key) + " out of range");
    }
    return static_cast<T>(v);
}

} // namespace

protocol::RiderMetrics parse_metrics(const json::object& args) {
    protocol::RiderMetrics m;
    m.power_watts = bounded<std::uint16_t>("power_watts", number_arg(args, "power_watts", 0), 65535);
    m.cadence_rpm = bounded<std::uint8_t>("cadence_rpm", number_arg(args, "cadence_rpm", 0), 255);
    m.heart_rate_bpm = bounded<std::uint8_t>("heart_rate_bpm", number_arg(args, "heart_rate_bpm", 0), 255);
    m.speed_kmh = bounded<float>("speed_kmh", number_arg(args, "speed_kmh", 0), 1000);
    m.distance_m = bounded<double>("distance_m", number_arg(args, "distance_m"), 1e9);
    return m;
}

race::RaceSpec parse_race_spec(const json::object& args, TimePoint now, Millis default_countdown) {
    race::RaceSpec spec;
    spec.name = string_arg(args, "name");
    spec.course_id = args.contains("course_id") ? string_arg(args, "course_id") : std::string();
    spec.distance_m = number_arg(args, "distance_m");

    if (args.contains("scheduled_start")) {
        spec.scheduled_start = from_wire_ms(static_cast<std::int64_t>(number_arg(args, "scheduled_start")));
    } else {
        const auto in_s = bounded<double>("start_in_s", number_arg(args, "start_in_s"), 7 * 24 * 3600.0);
        spec.scheduled_start = now + std::chrono::duration_cast<Clock::duration>(
                                         std::chrono::duration<double>(in_s));
    }

    spec.countdown = default_countdown;
    if (args.contains("countdown_s")) {
        const auto s = bounded<double>("countdown_s", number_arg(args, "countdown_s"), 3600.0);
        spec.countdown = Millis(static_cast<Millis::rep>(s * 1000.0));
    }
    return spec;
}

CommandRouter::CommandRouter(engine::Engine& engine, Millis default_countdown)
    : engine_(engine), default_countdown_(default_countdown) {}

void CommandRouter::handle(std::string_view text, Reply reply) {
    boost::system::error_code ec;
    json::value v = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) {
        reply(error_reply("", "invalid json"));
        return;
    }

    const auto* obj = v.if_object();
    const auto* type = obj ? obj->if_contains("type") : nullptr;
    if (!type || !type->is_string()) {
        reply(error_reply("", "missing type"));
        return;
    }

    const std::string name = json::value_to<std::string>(*type);
    try {
        dispatch(name, *obj, reply);
    } catch (const std::invalid_argument& e) {
        log::info(kTag) << name << ": " << e.what();
        reply(error_reply(name, e.what()));
    }
}

void CommandRouter::dispatch(const std::string& type, const json::object& args, const Reply& reply) {
    auto done = [reply, type](boost::system::error_code ec) {
        reply(ec ? error_reply(type, ec) : ok_reply(type));
    };

    if (type == "host") {
        engine_.host_session(args.contains("world_id") ? string_arg(args, "world_id") : std::string(), done);
    }
    else if (type == "join") {
        engine_.join_session(string_arg(args, "session_id"), done);
    }
    else if (type == "leave") {
        engine_.leave_session(done);
    }
    else if (type == "chat") {
        engine_.send_chat(string_arg(args, "text"), [reply, type](boost::system::error_code ec, std::uint32_t id) {
            reply(ec ? error_reply(type, ec) : ok_reply(type, json::object{{"message_id", id}}));
        });
    }
    else if (type == "metrics") {
        engine_.broadcast_metrics(parse_metrics(args), done);
    }
    else if (type == "create_race") {
        engine_.create_race(parse_race_spec(args, Clock::now(), default_countdown_), done);
    }
    else if (type == "join_race") {
        engine_.join_race(string_arg(args, "race_id"), done);
    }
    else if (type == "cancel_race") {
        engine_.cancel_race(done);
    }
    else if (type == "end_race") {
        engine_.end_race(done);
    }
    else if (type == "peers") {
        engine_.peers([reply](std::vector<discovery::PeerInfo> peers) { reply(peers_reply(peers)); });
    }
    else if (type == "sessions") {
        engine_.sessions([reply](std::vector<session::AnnouncedSession> s) { reply(sessions_reply(s)); });
    }
    else {
        reply(error_reply(type, "unknown type"));
    }
}

} // namespace groupride::control
