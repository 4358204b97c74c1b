#pragma once

#include "core/Types.h"
#include "engine/Engine.h"
#include "protocol/Message.h"
#include "race/RaceTypes.h"

#include <boost/json/object.hpp>

#include <functional>
#include <string_view>

namespace groupride::control {

// Turns control-channel JSON commands into Engine calls:
//   {"type":"host","world_id":...}            {"type":"join","session_id":...}
//   {"type":"leave"}                          {"type":"chat","text":...}
//   {"type":"metrics","power_watts":...,"distance_m":...}
//   {"type":"create_race","name":...,"course_id":...,"distance_m":...,
//    "start_in_s":... | "scheduled_start":<epoch ms>, "countdown_s":...}
//   {"type":"join_race","race_id":...}  {"type":"cancel_race"}  {"type":"end_race"}
//   {"type":"peers"}  {"type":"sessions"}
// Every command gets exactly one reply: "ok", "error", "peers" or "sessions".
class CommandRouter {
public:
    using Reply = std::function<void(boost::json::object)>;

    CommandRouter(engine::Engine& engine, Millis default_countdown);

    void handle(std::string_view text, Reply reply);

private:
    void dispatch(const std::string& type, const boost::json::object& args, const Reply& reply);

    engine::Engine& engine_;
    Millis default_countdown_;
};

// Argument parsing; throw std::invalid_argument naming the bad field.
protocol::RiderMetrics parse_metrics(const boost::json::object& args);
race::RaceSpec parse_race_spec(const boost::json::object& args, TimePoint now, Millis default_countdown);

} // namespace groupride::control
