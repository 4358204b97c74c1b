#pragma once

#include "engine/Events.h"
#include "discovery/PeerTable.h"
#include "protocol/Message.h"
#include "race/RaceTypes.h"
#include "session/Participant.h"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <string>
#include <vector>

namespace groupride::control {

// Event documents pushed to control clients. Every object carries "type"
// (events::event_name) and times as milliseconds since the Unix epoch.
boost::json::object to_json(const events::Event& ev);

boost::json::object to_json(const discovery::PeerInfo& peer);
boost::json::object to_json(const session::AnnouncedSession& s);
boost::json::object to_json(const protocol::RiderMetrics& m);
boost::json::object to_json(const race::RaceEvent& race);

boost::json::object peers_reply(const std::vector<discovery::PeerInfo>& peers);
boost::json::object sessions_reply(const std::vector<session::AnnouncedSession>& sessions);

// {"type":"error","command":...,"code":...,"text":...}
boost::json::object error_reply(const std::string& command, const boost::system::error_code& ec);
boost::json::object error_reply(const std::string& command, const std::string& text);

// {"type":"ok","command":...} plus extra fields.
boost::json::object ok_reply(const std::string& command, boost::json::object extra = {});

} // namespace groupride::control
