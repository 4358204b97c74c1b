#pragma once

#include "core/Config.h"
#include "core/Rider.h"
#include "core/Types.h"
#include "discovery/PeerTable.h"
#include "engine/Events.h"
#include "engine/Interfaces.h"
#include "protocol/Message.h"
#include "race/RaceTypes.h"
#include "session/Participant.h"

#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace groupride::engine {

// Facade over discovery, transport, session, chat, race and clock sync.
//
// Each component lives on its own strand and owns its state; the engine only
// posts work between them. Completions and subscriber callbacks run on engine
// threads, never inline in the calling thread.
class Engine {
public:
    using error_code = boost::system::error_code;
    using Completion = std::function<void(error_code)>;
    using ChatCompletion = std::function<void(error_code, std::uint32_t message_id)>;

    struct Collaborators {
        MetricsSource* metrics = nullptr;
        HistorySink* history = nullptr;
        RenderSink* render = nullptr;
    };

    Engine(boost::asio::io_context& ioc, Config config, Rider self);
    Engine(boost::asio::io_context& ioc, Config config, Rider self, Collaborators io);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Opens sockets and starts timers. A component that cannot start is
    // reported through ComponentDegraded; the engine keeps running without it.
    void start();
    void stop();

    void subscribe(events::EventHandler handler);

    void host_session(std::string world_id, Completion done = {});
    void join_session(SessionId session_id, Completion done = {});
    void leave_session(Completion done = {});
    void broadcast_metrics(protocol::RiderMetrics metrics, Completion done = {});
    void send_chat(std::string text, ChatCompletion done = {});

    void create_race(race::RaceSpec spec, Completion done = {});
    void join_race(RaceId race_id, Completion done = {});
    void cancel_race(Completion done = {});
    void end_race(Completion done = {});

    void peers(std::function<void(std::vector<discovery::PeerInfo>)> done);
    void sessions(std::function<void(std::vector<session::AnnouncedSession>)> done);

    // Connectivity came back: restart what failed, re-advertise, rejoin.
    void on_network_restored();

    const Rider& rider() const noexcept;
    Endpoint local_endpoint() const;
    bool degraded() const noexcept;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace groupride::engine
