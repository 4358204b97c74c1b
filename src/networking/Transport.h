#pragma once

#include "core/Types.h"
#include "networking/Outbox.h"
#include "protocol/Message.h"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace groupride::networking {

// Unreliable datagram channel: unicast socket for session control, chat and
// clock probes; multicast group for metrics, race traffic and heartbeats.
// At-most-once, unordered. Tracks peer liveness from every received message.
class Transport : public Outbox {
public:
    using Handler     = std::function<void(const protocol::Message&, const Endpoint& from)>;
    using PeerHandler = std::function<void(const RiderId&)>;

    struct Options {
        RiderId local_rider;
        std::string bind_address = "0.0.0.0";
        std::uint16_t unicast_port = 0;
        bool multicast = true;  // false: broadcast() fans out over unicast
        std::string multicast_group = "239.255.42.42";
        std::uint16_t sync_port = 7879;
        int multicast_ttl = 1;
        Millis heartbeat_interval{1000};
        int heartbeat_miss_threshold = 5;
    };

    Transport(boost::asio::io_context& ioc, Options options);
    ~Transport() override;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Handlers run on the transport strand; register before start().
    void on(protocol::MessageTag tag, Handler handler);
    void set_on_peer_lost(PeerHandler cb);
    void set_on_peer_recovered(PeerHandler cb);

    // Binds both sockets and starts receiving and heartbeating.
    // Throws boost::system::system_error when a socket cannot be bound.
    void start();
    void stop();

    // Address learned out of band (discovery, manual entry).
    void learn_peer(const RiderId& rider, const Endpoint& ep);

    // Session id carried in outgoing heartbeats.
    void set_heartbeat_session(SessionId id);

    Endpoint local_endpoint() const;

    void send_to(const RiderId& rider, const protocol::Message& msg) override;
    void send_to(const Endpoint& to, const protocol::Message& msg) override;
    void broadcast(const protocol::Message& msg) override;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace groupride::networking
