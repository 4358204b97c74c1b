#pragma once

#include "core/Types.h"
#include "discovery/PeerTable.h"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace groupride::discovery {

// Multicast service discovery. Advertises this node's record periodically and
// maintains the table of peers advertising the same service type.
// Without a multicast-capable interface it stays disabled and reports no peers.
class Discovery {
public:
    using EventHandler = std::function<void(const PeerEvent&)>;
    using PeersHandler = std::function<void(std::vector<PeerInfo>)>;

    struct Options {
        std::string service_type = "_groupride._udp.local.";
        RiderId rider_id;
        std::string display_name;
        std::uint16_t transport_port = 0;
        std::string group = "239.255.42.41";
        std::uint16_t port = 7878;
        int multicast_ttl = 1;
        Millis announce_interval{2000};
        Millis peer_expiry{6000};
    };

    Discovery(boost::asio::io_context& ioc, Options options);
    ~Discovery();

    Discovery(const Discovery&) = delete;
    Discovery& operator=(const Discovery&) = delete;

    // Peer appeared/updated/vanished events, delivered on the discovery strand.
    void browse(EventHandler handler);

    // Returns false (and stays disabled) when the multicast socket cannot be set up.
    bool start();

    // Sends a goodbye record so peers drop us at once.
    void stop();

    bool enabled() const noexcept;

    // Re-advertise with (or without) an active session; announces immediately.
    void advertise(std::optional<SessionId> session, std::optional<std::string> world);

    // Snapshot of the peer table, delivered on the discovery strand.
    void peers(PeersHandler handler);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace groupride::discovery
