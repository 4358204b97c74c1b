#pragma once

#include "core/Types.h"
#include "protocol/Message.h"

namespace groupride::networking {

// Where component cores put outgoing traffic. The engine backs it with the
// UDP transport; tests back it with an in-memory network.
class Outbox {
public:
    virtual ~Outbox() = default;

    // Unicast to a rider whose address the transport has learned.
    virtual void send_to(const RiderId& rider, const protocol::Message& msg) = 0;

    // Unicast to an explicit address (replies to not-yet-known riders).
    virtual void send_to(const Endpoint& to, const protocol::Message& msg) = 0;

    // Multicast to the sync group.
    virtual void broadcast(const protocol::Message& msg) = 0;
};

} // namespace groupride::networking
