#pragma once

#include "core/Types.h"
#include "discovery/ServiceRecord.h"

#include <boost/asio/ip/address.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace groupride::discovery {

struct PeerInfo {
    RiderId rider_id;
    std::string name;
    Endpoint address;  // transport unicast endpoint
    std::optional<SessionId> session_id;
    std::optional<std::string> world_id;
    TimePoint last_seen{};
};

struct PeerEvent {
    enum class Kind { Appeared, Updated, Vanished };
    Kind kind;
    PeerInfo peer;
};

// Live view of advertising peers. Entries expire when the advertiser's TTL
// passes without a fresh record.
class PeerTable {
public:
    PeerTable(RiderId self, std::string service_type);

    std::optional<PeerEvent> observe(const ServiceRecord& record,
                                     const boost::asio::ip::address& from,
                                     TimePoint now);

    std::vector<PeerEvent> expire(TimePoint now);

    std::vector<PeerInfo> peers() const;
    std::optional<PeerInfo> find(const RiderId& rider) const;

    void clear() { entries_.clear(); }

private:
    struct Entry {
        PeerInfo info;
        TimePoint expires_at;
    };

    RiderId self_;
    std::string service_type_;
    std::unordered_map<RiderId, Entry> entries_;
};

} // namespace groupride::discovery
