#include "discovery/PeerTable.h"

#include <utility>

namespace groupride::discovery {

PeerTable::PeerTable(RiderId self, std::string service_type)
    : self_(std::move(self)),
      service_type_(std::move(service_type)) {}

std::optional<PeerEvent> PeerTable::observe(const ServiceRecord& record,
                                            const boost::asio::ip::address& from,
                                            TimePoint now) {
    if (record.service_type != service_type_) return std::nullopt;
    if (record.version != kDiscoveryVersion) return std::nullopt;
    if (record.rider_id == self_) return std::nullopt;

    if (record.ttl_ms == 0) {
        auto it = entries_.find(record.rider_id);
        if (it == entries_.end()) return std::nullopt;
        PeerEvent ev{PeerEvent::Kind::Vanished, std::move(it->second.info)};
        entries_.erase(it);
        return ev;
    }

    PeerInfo info;
    info.rider_id = record.rider_id;
    info.name = record.instance_name;
    info.address = Endpoint(from, record.port);
    info.session_id = record.attribute("session");
    info.world_id = record.attribute("world");
    info.last_seen = now;

    const auto expires_at = now + Millis(record.ttl_ms);

    auto it = entries_.find(record.rider_id);
    if (it == entries_.end()) {
        entries_.emplace(record.rider_id, Entry{info, expires_at});
        return PeerEvent{PeerEvent::Kind::Appeared, std::move(info)};
    }

    auto& old = it->second.info;
    const bool changed = old.name != info.name || old.address != info.address ||
                         old.session_id != info.session_id || old.world_id != info.world_id;
    it->second = Entry{info, expires_at};
    if (!changed) return std::nullopt;
    return PeerEvent{PeerEvent::Kind::Updated, std::move(info)};
}

std::vector<PeerEvent> PeerTable::expire(TimePoint now) {
    std::vector<PeerEvent> gone;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            gone.push_back(PeerEvent{PeerEvent::Kind::Vanished, std::move(it->second.info)});
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return gone;
}

std::vector<PeerInfo> PeerTable::peers() const {
    std::vector<PeerInfo> out;
    out.reserve(entries_.size());
    for (const auto& [id, e] : entries_) out.push_back(e.info);
    return out;
}

std::optional<PeerInfo> PeerTable::find(const RiderId& rider) const {
    auto it = entries_.find(rider);
    if (it == entries_.end()) return std::nullopt;
    return it->second.info;
}

} // namespace groupride::discovery
