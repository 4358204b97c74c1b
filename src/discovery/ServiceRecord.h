#pragma once

#include "core/Types.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace groupride::discovery {

constexpr std::uint8_t kDiscoveryVersion = 1;

// One DNS-SD style advertisement. On the wire it is TXT rdata: a run of
// length-prefixed "key=value" strings.
struct ServiceRecord {
    std::string service_type;
    std::string instance_name;  // rider display name
    RiderId rider_id;
    std::uint16_t port = 0;     // transport unicast port
    std::uint8_t version = kDiscoveryVersion;
    std::uint32_t ttl_ms = 0;   // 0 = goodbye
    std::map<std::string, std::string> attributes;  // "session", "world"

    std::optional<std::string> attribute(const std::string& key) const;
};

std::vector<std::uint8_t> encode_record(const ServiceRecord& record);
std::optional<ServiceRecord> decode_record(const std::uint8_t* data, std::size_t size);

} // namespace groupride::discovery
