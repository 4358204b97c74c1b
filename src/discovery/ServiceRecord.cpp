#include "discovery/ServiceRecord.h"

#include <charconv>
#include <string_view>
#include <utility>

namespace groupride::discovery {

namespace {

void put_txt(std::vector<std::uint8_t>& out, std::string_view key, std::string_view value) {
    std::string entry;
    entry.reserve(key.size() + 1 + value.size());
    entry.append(key).append("=").append(value);
    if (entry.size() > 255) entry.resize(255);  // TXT strings are at most 255 bytes

    out.push_back(static_cast<std::uint8_t>(entry.size()));
    out.insert(out.end(), entry.begin(), entry.end());
}

template <class Int>
bool parse_int(const std::string& s, Int& out) {
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

std::optional<std::string> ServiceRecord::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    if (it == attributes.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

std::vector<std::uint8_t> encode_record(const ServiceRecord& record) {
    std::vector<std::uint8_t> out;
    put_txt(out, "txtvers", std::to_string(record.version));
    put_txt(out, "type", record.service_type);
    put_txt(out, "name", record.instance_name);
    put_txt(out, "rider", record.rider_id);
    put_txt(out, "port", std::to_string(record.port));
    put_txt(out, "ttl", std::to_string(record.ttl_ms));
    for (const auto& [key, value] : record.attributes) {
        if (!value.empty()) put_txt(out, key, value);
    }
    return out;
}

std::optional<ServiceRecord> decode_record(const std::uint8_t* data, std::size_t size) {
    std::map<std::string, std::string> kv;

    std::size_t pos = 0;
    while (pos < size) {
        std::size_t len = data[pos++];
        if (len > size - pos) return std::nullopt;
        std::string entry(reinterpret_cast<const char*>(data + pos), len);
        pos += len;

        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;  // attribute without value: ignored
        kv[entry.substr(0, eq)] = entry.substr(eq + 1);
    }

    ServiceRecord r;
    unsigned version = 0;
    if (!parse_int(kv["txtvers"], version) || version > 255) return std::nullopt;
    r.version = static_cast<std::uint8_t>(version);
    if (!parse_int(kv["port"], r.port) || !parse_int(kv["ttl"], r.ttl_ms)) return std::nullopt;

    r.service_type = std::move(kv["type"]);
    r.instance_name = std::move(kv["name"]);
    r.rider_id = std::move(kv["rider"]);
    if (r.service_type.empty() || r.rider_id.empty()) return std::nullopt;

    for (const char* known : {"txtvers", "type", "name", "rider", "port", "ttl"}) kv.erase(known);
    r.attributes = std::move(kv);
    return r;
}

} // namespace groupride::discovery
