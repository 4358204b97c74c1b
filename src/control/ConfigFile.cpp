#include "control/ConfigFile.h"

#include "core/Log.h"

#include <boost/json.hpp>

#include <fstream>
#include <functional>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace groupride::control {

namespace json = boost::json;

namespace {

constexpr const char* kTag = "Config";

[[noreturn]] void bad(const std::string& key, const char* expected) {
    throw std::runtime_error("config key '" + key + "': expected " + expected);
}

std::int64_t as_int(const std::string& key, const json::value& v) {
    if (v.is_int64()) return v.get_int64();
    if (v.is_uint64() && v.get_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(v.get_uint64());
    }
    bad(key, "an integer");
}

std::int64_t as_int(const std::string& key, const json::value& v, std::int64_t lo, std::int64_t hi) {
    const auto n = as_int(key, v);
    if (n < lo || n > hi) {
        throw std::runtime_error("config key '" + key + "': " + std::to_string(n) + " out of range [" +
                                 std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
    return n;
}

double as_double(const std::string& key, const json::value& v) {
    if (v.is_double()) return v.get_double();
    if (v.is_int64()) return static_cast<double>(v.get_int64());
    if (v.is_uint64()) return static_cast<double>(v.get_uint64());
    bad(key, "a number");
}

std::string as_string(const std::string& key, const json::value& v) {
    if (!v.is_string()) bad(key, "a string");
    const auto& s = v.get_string();
    return std::string(s.data(), s.size());
}

using Setter = std::function<void(const std::string&, const json::value&, Config&)>;

Setter ms_field(Config::ms Config::*member) {
    return [member](const std::string& key, const json::value& v, Config& c) {
        c.*member = Config::ms(as_int(key, v, 1, 3'600'000));
    };
}

Setter seconds_field(Config::seconds Config::*member) {
    return [member](const std::string& key, const json::value& v, Config& c) {
        c.*member = Config::seconds(as_int(key, v, 1, 86'400));
    };
}

Setter port_field(std::uint16_t Config::*member, std::int64_t lo = 1) {
    return [member, lo](const std::string& key, const json::value& v, Config& c) {
        c.*member = static_cast<std::uint16_t>(as_int(key, v, lo, 65535));
    };
}

Setter string_field(std::string Config::*member) {
    return [member](const std::string& key, const json::value& v, Config& c) {
        c.*member = as_string(key, v);
    };
}

const std::unordered_map<std::string, Setter>& fields() {
    static const std::unordered_map<std::string, Setter> table = {
        {"rider_name", string_field(&Config::rider_name)},
        {"service_type", string_field(&Config::service_type)},
        {"discovery_group", string_field(&Config::discovery_group)},
        {"discovery_port", port_field(&Config::discovery_port)},
        {"announce_interval_ms", ms_field(&Config::announce_interval)},
        {"peer_expiry_ms", ms_field(&Config::peer_expiry)},
        {"multicast_group", string_field(&Config::multicast_group)},
        {"sync_port", port_field(&Config::sync_port)},
        {"unicast_port", port_field(&Config::unicast_port, 0)},
        {"multicast_ttl", [](const std::string& k, const json::value& v, Config& c) {
             c.multicast_ttl = static_cast<int>(as_int(k, v, 0, 255));
         }},
        {"heartbeat_interval_ms", ms_field(&Config::heartbeat_interval)},
        {"heartbeat_miss_threshold", [](const std::string& k, const json::value& v, Config& c) {
             c.heartbeat_miss_threshold = static_cast<int>(as_int(k, v, 1, 100));
         }},
        {"metric_rate_hz", [](const std::string& k, const json::value& v, Config& c) {
             c.metric_rate_hz = static_cast<int>(as_int(k, v, 1, 100));
         }},
        {"clock_rtt_ceiling_ms", ms_field(&Config::clock_rtt_ceiling)},
        {"clock_smoothing", [](const std::string& k, const json::value& v, Config& c) {
             const auto w = as_double(k, v);
             if (w <= 0.0 || w > 1.0) bad(k, "a weight in (0, 1]");
             c.clock_smoothing = w;
         }},
        {"max_participants", [](const std::string& k, const json::value& v, Config& c) {
             c.max_participants = static_cast<std::size_t>(as_int(k, v, 1, 255));
         }},
        {"join_timeout_ms", ms_field(&Config::join_timeout)},
        {"join_retry_ms", ms_field(&Config::join_retry)},
        {"chat_max_attempts", [](const std::string& k, const json::value& v, Config& c) {
             c.chat_max_attempts = static_cast<int>(as_int(k, v, 1, 100));
         }},
        {"chat_retry_base_ms", ms_field(&Config::chat_retry_base)},
        {"chat_retry_max_ms", ms_field(&Config::chat_retry_max)},
        {"chat_reorder_hold_ms", ms_field(&Config::chat_reorder_hold)},
        {"race_countdown_s", seconds_field(&Config::race_countdown)},
        {"race_grace_period_s", seconds_field(&Config::race_grace_period)},
        {"max_racers", [](const std::string& k, const json::value& v, Config& c) {
             c.max_racers = static_cast<std::size_t>(as_int(k, v, 1, 255));
         }},
        {"control_port", port_field(&Config::control_port)},
        {"worker_threads", [](const std::string& k, const json::value& v, Config& c) {
             c.worker_threads = static_cast<int>(as_int(k, v, 1, 64));
         }},
        {"log_level", [](const std::string& k, const json::value& v, Config& c) {
             if (!log::parse_level(as_string(k, v), c.log_level)) bad(k, "debug|info|warn|error");
         }},
    };
    return table;
}

} // namespace

Config parse_config(std::string_view text, Config base) {
    boost::system::error_code ec;
    json::value doc = json::parse(json::string_view(text.data(), text.size()), ec);
    if (ec) throw std::runtime_error("config: invalid json: " + ec.message());

    const auto* obj = doc.if_object();
    if (!obj) throw std::runtime_error("config: top level must be an object");

    const auto& table = fields();
    for (const auto& kv : *obj) {
        const std::string key(kv.key().data(), kv.key().size());
        auto it = table.find(key);
        if (it == table.end()) {
            log::warn(kTag) << "ignoring unknown key '" << key << "'";
            continue;
        }
        it->second(key, kv.value(), base);
    }

    if (base.chat_retry_max < base.chat_retry_base) {
        throw std::runtime_error("config: chat_retry_max_ms is below chat_retry_base_ms");
    }
    return base;
}

Config load_config(const std::string& path, Config base) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("config: cannot open " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    auto cfg = parse_config(ss.str(), std::move(base));
    log::info(kTag) << "loaded " << path;
    return cfg;
}

} // namespace groupride::control
