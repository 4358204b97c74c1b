#pragma once

#include "core/Log.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace groupride {

struct Config {
    using ms = std::chrono::milliseconds;
    using seconds = std::chrono::seconds;

    std::string rider_name = "guest";

    // discovery
    std::string service_type = "_groupride._udp.local.";
    std::string discovery_group = "239.255.42.41";
    std::uint16_t discovery_port = 7878;
    ms announce_interval{2000};
    ms peer_expiry{6000};

    // transport
    std::string multicast_group = "239.255.42.42";
    std::uint16_t sync_port = 7879;
    std::uint16_t unicast_port = 7880;  // 0 = ephemeral
    int multicast_ttl = 1;
    ms heartbeat_interval{1000};
    int heartbeat_miss_threshold = 5;
    int metric_rate_hz = 20;

    // clock offset
    ms clock_rtt_ceiling{1000};
    double clock_smoothing = 0.25;

    // session
    std::size_t max_participants = 10;
    ms join_timeout{3000};
    ms join_retry{1000};

    // chat
    int chat_max_attempts = 5;
    ms chat_retry_base{500};
    ms chat_retry_max{4000};
    ms chat_reorder_hold{2000};

    // race
    seconds race_countdown{60};
    seconds race_grace_period{60};
    std::size_t max_racers = 10;

    // process
    std::uint16_t control_port = 9002;
    int worker_threads = 2;
    log::Level log_level = log::Level::info;

    ms liveness_timeout() const { return heartbeat_interval * heartbeat_miss_threshold; }
    ms metric_interval() const { return ms(1000 / (metric_rate_hz > 0 ? metric_rate_hz : 1)); }
};

} // namespace groupride
