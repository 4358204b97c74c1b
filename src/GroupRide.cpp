#include "control/CommandRouter.h"
#include "control/ConfigFile.h"
#include "control/EventJson.h"
#include "core/Config.h"
#include "core/IdGenerator.hpp"
#include "core/Log.h"
#include "core/Rider.h"
#include "engine/Engine.h"
#include "networking/ControlServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/json.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace json = boost::json;

static constexpr const char* kTag = "GroupRide";

static std::string dump(const json::object& obj) {
    return json::serialize(obj);
}

static void usage() {
    std::cerr << "usage: groupride [--config file] [--name name]\n";
}

int main(int argc, char** argv) {
    using namespace groupride;
    using groupride::networking::ClientId;

    std::optional<std::string> config_path;
    std::optional<std::string> name;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "--name") && i + 1 < argc) {
            (arg == "--config" ? config_path : name) = argv[++i];
        } else {
            usage();
            return arg == "--help" || arg == "-h" ? 0 : 2;
        }
    }

    Config config;
    if (config_path) {
        try {
            config = control::load_config(*config_path);
        } catch (const std::exception& e) {
            std::cerr << "[" << kTag << "] " << e.what() << "\n";
            return 1;
        }
    }
    if (name) config.rider_name = *name;
    log::set_level(config.log_level);

    boost::asio::io_context ioc;

    IdGenerator idgen;
    Rider self{idgen, config.rider_name};

    engine::Engine engine(ioc, config, self);

    std::optional<networking::ControlServer> server;
    try {
        server.emplace(ioc, config.control_port);
    } catch (const boost::system::system_error& e) {
        log::error(kTag) << "control port " << config.control_port << ": " << e.code().message();
        return 1;
    }

    control::CommandRouter router(engine, config.race_countdown);

    server->set_on_connect([&](ClientId client_id) {
        server->send(client_id, dump({
            {"type", "hello"},
            {"rider_id", self.id()},
            {"name", self.name()},
            {"degraded", engine.degraded()},
        }));
    });

    server->set_on_message([&](ClientId client_id, const std::string& msg) {
        router.handle(msg, [&server, client_id](json::object reply) {
            server->send(client_id, dump(reply));
        });
    });

    engine.subscribe([&server](const events::Event& ev) {
        server->broadcast(dump(control::to_json(ev)));
    });

    engine.start();
    server->start();

    // Graceful shutdown on Ctrl+C / SIGTERM: leave the session, let the
    // goodbye datagrams drain, then stop the pool.
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    boost::asio::steady_timer drain(ioc);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        log::info(kTag) << "shutting down...";
        engine.stop();
        server->stop();
        drain.expires_after(std::chrono::milliseconds(300));
        drain.async_wait([&ioc](const boost::system::error_code&) { ioc.stop(); });
    });

    log::info(kTag) << self.name() << " ready, control on ws://127.0.0.1:" << server->port();

    std::vector<std::thread> pool;
    for (int i = 1; i < config.worker_threads; ++i) {
        pool.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : pool) t.join();

    log::info(kTag) << "exit.";
    return 0;
}
