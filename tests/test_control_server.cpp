#include "control/CommandRouter.h"
#include "control/EventJson.h"
#include "core/Log.h"
#include "engine/Engine.h"
#include "networking/ControlServer.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace groupride;
using groupride::networking::ClientId;
using groupride::networking::ControlServer;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

Config local_config() {
    Config c;
    c.unicast_port = 0;
    c.discovery_port = 17978;
    c.sync_port = 17979;
    c.heartbeat_interval = Config::ms(200);
    return c;
}

class Client {
public:
    explicit Client(unsigned short port) : ws_(ioc_) {
        ws_.next_layer().connect(tcp::endpoint(asio::ip::address_v4::loopback(), port));
        ws_.handshake("127.0.0.1", "/");
    }

    void send(const std::string& text) {
        ws_.text(true);
        ws_.write(asio::buffer(text));
    }

    json::object read() {
        beast::flat_buffer buf;
        ws_.read(buf);
        return json::parse(beast::buffers_to_string(buf.data())).as_object();
    }

    // Reads up to the first frame of the given type; the types skipped on
    // the way are kept in seen_other.
    json::object read_until(const std::string& type) {
        for (;;) {
            auto doc = read();
            auto t = json::value_to<std::string>(doc.at("type"));
            if (t == type) return doc;
            seen_other.push_back(std::move(t));
        }
    }

    void close() { ws_.close(websocket::close_code::normal); }

    std::vector<std::string> seen_other;

private:
    asio::io_context ioc_;
    websocket::stream<tcp::socket> ws_;
};

std::size_t count_of(const std::vector<std::string>& types, const std::string& type) {
    std::size_t n = 0;
    for (const auto& t : types) {
        if (t == type) ++n;
    }
    return n;
}

} // namespace

int main() {
    printf("=== control server test suite ===\n");
    log::set_level(log::Level::error);

    asio::io_context ioc;
    auto guard = asio::make_work_guard(ioc);
    std::thread runner([&ioc] { ioc.run(); });

    Rider self(RiderId("rider-ui"), "tester");
    engine::Engine engine(ioc, local_config(), self);
    ControlServer server(ioc, 0);
    control::CommandRouter router(engine, Millis(60000));

    std::promise<ClientId> gone;
    server.set_on_connect([&](ClientId id) {
        server.send(id, json::serialize(json::object{{"type", "hello"}, {"rider_id", self.id()}}));
    });
    server.set_on_disconnect([&gone](ClientId id) { gone.set_value(id); });
    server.set_on_message([&](ClientId id, const std::string& msg) {
        router.handle(msg, [&server, id](json::object reply) { server.send(id, json::serialize(reply)); });
    });
    engine.subscribe([&server](const events::Event& ev) { server.broadcast(json::serialize(control::to_json(ev))); });

    engine.start();
    server.start();
    assert(server.port() != 0);

    // --- Connect, command, reply ---
    {
        Client ui(server.port());
        auto hello = ui.read_until("hello");
        assert(json::value_to<std::string>(hello.at("rider_id")) == "rider-ui");

        ui.send(R"({"type":"peers"})");
        ui.send(R"({"type":"sessions"})");
        auto peers = ui.read_until("peers");
        assert(peers.at("peers").is_array());
        auto sessions = ui.read_until("sessions");
        assert(sessions.at("sessions").as_array().empty());
        // one command, one reply
        assert(count_of(ui.seen_other, "peers") == 0);

        ui.send("not json");
        auto err = ui.read_until("error");
        assert(json::value_to<std::string>(err.at("text")) == "invalid json");
        printf("  [OK] Commands answered once over the socket\n");

        // --- Pushed frames ---
        server.broadcast(json::serialize(json::object{{"type", "notice"}, {"text", "ride starts soon"}}));
        auto pushed = ui.read_until("notice");
        assert(json::value_to<std::string>(pushed.at("text")) == "ride starts soon");
        assert(count_of(ui.seen_other, "peers") == 0);
        assert(count_of(ui.seen_other, "sessions") == 0);
        printf("  [OK] Events pushed to the client\n");

        ui.close();
        auto f = gone.get_future();
        assert(f.wait_for(std::chrono::milliseconds(2000)) == std::future_status::ready);
        assert(f.get() >= 1);
        printf("  [OK] Disconnect reported\n");
    }

    server.stop();
    engine.stop();

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    guard.reset();
    ioc.stop();
    runner.join();

    printf("=== all control server tests passed ===\n");
    return 0;
}
