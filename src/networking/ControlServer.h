#pragma once

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace groupride::networking {

using ClientId = std::uint64_t;

// Local WebSocket endpoint for the UI process: text frames in (commands),
// text frames out (engine events). Binds to loopback only.
class ControlServer {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    ControlServer(boost::asio::io_context& ioc, unsigned short port);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close open connections

    void send(ClientId client, const std::string& msg);
    void broadcast(const std::string& msg);

    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace groupride::networking
