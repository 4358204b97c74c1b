#include "networking/ControlServer.h"

#include "core/Log.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace groupride::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr const char* kTag = "Control";
constexpr std::size_t kMaxQueuedFrames = 256;
}

class ControlServer::Impl {
public:
    Impl(asio::io_context& ioc, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::address_v4::loopback(), port)) {}

    void start() {
        log::info(kTag) << "listening on ws://" << acceptor_.local_endpoint();
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, c] : connections_) c->close();
        connections_.clear();
    }

    void send(ClientId client, const std::string& msg) {
        std::shared_ptr<Connection> c;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = connections_.find(client);
            if (it == connections_.end()) return;
            c = it->second;
        }
        c->send(std::make_shared<const std::string>(msg));
    }

    void broadcast(const std::string& msg) {
        auto frame = std::make_shared<const std::string>(msg);
        std::vector<std::shared_ptr<Connection>> targets;
        {
            std::lock_guard<std::mutex> lk(mu_);
            targets.reserve(connections_.size());
            for (auto& [id, c] : connections_) targets.push_back(c);
        }
        for (auto& c : targets) c->send(frame);
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    using Frame = std::shared_ptr<const std::string>;

    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

            ws_.async_accept(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) return self->drop("handshake", ec);

                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(Frame frame) {
            asio::post(
                strand_,
                [self = shared_from_this(), frame = std::move(frame)] {
                    if (self->write_queue_.size() >= kMaxQueuedFrames) {
                        // bounded; the newest queued frame gives way
                        self->write_queue_.pop_back();
                        log::warn(kTag) << "client " << self->id_ << " lagging, frame dropped";
                    }
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(frame);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    beast::error_code ec;
                    self->ws_.close(websocket::close_code::going_away, ec);
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->drop("read", ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);
                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(*write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->drop("write", ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void drop(const char* what, beast::error_code ec) {
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                log::warn(kTag) << "client " << id_ << " " << what << ": " << ec.message();
            }
            if (server_.remove(id_) && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::deque<Frame> write_queue_;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) return;
                    log::warn(kTag) << "accept: " << ec.message();
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto conn = std::make_shared<Connection>(*this, std::move(socket), id);
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = conn;
                }
                log::debug(kTag) << "client " << id << " connected";

                conn->start();
                do_accept();
            });
    }

    bool remove(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.erase(id) > 0;
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Connection>> connections_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

// ---- ControlServer wrapper ----

ControlServer::ControlServer(asio::io_context& ioc, unsigned short port)
    : impl_(new Impl(ioc, port)) {}

ControlServer::~ControlServer() = default;

void ControlServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void ControlServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void ControlServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void ControlServer::start() { impl_->start(); }
void ControlServer::stop() { impl_->stop(); }

void ControlServer::send(ClientId client, const std::string& msg) { impl_->send(client, msg); }
void ControlServer::broadcast(const std::string& msg) { impl_->broadcast(msg); }

unsigned short ControlServer::port() const { return impl_->port(); }

} // namespace groupride::networking
