#include "networking/Transport.h"

#include "core/Log.h"
#include "networking/Liveness.h"
#include "protocol/Codec.h"

#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <array>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace groupride::networking {

namespace asio = boost::asio;
using udp = asio::ip::udp;
using error_code = boost::system::error_code;

namespace {
constexpr const char* kTag = "Transport";
}

class Transport::Impl : public std::enable_shared_from_this<Transport::Impl> {
public:
    Impl(asio::io_context& ioc, Options options)
        : opts_(std::move(options)),
          strand_(asio::make_strand(ioc)),
          unicast_(strand_),
          mcast_(strand_),
          heartbeat_timer_(strand_),
          liveness_(opts_.heartbeat_interval, opts_.heartbeat_miss_threshold) {}

    void on(protocol::MessageTag tag, Handler h) {
        handlers_[static_cast<std::size_t>(tag)] = std::move(h);
    }

    void set_on_peer_lost(PeerHandler cb) { on_peer_lost_ = std::move(cb); }
    void set_on_peer_recovered(PeerHandler cb) { on_peer_recovered_ = std::move(cb); }

    void start() {
        if (running_) return;
        try {
            open_sockets();
        } catch (const boost::system::system_error&) {
            error_code ignored;
            unicast_.close(ignored);
            mcast_.close(ignored);
            throw;
        }

        {
            std::lock_guard<std::mutex> lk(local_mu_);
            local_ep_ = unicast_.local_endpoint();
        }
        running_ = true;

        log::info(kTag) << "unicast on " << local_endpoint()
                        << (opts_.multicast ? ", multicast " + opts_.multicast_group + ":" +
                                                  std::to_string(opts_.sync_port)
                                            : std::string(", multicast disabled"));

        asio::post(strand_, [self = shared_from_this()] {
            self->do_receive(self->unicast_, self->unicast_buf_, self->unicast_from_);
            if (self->opts_.multicast) {
                self->do_receive(self->mcast_, self->mcast_buf_, self->mcast_from_);
            }
            self->arm_heartbeat();
        });
    }

    void stop() {
        if (!running_.exchange(false)) return;
        asio::post(strand_, [self = shared_from_this()] {
            error_code ec;
            self->heartbeat_timer_.cancel();
            self->unicast_.close(ec);
            self->mcast_.close(ec);
            log::info(kTag) << "stopped";
        });
    }

    void learn_peer(const RiderId& rider, const Endpoint& ep) {
        asio::post(strand_, [self = shared_from_this(), rider, ep] {
            self->endpoints_[rider] = ep;
        });
    }

    void set_heartbeat_session(SessionId id) {
        asio::post(strand_, [self = shared_from_this(), id = std::move(id)]() mutable {
            self->heartbeat_session_ = std::move(id);
        });
    }

    Endpoint local_endpoint() const {
        std::lock_guard<std::mutex> lk(local_mu_);
        return local_ep_;
    }

    void send_to(const RiderId& rider, const protocol::Message& msg) {
        auto bytes = encode_or_log(msg);
        if (!bytes) return;
        asio::post(strand_, [self = shared_from_this(), rider, bytes] {
            auto it = self->endpoints_.find(rider);
            if (it == self->endpoints_.end()) {
                log::warn(kTag) << "no address for " << rider << ", dropped";
                return;
            }
            self->transmit(bytes, it->second);
        });
    }

    void send_to(const Endpoint& to, const protocol::Message& msg) {
        auto bytes = encode_or_log(msg);
        if (!bytes) return;
        asio::post(strand_, [self = shared_from_this(), to, bytes] {
            self->transmit(bytes, to);
        });
    }

    void broadcast(const protocol::Message& msg) {
        auto bytes = encode_or_log(msg);
        if (!bytes) return;
        asio::post(strand_, [self = shared_from_this(), bytes] {
            if (self->opts_.multicast) {
                self->transmit(bytes, self->group_ep_);
                return;
            }
            for (const auto& [rider, ep] : self->endpoints_) self->transmit(bytes, ep);
        });
    }

private:
    void open_sockets() {
        const auto bind_ip = asio::ip::make_address(opts_.bind_address);

        unicast_.open(udp::v4());
        unicast_.bind(udp::endpoint(bind_ip, opts_.unicast_port));

        if (opts_.multicast) {
            const auto group = asio::ip::make_address(opts_.multicast_group);
            mcast_.open(udp::v4());
            mcast_.set_option(udp::socket::reuse_address(true));
            mcast_.bind(udp::endpoint(asio::ip::address_v4::any(), opts_.sync_port));
            mcast_.set_option(asio::ip::multicast::join_group(group));

            // multicast goes out through the unicast socket so the source
            // address peers see is the one they can reply to
            unicast_.set_option(asio::ip::multicast::hops(opts_.multicast_ttl));
            unicast_.set_option(asio::ip::multicast::enable_loopback(true));
            group_ep_ = udp::endpoint(group, opts_.sync_port);
        }
    }

    using Buffer = std::array<std::uint8_t, 2048>;
    using Bytes = std::shared_ptr<const std::vector<std::uint8_t>>;

    Bytes encode_or_log(const protocol::Message& msg) {
        try {
            return std::make_shared<const std::vector<std::uint8_t>>(protocol::encode(msg));
        } catch (const std::length_error& e) {
            log::error(kTag) << "not sent: " << e.what();
            return nullptr;
        }
    }

    void transmit(const Bytes& bytes, const udp::endpoint& to) {
        // Sends queued ahead of stop() still go out; the close runs after them.
        if (!unicast_.is_open()) return;
        unicast_.async_send_to(
            asio::buffer(*bytes), to,
            [bytes, to](const error_code& ec, std::size_t) {
                // no retry at this layer
                if (ec && ec != asio::error::operation_aborted) {
                    log::warn(kTag) << "send to " << to << " failed: " << ec.message();
                }
            });
    }

    void do_receive(udp::socket& sock, Buffer& buf, udp::endpoint& from) {
        sock.async_receive_from(
            asio::buffer(buf), from,
            [self = shared_from_this(), &sock, &buf, &from](const error_code& ec, std::size_t n) {
                if (ec == asio::error::operation_aborted || !self->running_) return;
                if (ec) {
                    log::warn(kTag) << "receive: " << ec.message();
                } else {
                    self->on_datagram(buf.data(), n, from);
                }
                self->do_receive(sock, buf, from);
            });
    }

    void on_datagram(const std::uint8_t* data, std::size_t n, const udp::endpoint& from) {
        auto msg = protocol::decode(data, n);
        if (!msg) {
            ++malformed_;
            log::debug(kTag) << "malformed datagram from " << from << " (" << n << " bytes)";
            return;
        }
        if (msg->sender == opts_.local_rider) return;  // own multicast looped back

        endpoints_[msg->sender] = from;

        if (liveness_.touch(msg->sender, Clock::now()) == LivenessTracker::Touch::Recovered) {
            log::info(kTag) << msg->sender << " is back";
            if (on_peer_recovered_) on_peer_recovered_(msg->sender);
        }

        const auto& h = handlers_[static_cast<std::size_t>(msg->tag())];
        if (h) h(*msg, from);
    }

    void arm_heartbeat() {
        heartbeat_timer_.expires_after(opts_.heartbeat_interval);
        heartbeat_timer_.async_wait([self = shared_from_this()](const error_code& ec) {
            if (ec || !self->running_) return;
            self->on_heartbeat();
            self->arm_heartbeat();
        });
    }

    void on_heartbeat() {
        const auto now = Clock::now();
        auto hb = protocol::make_message(opts_.local_rider, now,
                                         protocol::Heartbeat{heartbeat_session_});
        if (auto bytes = encode_or_log(hb)) {
            if (opts_.multicast) {
                transmit(bytes, group_ep_);
            } else {
                for (const auto& [rider, ep] : endpoints_) transmit(bytes, ep);
            }
        }

        for (const auto& rider : liveness_.sweep(now)) {
            log::info(kTag) << rider << " silent for " << liveness_.timeout().count()
                            << " ms, marking disconnected";
            if (on_peer_lost_) on_peer_lost_(rider);
        }
    }

private:
    Options opts_;
    asio::strand<asio::io_context::executor_type> strand_;

    udp::socket unicast_;
    udp::socket mcast_;
    udp::endpoint group_ep_;
    asio::steady_timer heartbeat_timer_;

    Buffer unicast_buf_{};
    Buffer mcast_buf_{};
    udp::endpoint unicast_from_;
    udp::endpoint mcast_from_;

    std::atomic<bool> running_{false};
    mutable std::mutex local_mu_;
    udp::endpoint local_ep_;

    // strand-owned
    std::array<Handler, 256> handlers_{};
    PeerHandler on_peer_lost_;
    PeerHandler on_peer_recovered_;
    std::unordered_map<RiderId, udp::endpoint> endpoints_;
    LivenessTracker liveness_;
    SessionId heartbeat_session_;
    std::uint64_t malformed_ = 0;
};

// ---- Transport wrapper ----

Transport::Transport(boost::asio::io_context& ioc, Options options)
    : impl_(std::make_shared<Impl>(ioc, std::move(options))) {}

Transport::~Transport() { impl_->stop(); }

void Transport::on(protocol::MessageTag tag, Handler handler) { impl_->on(tag, std::move(handler)); }
void Transport::set_on_peer_lost(PeerHandler cb) { impl_->set_on_peer_lost(std::move(cb)); }
void Transport::set_on_peer_recovered(PeerHandler cb) { impl_->set_on_peer_recovered(std::move(cb)); }

void Transport::start() { impl_->start(); }
void Transport::stop() { impl_->stop(); }

void Transport::learn_peer(const RiderId& rider, const Endpoint& ep) { impl_->learn_peer(rider, ep); }
void Transport::set_heartbeat_session(SessionId id) { impl_->set_heartbeat_session(std::move(id)); }
Endpoint Transport::local_endpoint() const { return impl_->local_endpoint(); }

void Transport::send_to(const RiderId& rider, const protocol::Message& msg) { impl_->send_to(rider, msg); }
void Transport::send_to(const Endpoint& to, const protocol::Message& msg) { impl_->send_to(to, msg); }
void Transport::broadcast(const protocol::Message& msg) { impl_->broadcast(msg); }

} // namespace groupride::networking
