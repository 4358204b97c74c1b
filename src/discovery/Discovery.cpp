#include "discovery/Discovery.h"

#include "core/Log.h"
#include "discovery/ServiceRecord.h"

#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <array>
#include <atomic>
#include <utility>

namespace groupride::discovery {

namespace asio = boost::asio;
using udp = asio::ip::udp;
using error_code = boost::system::error_code;

namespace {
constexpr const char* kTag = "Discovery";
}

class Discovery::Impl : public std::enable_shared_from_this<Discovery::Impl> {
public:
    Impl(asio::io_context& ioc, Options options)
        : opts_(std::move(options)),
          strand_(asio::make_strand(ioc)),
          socket_(strand_),
          announce_timer_(strand_),
          table_(opts_.rider_id, opts_.service_type) {}

    void browse(EventHandler h) { on_event_ = std::move(h); }

    bool start() {
        if (enabled_) return true;
        try {
            const auto group = asio::ip::make_address(opts_.group);
            socket_.open(udp::v4());
            socket_.set_option(udp::socket::reuse_address(true));
            socket_.bind(udp::endpoint(asio::ip::address_v4::any(), opts_.port));
            socket_.set_option(asio::ip::multicast::join_group(group));
            socket_.set_option(asio::ip::multicast::hops(opts_.multicast_ttl));
            socket_.set_option(asio::ip::multicast::enable_loopback(true));
            group_ep_ = udp::endpoint(group, opts_.port);
        } catch (const boost::system::system_error& e) {
            error_code ignored;
            socket_.close(ignored);
            log::warn(kTag) << "disabled, no peers discoverable: " << e.code().message();
            return false;
        }

        enabled_ = true;
        log::info(kTag) << "browsing " << opts_.service_type << " on " << group_ep_;

        asio::post(strand_, [self = shared_from_this()] {
            self->do_receive();
            self->announce(self->opts_.peer_expiry);
            self->arm_announce();
        });
        return true;
    }

    void stop() {
        if (!enabled_.exchange(false)) return;
        asio::post(strand_, [self = shared_from_this()] {
            error_code ec;
            const auto goodbye = encode_record(self->local_record(Millis(0)));
            self->socket_.send_to(asio::buffer(goodbye), self->group_ep_, 0, ec);
            if (ec) log::warn(kTag) << "goodbye not sent: " << ec.message();
            self->announce_timer_.cancel();
            self->socket_.close(ec);
            self->table_.clear();
            log::info(kTag) << "stopped";
        });
    }

    bool enabled() const noexcept { return enabled_; }

    void advertise(std::optional<SessionId> session, std::optional<std::string> world) {
        asio::post(strand_, [self = shared_from_this(), session = std::move(session),
                             world = std::move(world)]() mutable {
            self->session_ = std::move(session);
            self->world_ = std::move(world);
            if (self->enabled_) self->announce(self->opts_.peer_expiry);
        });
    }

    void peers(PeersHandler h) {
        asio::post(strand_, [self = shared_from_this(), h = std::move(h)] {
            h(self->table_.peers());
        });
    }

private:
    ServiceRecord local_record(Millis ttl) const {
        ServiceRecord r;
        r.service_type = opts_.service_type;
        r.instance_name = opts_.display_name;
        r.rider_id = opts_.rider_id;
        r.port = opts_.transport_port;
        r.ttl_ms = static_cast<std::uint32_t>(ttl.count());
        if (session_) r.attributes["session"] = *session_;
        if (world_) r.attributes["world"] = *world_;
        return r;
    }

    void announce(Millis ttl) {
        auto bytes = std::make_shared<std::vector<std::uint8_t>>(encode_record(local_record(ttl)));
        socket_.async_send_to(asio::buffer(*bytes), group_ep_,
                              [bytes](const error_code& ec, std::size_t) {
                                  if (ec && ec != asio::error::operation_aborted) {
                                      log::warn(kTag) << "announce failed: " << ec.message();
                                  }
                              });
    }

    void arm_announce() {
        announce_timer_.expires_after(opts_.announce_interval);
        announce_timer_.async_wait([self = shared_from_this()](const error_code& ec) {
            if (ec || !self->enabled_) return;
            self->announce(self->opts_.peer_expiry);
            for (auto& ev : self->table_.expire(Clock::now())) self->emit(ev);
            self->arm_announce();
        });
    }

    void do_receive() {
        socket_.async_receive_from(
            asio::buffer(buf_), from_,
            [self = shared_from_this()](const error_code& ec, std::size_t n) {
                if (ec == asio::error::operation_aborted || !self->enabled_) return;
                if (ec) {
                    log::warn(kTag) << "receive: " << ec.message();
                } else if (auto record = decode_record(self->buf_.data(), n)) {
                    if (auto ev = self->table_.observe(*record, self->from_.address(), Clock::now())) {
                        self->emit(*ev);
                    }
                }
                self->do_receive();
            });
    }

    void emit(const PeerEvent& ev) {
        switch (ev.kind) {
            case PeerEvent::Kind::Appeared:
                log::info(kTag) << "peer " << ev.peer.name << " (" << ev.peer.rider_id << ") at " << ev.peer.address;
                break;
            case PeerEvent::Kind::Vanished:
                log::info(kTag) << "peer " << ev.peer.name << " vanished";
                break;
            case PeerEvent::Kind::Updated:
                break;
        }
        if (on_event_) on_event_(ev);
    }

private:
    Options opts_;
    asio::strand<asio::io_context::executor_type> strand_;
    udp::socket socket_;
    udp::endpoint group_ep_;
    asio::steady_timer announce_timer_;

    std::array<std::uint8_t, 1500> buf_{};
    udp::endpoint from_;

    std::atomic<bool> enabled_{false};

    // strand-owned
    EventHandler on_event_;
    PeerTable table_;
    std::optional<SessionId> session_;
    std::optional<std::string> world_;
};

// ---- Discovery wrapper ----

Discovery::Discovery(boost::asio::io_context& ioc, Options options)
    : impl_(std::make_shared<Impl>(ioc, std::move(options))) {}

Discovery::~Discovery() { impl_->stop(); }

void Discovery::browse(EventHandler handler) { impl_->browse(std::move(handler)); }
bool Discovery::start() { return impl_->start(); }
void Discovery::stop() { impl_->stop(); }
bool Discovery::enabled() const noexcept { return impl_->enabled(); }

void Discovery::advertise(std::optional<SessionId> session, std::optional<std::string> world) {
    impl_->advertise(std::move(session), std::move(world));
}

void Discovery::peers(PeersHandler handler) { impl_->peers(std::move(handler)); }

} // namespace groupride::discovery
