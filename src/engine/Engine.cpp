#include "engine/Engine.h"

#include "chat/ChatService.h"
#include "clock/ClockOffsetEstimator.h"
#include "core/Error.h"
#include "core/IdGenerator.hpp"
#include "core/Log.h"
#include "discovery/Discovery.h"
#include "networking/Transport.h"
#include "race/RaceCoordinator.h"
#include "session/SessionManager.h"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <atomic>
#include <optional>
#include <utility>

namespace groupride::engine {

namespace asio = boost::asio;
using error_code = boost::system::error_code;
using protocol::MessageTag;

namespace {

constexpr const char* kTag = "Engine";
constexpr Millis kTickInterval{100};

networking::Transport::Options transport_options(const Config& c, const Rider& self) {
    networking::Transport::Options o;
    o.local_rider = self.id();
    o.unicast_port = c.unicast_port;
    o.multicast_group = c.multicast_group;
    o.sync_port = c.sync_port;
    o.multicast_ttl = c.multicast_ttl;
    o.heartbeat_interval = c.heartbeat_interval;
    o.heartbeat_miss_threshold = c.heartbeat_miss_threshold;
    return o;
}

} // namespace

class Engine::Impl : public std::enable_shared_from_this<Engine::Impl> {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    Impl(asio::io_context& ioc, Config config, Rider self, Collaborators io)
        : ioc_(ioc),
          config_(std::move(config)),
          self_(std::move(self)),
          io_(io),
          transport_(ioc, transport_options(config_, self_)),
          session_strand_(asio::make_strand(ioc)),
          chat_strand_(asio::make_strand(ioc)),
          race_strand_(asio::make_strand(ioc)),
          clock_strand_(asio::make_strand(ioc)),
          events_strand_(asio::make_strand(ioc)),
          session_(self_, config_, transport_, ids_),
          chat_(self_, config_, transport_),
          race_(self_, config_, transport_, ids_),
          clock_(config_.clock_rtt_ceiling, config_.clock_smoothing),
          session_timer_(session_strand_),
          metric_timer_(session_strand_),
          chat_timer_(chat_strand_),
          race_timer_(race_strand_),
          clock_timer_(clock_strand_) {}

    void wire() {
        std::weak_ptr<Impl> weak = shared_from_this();

        session_.set_on_event([weak](const events::Event& ev) {
            if (auto self = weak.lock()) self->on_session_event(ev);
        });
        chat_.set_on_event([weak](const events::Event& ev) {
            if (auto self = weak.lock()) self->publish(ev);
        });
        race_.set_on_event([weak](const events::Event& ev) {
            if (auto self = weak.lock()) self->on_race_event(ev);
        });

        for (int t = static_cast<int>(MessageTag::SessionAnnounce); t <= static_cast<int>(MessageTag::Pong); ++t) {
            transport_.on(static_cast<MessageTag>(t), [weak](const protocol::Message& msg, const Endpoint& from) {
                if (auto self = weak.lock()) self->route(msg, from);
            });
        }
        transport_.set_on_peer_lost([weak](const RiderId& rider) {
            if (auto self = weak.lock()) self->on_peer_lost(rider);
        });
        transport_.set_on_peer_recovered([weak](const RiderId& rider) {
            if (auto self = weak.lock()) self->on_peer_recovered(rider);
        });
    }

    void start() {
        if (running_.exchange(true)) return;

        start_transport();
        start_discovery();

        arm(session_timer_, kTickInterval, &Impl::on_session_tick);
        arm(metric_timer_, config_.metric_interval(), &Impl::on_metric_tick);
        arm(chat_timer_, kTickInterval, &Impl::on_chat_tick);
        arm(race_timer_, kTickInterval, &Impl::on_race_tick);
        arm(clock_timer_, config_.heartbeat_interval, &Impl::on_clock_tick);

        log::info(kTag) << self_.name() << " (" << self_.id() << ") up"
                        << (transport_degraded_ ? ", transport degraded" : "");
    }

    void stop() {
        if (!running_.exchange(false)) return;

        asio::post(session_strand_, [self = shared_from_this()] {
            self->session_timer_.cancel();
            self->metric_timer_.cancel();
            if (self->session_.state() == session::SessionState::Active) {
                const auto ec = self->session_.leave(Clock::now());
                if (ec) log::warn(kTag) << "leave on shutdown: " << ec.message();
            }
        });
        asio::post(chat_strand_, [self = shared_from_this()] { self->chat_timer_.cancel(); });
        asio::post(race_strand_, [self = shared_from_this()] { self->race_timer_.cancel(); });
        asio::post(clock_strand_, [self = shared_from_this()] { self->clock_timer_.cancel(); });

        if (discovery_) discovery_->stop();
        // Queued leave notices go out before the sockets close.
        asio::post(session_strand_, [self = shared_from_this()] { self->transport_.stop(); });
        log::info(kTag) << "stopping";
    }

    void subscribe(events::EventHandler h) {
        asio::post(events_strand_, [self = shared_from_this(), h = std::move(h)]() mutable {
            self->subscribers_.push_back(std::move(h));
        });
    }

    // ---- operations ----

    void host_session(std::string world, Completion done) {
        asio::post(session_strand_, [self = shared_from_this(), world = std::move(world), done = std::move(done)] {
            error_code ec = self->transport_degraded_ ? make_error_code(errc::network_unavailable)
                                                     : self->session_.host(world, Clock::now());
            complete(done, ec);
        });
    }

    void join_session(SessionId id, Completion done) {
        asio::post(session_strand_, [self = shared_from_this(), id = std::move(id), done = std::move(done)] {
            error_code ec = self->transport_degraded_ ? make_error_code(errc::network_unavailable)
                                                     : self->session_.join(id, Clock::now());
            complete(done, ec);
        });
    }

    void leave_session(Completion done) {
        asio::post(session_strand_, [self = shared_from_this(), done = std::move(done)] {
            complete(done, self->session_.leave(Clock::now()));
        });
    }

    void broadcast_metrics(protocol::RiderMetrics m, Completion done) {
        asio::post(session_strand_, [self = shared_from_this(), m, done = std::move(done)] {
            const auto now = Clock::now();
            const auto ec = self->session_.broadcast_metrics(m, now);
            if (!ec) self->feed_race(m.distance_m, now);
            complete(done, ec);
        });
    }

    void send_chat(std::string text, ChatCompletion done) {
        asio::post(chat_strand_, [self = shared_from_this(), text = std::move(text), done = std::move(done)] {
            std::uint32_t id = 0;
            const auto ec = self->chat_.send(text, Clock::now(), &id);
            if (done) done(ec, id);
        });
    }

    void create_race(race::RaceSpec spec, Completion done) {
        asio::post(race_strand_, [self = shared_from_this(), spec = std::move(spec), done = std::move(done)] {
            complete(done, self->race_.create(spec, Clock::now()));
        });
    }

    void join_race(RaceId id, Completion done) {
        asio::post(race_strand_, [self = shared_from_this(), id = std::move(id), done = std::move(done)] {
            complete(done, self->race_.join(id, Clock::now()));
        });
    }

    void cancel_race(Completion done) {
        asio::post(race_strand_, [self = shared_from_this(), done = std::move(done)] {
            complete(done, self->race_.cancel(Clock::now()));
        });
    }

    void end_race(Completion done) {
        asio::post(race_strand_, [self = shared_from_this(), done = std::move(done)] {
            complete(done, self->race_.end(Clock::now()));
        });
    }

    void peers(std::function<void(std::vector<discovery::PeerInfo>)> done) {
        if (discovery_) {
            discovery_->peers(std::move(done));
            return;
        }
        asio::post(events_strand_, [done = std::move(done)] { done({}); });
    }

    void sessions(std::function<void(std::vector<session::AnnouncedSession>)> done) {
        asio::post(session_strand_, [self = shared_from_this(), done = std::move(done)] {
            done(self->session_.available_sessions());
        });
    }

    void on_network_restored() {
        if (transport_degraded_) start_transport();
        if (!discovery_ || !discovery_->enabled()) start_discovery();

        asio::post(session_strand_, [self = shared_from_this()] {
            self->session_.on_network_restored(Clock::now());
            self->advertise();
        });
    }

    const Rider& rider() const noexcept { return self_; }
    Endpoint local_endpoint() const { return transport_.local_endpoint(); }
    bool degraded() const noexcept { return transport_degraded_ || discovery_degraded_; }

private:
    static void complete(const Completion& done, error_code ec) {
        if (done) done(ec);
    }

    void start_transport() {
        try {
            transport_.start();
            transport_degraded_ = false;
        } catch (const boost::system::system_error& e) {
            transport_degraded_ = true;
            log::error(kTag) << "transport unavailable: " << e.code().message();
            publish(events::ComponentDegraded{"transport", e.code()});
        }
    }

    void start_discovery() {
        if (transport_degraded_) {
            discovery_degraded_ = true;
            return;
        }
        if (!discovery_) {
            discovery::Discovery::Options o;
            o.service_type = config_.service_type;
            o.rider_id = self_.id();
            o.display_name = self_.name();
            o.transport_port = transport_.local_endpoint().port();
            o.group = config_.discovery_group;
            o.port = config_.discovery_port;
            o.multicast_ttl = config_.multicast_ttl;
            o.announce_interval = config_.announce_interval;
            o.peer_expiry = config_.peer_expiry;
            discovery_ = std::make_unique<discovery::Discovery>(ioc_, std::move(o));

            std::weak_ptr<Impl> weak = shared_from_this();
            discovery_->browse([weak](const discovery::PeerEvent& ev) {
                if (auto self = weak.lock()) self->on_peer_event(ev);
            });
        }

        discovery_degraded_ = !discovery_->start();
        if (discovery_degraded_) {
            publish(events::ComponentDegraded{"discovery", make_error_code(errc::network_unavailable)});
        }
    }

    // Runs on the session strand.
    void advertise() {
        if (!discovery_) return;
        if (session_.state() == session::SessionState::Active && session_.is_host()) {
            discovery_->advertise(session_.session()->id, session_.session()->world_id);
        } else {
            discovery_->advertise(std::nullopt, std::nullopt);
        }
    }

    template <class Fn>
    void arm(asio::steady_timer& timer, Millis period, Fn fn) {
        timer.expires_after(period);
        timer.async_wait([self = shared_from_this(), &timer, period, fn](const error_code& ec) {
            if (ec || !self->running_) return;
            ((*self).*fn)(Clock::now());
            self->arm(timer, period, fn);
        });
    }

    // ---- inbound traffic (transport strand) ----

    void route(const protocol::Message& msg, const Endpoint& from) {
        const auto now = Clock::now();

        asio::post(race_strand_, [self = shared_from_this(), sender = msg.sender, now] {
            self->race_.note_activity(sender, now);
        });

        switch (msg.tag()) {
            case MessageTag::SessionAnnounce:
            case MessageTag::SessionJoin:
            case MessageTag::JoinAccepted:
            case MessageTag::JoinRejected:
            case MessageTag::SessionLeave:
            case MessageTag::SessionEnded:
            case MessageTag::Heartbeat:
            case MessageTag::MetricUpdate:
                asio::post(session_strand_, [self = shared_from_this(), msg, from, now] {
                    self->session_.handle(msg, from, now);
                });
                break;

            case MessageTag::ChatMessage:
            case MessageTag::ChatAck:
                asio::post(chat_strand_, [self = shared_from_this(), msg, now] {
                    self->chat_.handle(msg, now);
                });
                break;

            case MessageTag::RaceAnnounce:
            case MessageTag::RaceJoin:
            case MessageTag::RaceCountdown:
            case MessageTag::RacePosition:
            case MessageTag::RaceFinish:
            case MessageTag::RaceControl:
                asio::post(race_strand_, [self = shared_from_this(), msg, now] {
                    self->race_.handle(msg, now);
                });
                break;

            case MessageTag::Ping:
                transport_.send_to(from, protocol::make_message(
                                             self_.id(), now,
                                             clock::ClockOffsetEstimator::answer(*msg.as<protocol::Ping>(), now)));
                break;

            case MessageTag::Pong:
                asio::post(clock_strand_, [self = shared_from_this(), msg, now] {
                    self->on_pong(msg, now);
                });
                break;
        }
    }

    void on_peer_lost(const RiderId& rider) {
        const auto now = Clock::now();
        asio::post(session_strand_, [self = shared_from_this(), rider, now] {
            self->session_.on_peer_lost(rider, now);
        });
    }

    void on_peer_recovered(const RiderId& rider) {
        const auto now = Clock::now();
        asio::post(session_strand_, [self = shared_from_this(), rider, now] {
            self->session_.on_peer_recovered(rider, now);
            const auto& info = self->session_.session();
            if (info && !self->session_.is_host() && info->host_id == rider) {
                // our link to the host dropped; catch up on what we missed
                self->session_.on_network_restored(now);
            }
        });
    }

    // ---- discovery strand ----

    void on_peer_event(const discovery::PeerEvent& ev) {
        switch (ev.kind) {
            case discovery::PeerEvent::Kind::Appeared:
            case discovery::PeerEvent::Kind::Updated: {
                transport_.learn_peer(ev.peer.rider_id, ev.peer.address);
                if (ev.kind == discovery::PeerEvent::Kind::Appeared) publish(events::PeerAppeared{ev.peer});
                if (ev.peer.session_id) {
                    asio::post(session_strand_, [self = shared_from_this(), peer = ev.peer] {
                        self->session_.on_discovered(peer.rider_id, peer.name, *peer.session_id,
                                                     peer.world_id.value_or(std::string{}), peer.address,
                                                     Clock::now());
                    });
                }
                break;
            }
            case discovery::PeerEvent::Kind::Vanished:
                publish(events::PeerVanished{ev.peer.rider_id, ev.peer.name});
                break;
        }
    }

    // ---- session strand ----

    void on_session_tick(TimePoint now) { session_.tick(now); }

    void on_metric_tick(TimePoint now) {
        if (!io_.metrics || session_.state() != session::SessionState::Active) return;
        auto m = io_.metrics->current();
        if (!m) return;
        if (!session_.broadcast_metrics(*m, now)) feed_race(m->distance_m, now);
    }

    void feed_race(double distance_m, TimePoint now) {
        asio::post(race_strand_, [self = shared_from_this(), distance_m, now] {
            const auto ec = self->race_.update_position(distance_m, now);
            if (ec && ec != make_error_code(errc::no_race) && ec != make_error_code(errc::race_not_found)) {
                log::warn(kTag) << "position update: " << ec.message();
            }
        });
    }

    void on_session_event(const events::Event& ev) {
        if (auto* s = std::get_if<events::SessionStateChanged>(&ev)) {
            on_session_state(*s);
        } else if (auto* r = std::get_if<events::RosterChanged>(&ev)) {
            asio::post(chat_strand_, [self = shared_from_this(), members = r->members] {
                self->chat_.set_roster(members);
            });
            asio::post(clock_strand_, [self = shared_from_this(), members = r->members] {
                self->probe_targets_.clear();
                for (const auto& m : members) {
                    if (m != self->self_.id()) self->probe_targets_.push_back(m);
                }
            });
        } else if (auto* m = std::get_if<events::MetricsReceived>(&ev)) {
            if (io_.render) io_.render->peer_position(m->rider_id, m->metrics, m->sent_at);
        }
        publish(ev);
    }

    void on_session_state(const events::SessionStateChanged& s) {
        using session::SessionState;
        switch (s.state) {
            case SessionState::Active: {
                transport_.set_heartbeat_session(s.session_id);
                asio::post(chat_strand_, [self = shared_from_this(), id = s.session_id] {
                    if (!self->chat_.is_open()) self->chat_.open(id);
                });
                asio::post(race_strand_, [self = shared_from_this(), id = s.session_id] {
                    self->race_.set_session(id);
                });
                advertise();
                break;
            }
            case SessionState::Ended: {
                transport_.set_heartbeat_session({});
                auto record = session_.record();
                asio::post(chat_strand_, [self = shared_from_this(), record = std::move(record)] {
                    auto chat = self->chat_.close();
                    if (self->io_.history) self->io_.history->session_completed(record, chat);
                });
                asio::post(race_strand_, [self = shared_from_this()] { self->race_.set_session(std::nullopt); });
                asio::post(clock_strand_, [self = shared_from_this()] { self->probe_targets_.clear(); });
                advertise();
                break;
            }
            case SessionState::Idle:
            case SessionState::Hosting:
            case SessionState::Joining:
                break;
        }
    }

    // ---- chat / race strands ----

    void on_chat_tick(TimePoint now) { chat_.tick(now); }
    void on_race_tick(TimePoint now) { race_.tick(now); }

    void on_race_event(const events::Event& ev) {
        if (auto* r = std::get_if<events::RaceResultsReady>(&ev)) {
            if (io_.history) io_.history->race_completed(r->results);
        }
        publish(ev);
    }

    // ---- clock strand ----

    void on_clock_tick(TimePoint now) {
        clock_.expire_probes(now);
        for (const auto& peer : probe_targets_) {
            transport_.send_to(peer, protocol::make_message(self_.id(), now, clock_.make_probe(peer, now)));
        }
    }

    void on_pong(const protocol::Message& msg, TimePoint now) {
        const auto* pong = msg.as<protocol::Pong>();
        if (!clock_.on_pong(msg.sender, *pong, now)) return;

        const auto est = clock_.estimate(msg.sender);
        if (!est) return;
        asio::post(race_strand_, [self = shared_from_this(), peer = msg.sender, offset = est->offset_ms] {
            self->race_.set_clock_offset(peer, offset);
        });
        publish(events::ClockSyncUpdated{msg.sender, est->offset_ms, est->round_trip_ms});
    }

    // ---- subscribers ----

    void publish(events::Event ev) {
        asio::post(events_strand_, [self = shared_from_this(), ev = std::move(ev)] {
            for (const auto& h : self->subscribers_) h(ev);
        });
    }

private:
    asio::io_context& ioc_;
    Config config_;
    Rider self_;
    Collaborators io_;
    IdGenerator ids_;

    networking::Transport transport_;
    std::unique_ptr<discovery::Discovery> discovery_;

    Strand session_strand_;
    Strand chat_strand_;
    Strand race_strand_;
    Strand clock_strand_;
    Strand events_strand_;

    session::SessionManager session_;      // session strand
    chat::ChatService chat_;               // chat strand
    race::RaceCoordinator race_;           // race strand
    clock::ClockOffsetEstimator clock_;    // clock strand
    std::vector<RiderId> probe_targets_;   // clock strand
    std::vector<events::EventHandler> subscribers_;  // events strand

    asio::steady_timer session_timer_;
    asio::steady_timer metric_timer_;
    asio::steady_timer chat_timer_;
    asio::steady_timer race_timer_;
    asio::steady_timer clock_timer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> transport_degraded_{false};
    std::atomic<bool> discovery_degraded_{false};
};

// ---- Engine wrapper ----

Engine::Engine(boost::asio::io_context& ioc, Config config, Rider self)
    : Engine(ioc, std::move(config), std::move(self), Collaborators{}) {}

Engine::Engine(boost::asio::io_context& ioc, Config config, Rider self, Collaborators io)
    : impl_(std::make_shared<Impl>(ioc, std::move(config), std::move(self), io)) {
    impl_->wire();
}

Engine::~Engine() { impl_->stop(); }

void Engine::start() { impl_->start(); }
void Engine::stop() { impl_->stop(); }

void Engine::subscribe(events::EventHandler handler) { impl_->subscribe(std::move(handler)); }

void Engine::host_session(std::string world_id, Completion done) {
    impl_->host_session(std::move(world_id), std::move(done));
}
void Engine::join_session(SessionId session_id, Completion done) {
    impl_->join_session(std::move(session_id), std::move(done));
}
void Engine::leave_session(Completion done) { impl_->leave_session(std::move(done)); }
void Engine::broadcast_metrics(protocol::RiderMetrics metrics, Completion done) {
    impl_->broadcast_metrics(metrics, std::move(done));
}
void Engine::send_chat(std::string text, ChatCompletion done) {
    impl_->send_chat(std::move(text), std::move(done));
}

void Engine::create_race(race::RaceSpec spec, Completion done) {
    impl_->create_race(std::move(spec), std::move(done));
}
void Engine::join_race(RaceId race_id, Completion done) { impl_->join_race(std::move(race_id), std::move(done)); }
void Engine::cancel_race(Completion done) { impl_->cancel_race(std::move(done)); }
void Engine::end_race(Completion done) { impl_->end_race(std::move(done)); }

void Engine::peers(std::function<void(std::vector<discovery::PeerInfo>)> done) {
    impl_->peers(std::move(done));
}
void Engine::sessions(std::function<void(std::vector<session::AnnouncedSession>)> done) {
    impl_->sessions(std::move(done));
}

void Engine::on_network_restored() { impl_->on_network_restored(); }

const Rider& Engine::rider() const noexcept { return impl_->rider(); }
Endpoint Engine::local_endpoint() const { return impl_->local_endpoint(); }
bool Engine::degraded() const noexcept { return impl_->degraded(); }

} // namespace groupride::engine
