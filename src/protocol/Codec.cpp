#include "protocol/Codec.h"

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace groupride::protocol {

namespace {

constexpr std::uint8_t kMagic0 = 'G';
constexpr std::uint8_t kMagic1 = 'R';

class Writer {
public:
    void u8(std::uint8_t v) { out_.push_back(v); }
    void u16(std::uint16_t v) { u8(static_cast<std::uint8_t>(v >> 8)); u8(static_cast<std::uint8_t>(v)); }

    void u32(std::uint32_t v) {
        for (int shift = 24; shift >= 0; shift -= 8) u8(static_cast<std::uint8_t>(v >> shift));
    }

    void u64(std::uint64_t v) {
        for (int shift = 56; shift >= 0; shift -= 8) u8(static_cast<std::uint8_t>(v >> shift));
    }

    void i32(std::int32_t v) { u32(static_cast<std::uint32_t>(v)); }
    void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }
    void boolean(bool v) { u8(v ? 1 : 0); }

    void f32(float v) {
        std::uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u32(bits);
    }

    void f64(double v) {
        std::uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u64(bits);
    }

    void str(const std::string& s) {
        if (s.size() > 0xFFFF) throw std::length_error("string field longer than 65535 bytes");
        u16(static_cast<std::uint16_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    std::vector<std::uint8_t> take() { return std::move(out_); }

private:
    std::vector<std::uint8_t> out_;
};

// Reads past the end latch ok() to false and yield zeros.
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    bool ok() const noexcept { return ok_; }
    bool at_end() const noexcept { return pos_ == size_; }

    std::uint8_t u8() {
        if (!need(1)) return 0;
        return data_[pos_++];
    }

    std::uint16_t u16() {
        std::uint16_t hi = u8();
        return static_cast<std::uint16_t>((hi << 8) | u8());
    }

    std::uint32_t u32() {
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | u8();
        return v;
    }

    std::uint64_t u64() {
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | u8();
        return v;
    }

    std::int32_t i32() { return static_cast<std::int32_t>(u32()); }
    std::int64_t i64() { return static_cast<std::int64_t>(u64()); }
    bool boolean() { return u8() != 0; }

    float f32() {
        std::uint32_t bits = u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double f64() {
        std::uint64_t bits = u64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string str() {
        std::size_t n = u16();
        if (!need(n)) return {};
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

private:
    bool need(std::size_t n) {
        if (!ok_ || size_ - pos_ < n) {
            ok_ = false;
            return false;
        }
        return true;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_ = 0;
    bool ok_ = true;
};

// ---- payload writers ----

void put(Writer& w, const SessionAnnounce& m) {
    w.str(m.session_id);
    w.str(m.host_name);
    w.str(m.world_id);
    w.u8(m.participant_count);
    w.u8(m.max_participants);
}

void put(Writer& w, const SessionJoin& m) {
    w.str(m.session_id);
    w.str(m.rider_id);
    w.str(m.rider_name);
    w.i64(m.joined_at);
    w.boolean(m.rejoin);
}

void put(Writer& w, const JoinAccepted& m) {
    w.str(m.session_id);
    w.str(m.world_id);
    w.str(m.host_id);
    if (m.roster.size() > 0xFF) throw std::length_error("roster snapshot too large");
    w.u8(static_cast<std::uint8_t>(m.roster.size()));
    for (const auto& p : m.roster) {
        w.str(p.rider_id);
        w.str(p.rider_name);
        w.i64(p.joined_at);
    }
}

void put(Writer& w, const JoinRejected& m) {
    w.str(m.session_id);
    w.str(m.rider_id);
    w.u8(static_cast<std::uint8_t>(m.reason));
}

void put(Writer& w, const SessionLeave& m) {
    w.str(m.session_id);
    w.str(m.rider_id);
    w.i64(m.left_at);
}

void put(Writer& w, const SessionEnded& m) { w.str(m.session_id); }
void put(Writer& w, const Heartbeat& m) { w.str(m.session_id); }

void put(Writer& w, const MetricUpdate& m) {
    w.str(m.session_id);
    w.u16(m.metrics.power_watts);
    w.u8(m.metrics.cadence_rpm);
    w.u8(m.metrics.heart_rate_bpm);
    w.f32(m.metrics.speed_kmh);
    w.f64(m.metrics.distance_m);
}

void put(Writer& w, const ChatMessage& m) {
    w.u32(m.message_id);
    w.str(m.text);
}

void put(Writer& w, const ChatAck& m) {
    w.str(m.original_sender);
    w.u32(m.message_id);
}

void put(Writer& w, const RaceAnnounce& m) {
    w.str(m.race_id);
    w.str(m.name);
    w.str(m.course_id);
    w.f64(m.distance_m);
    w.i64(m.scheduled_start);
    w.u32(m.countdown_ms);
    w.u8(m.status);
    if (m.roster.size() > 0xFF) throw std::length_error("race roster too large");
    w.u8(static_cast<std::uint8_t>(m.roster.size()));
    for (const auto& id : m.roster) w.str(id);
}

void put(Writer& w, const RaceJoin& m) {
    w.str(m.race_id);
    w.str(m.rider_id);
    w.str(m.rider_name);
}

void put(Writer& w, const RaceCountdown& m) {
    w.str(m.race_id);
    w.i32(m.remaining_ms);
    w.i64(m.start_at);
}

void put(Writer& w, const RacePosition& m) {
    w.str(m.race_id);
    w.f64(m.distance_m);
    w.u32(m.elapsed_ms);
}

void put(Writer& w, const RaceFinish& m) {
    w.str(m.race_id);
    w.u32(m.finish_time_ms);
}

void put(Writer& w, const RaceControl& m) {
    w.str(m.race_id);
    w.u8(static_cast<std::uint8_t>(m.action));
}

void put(Writer& w, const Ping& m) { w.i64(m.timestamp); }

void put(Writer& w, const Pong& m) {
    w.i64(m.echoed_timestamp);
    w.i64(m.local_time);
}

// ---- payload readers ----

void get(Reader& r, SessionAnnounce& m) {
    m.session_id = r.str();
    m.host_name = r.str();
    m.world_id = r.str();
    m.participant_count = r.u8();
    m.max_participants = r.u8();
}

void get(Reader& r, SessionJoin& m) {
    m.session_id = r.str();
    m.rider_id = r.str();
    m.rider_name = r.str();
    m.joined_at = r.i64();
    m.rejoin = r.boolean();
}

void get(Reader& r, JoinAccepted& m) {
    m.session_id = r.str();
    m.world_id = r.str();
    m.host_id = r.str();
    std::size_t n = r.u8();
    for (std::size_t i = 0; i < n && r.ok(); ++i) {
        ParticipantInfo p;
        p.rider_id = r.str();
        p.rider_name = r.str();
        p.joined_at = r.i64();
        m.roster.push_back(std::move(p));
    }
}

void get(Reader& r, JoinRejected& m) {
    m.session_id = r.str();
    m.rider_id = r.str();
    m.reason = static_cast<RejectReason>(r.u8());
}

void get(Reader& r, SessionLeave& m) {
    m.session_id = r.str();
    m.rider_id = r.str();
    m.left_at = r.i64();
}

void get(Reader& r, SessionEnded& m) { m.session_id = r.str(); }
void get(Reader& r, Heartbeat& m) { m.session_id = r.str(); }

void get(Reader& r, MetricUpdate& m) {
    m.session_id = r.str();
    m.metrics.power_watts = r.u16();
    m.metrics.cadence_rpm = r.u8();
    m.metrics.heart_rate_bpm = r.u8();
    m.metrics.speed_kmh = r.f32();
    m.metrics.distance_m = r.f64();
}

void get(Reader& r, ChatMessage& m) {
    m.message_id = r.u32();
    m.text = r.str();
}

void get(Reader& r, ChatAck& m) {
    m.original_sender = r.str();
    m.message_id = r.u32();
}

void get(Reader& r, RaceAnnounce& m) {
    m.race_id = r.str();
    m.name = r.str();
    m.course_id = r.str();
    m.distance_m = r.f64();
    m.scheduled_start = r.i64();
    m.countdown_ms = r.u32();
    m.status = r.u8();
    std::size_t n = r.u8();
    for (std::size_t i = 0; i < n && r.ok(); ++i) m.roster.push_back(r.str());
}

void get(Reader& r, RaceJoin& m) {
    m.race_id = r.str();
    m.rider_id = r.str();
    m.rider_name = r.str();
}

void get(Reader& r, RaceCountdown& m) {
    m.race_id = r.str();
    m.remaining_ms = r.i32();
    m.start_at = r.i64();
}

void get(Reader& r, RacePosition& m) {
    m.race_id = r.str();
    m.distance_m = r.f64();
    m.elapsed_ms = r.u32();
}

void get(Reader& r, RaceFinish& m) {
    m.race_id = r.str();
    m.finish_time_ms = r.u32();
}

void get(Reader& r, RaceControl& m) {
    m.race_id = r.str();
    m.action = static_cast<RaceAction>(r.u8());
}

void get(Reader& r, Ping& m) { m.timestamp = r.i64(); }

void get(Reader& r, Pong& m) {
    m.echoed_timestamp = r.i64();
    m.local_time = r.i64();
}

template <class T>
bool read_body(Reader& r, Payload& out) {
    T body;
    get(r, body);
    if (!r.ok() || !r.at_end()) return false;
    out = std::move(body);
    return true;
}

bool valid_enums(const Payload& p) {
    if (auto* rej = std::get_if<JoinRejected>(&p)) {
        auto v = static_cast<std::uint8_t>(rej->reason);
        return v >= 1 && v <= 4;
    }
    if (auto* ctl = std::get_if<RaceControl>(&p)) {
        return ctl->action == RaceAction::Cancel || ctl->action == RaceAction::End;
    }
    return true;
}

} // namespace

const char* tag_name(MessageTag tag) noexcept {
    switch (tag) {
        case MessageTag::SessionAnnounce: return "SessionAnnounce";
        case MessageTag::SessionJoin:     return "SessionJoin";
        case MessageTag::JoinAccepted:    return "JoinAccepted";
        case MessageTag::JoinRejected:    return "JoinRejected";
        case MessageTag::SessionLeave:    return "SessionLeave";
        case MessageTag::SessionEnded:    return "SessionEnded";
        case MessageTag::Heartbeat:       return "Heartbeat";
        case MessageTag::MetricUpdate:    return "MetricUpdate";
        case MessageTag::ChatMessage:     return "ChatMessage";
        case MessageTag::ChatAck:         return "ChatAck";
        case MessageTag::RaceAnnounce:    return "RaceAnnounce";
        case MessageTag::RaceJoin:        return "RaceJoin";
        case MessageTag::RaceCountdown:   return "RaceCountdown";
        case MessageTag::RacePosition:    return "RacePosition";
        case MessageTag::RaceFinish:      return "RaceFinish";
        case MessageTag::RaceControl:     return "RaceControl";
        case MessageTag::Ping:            return "Ping";
        case MessageTag::Pong:            return "Pong";
    }
    return "Unknown";
}

std::vector<std::uint8_t> encode(const Message& msg) {
    Writer w;
    w.u8(kMagic0);
    w.u8(kMagic1);
    w.u8(kProtocolVersion);
    w.u8(static_cast<std::uint8_t>(msg.tag()));
    w.str(msg.sender);
    w.i64(msg.sent_at);
    std::visit([&w](const auto& body) { put(w, body); }, msg.payload);

    auto bytes = w.take();
    if (bytes.size() > kMaxMessageSize) {
        throw std::length_error(std::string(tag_name(msg.tag())) + " exceeds one datagram ("
                                + std::to_string(bytes.size()) + " bytes)");
    }
    return bytes;
}

std::optional<Message> decode(const std::uint8_t* data, std::size_t size) {
    if (data == nullptr || size > kMaxMessageSize) return std::nullopt;

    Reader r(data, size);
    if (r.u8() != kMagic0 || r.u8() != kMagic1) return std::nullopt;
    if (r.u8() != kProtocolVersion) return std::nullopt;
    const auto tag = static_cast<MessageTag>(r.u8());

    Message msg;
    msg.sender = r.str();
    msg.sent_at = r.i64();
    if (!r.ok() || msg.sender.empty()) return std::nullopt;

    bool ok = false;
    switch (tag) {
        case MessageTag::SessionAnnounce: ok = read_body<SessionAnnounce>(r, msg.payload); break;
        case MessageTag::SessionJoin:     ok = read_body<SessionJoin>(r, msg.payload); break;
        case MessageTag::JoinAccepted:    ok = read_body<JoinAccepted>(r, msg.payload); break;
        case MessageTag::JoinRejected:    ok = read_body<JoinRejected>(r, msg.payload); break;
        case MessageTag::SessionLeave:    ok = read_body<SessionLeave>(r, msg.payload); break;
        case MessageTag::SessionEnded:    ok = read_body<SessionEnded>(r, msg.payload); break;
        case MessageTag::Heartbeat:       ok = read_body<Heartbeat>(r, msg.payload); break;
        case MessageTag::MetricUpdate:    ok = read_body<MetricUpdate>(r, msg.payload); break;
        case MessageTag::ChatMessage:     ok = read_body<ChatMessage>(r, msg.payload); break;
        case MessageTag::ChatAck:         ok = read_body<ChatAck>(r, msg.payload); break;
        case MessageTag::RaceAnnounce:    ok = read_body<RaceAnnounce>(r, msg.payload); break;
        case MessageTag::RaceJoin:        ok = read_body<RaceJoin>(r, msg.payload); break;
        case MessageTag::RaceCountdown:   ok = read_body<RaceCountdown>(r, msg.payload); break;
        case MessageTag::RacePosition:    ok = read_body<RacePosition>(r, msg.payload); break;
        case MessageTag::RaceFinish:      ok = read_body<RaceFinish>(r, msg.payload); break;
        case MessageTag::RaceControl:     ok = read_body<RaceControl>(r, msg.payload); break;
        case MessageTag::Ping:            ok = read_body<Ping>(r, msg.payload); break;
        case MessageTag::Pong:            ok = read_body<Pong>(r, msg.payload); break;
    }
    if (!ok || !valid_enums(msg.payload)) return std::nullopt;
    return msg;
}

} // namespace groupride::protocol
