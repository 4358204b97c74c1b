#include "chat/ChatService.h"

#include "core/Error.h"
#include "core/Log.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace groupride::chat {

namespace {

constexpr const char* kTag = "Chat";

std::string trim_copy(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

const char* to_string(ChatStatus status) noexcept {
    switch (status) {
        case ChatStatus::Pending:   return "pending";
        case ChatStatus::Delivered: return "delivered";
        case ChatStatus::Failed:    return "failed";
        case ChatStatus::Received:  return "received";
    }
    return "unknown";
}

ChatService::ChatService(const Rider& self, const Config& config, networking::Outbox& outbox)
    : self_(self),
      config_(config),
      outbox_(outbox) {}

void ChatService::set_on_event(events::EventHandler handler) {
    on_event_ = std::move(handler);
}

void ChatService::open(const SessionId& session_id) {
    session_ = session_id;
    next_id_ = 1;
    roster_.clear();
    log_.clear();
    outgoing_.clear();
    inbound_.clear();
}

std::vector<ChatEntry> ChatService::close() {
    for (const auto& [id, out] : outgoing_) {
        auto& entry = log_[out.log_index];
        if (entry.status == ChatStatus::Pending) entry.status = ChatStatus::Failed;
    }
    auto history = std::move(log_);
    session_.reset();
    roster_.clear();
    log_.clear();
    outgoing_.clear();
    inbound_.clear();
    return history;
}

void ChatService::set_roster(const std::vector<RiderId>& members) {
    roster_.clear();
    for (const auto& m : members) {
        if (m != self_.id()) roster_.insert(m);
    }

    std::vector<std::uint32_t> done;
    for (auto& [id, out] : outgoing_) {
        for (auto it = out.pending.begin(); it != out.pending.end();) {
            if (roster_.count(*it) == 0) {
                it = out.pending.erase(it);
            } else {
                ++it;
            }
        }
        if (out.pending.empty()) done.push_back(id);
    }
    for (auto id : done) {
        const bool anyone = !log_[outgoing_[id].log_index].acked_by.empty();
        settle(id, anyone ? ChatStatus::Delivered : ChatStatus::Failed);
    }
}

ChatService::error_code ChatService::send(const std::string& text, TimePoint now, std::uint32_t* id) {
    if (!session_) return errc::not_in_session;

    auto body = trim_copy(text);
    if (body.empty()) return errc::empty_message;
    if (body.size() > kMaxTextBytes) {
        log::debug(kTag) << "truncating message of " << body.size() << " bytes";
        body = truncate_utf8(std::move(body));
    }

    ChatEntry entry;
    entry.sender = self_.id();
    entry.message_id = next_id_++;
    entry.text = std::move(body);
    entry.sent_at = now;
    entry.received_at = now;
    entry.status = ChatStatus::Pending;
    entry.recipients = roster_.size();

    if (id) *id = entry.message_id;

    log_.push_back(entry);
    const auto index = log_.size() - 1;

    if (roster_.empty()) {
        log_[index].status = ChatStatus::Delivered;
        emit_status(log_[index]);
        return {};
    }

    Outgoing out;
    out.log_index = index;
    out.pending = roster_;
    out.attempts = 1;
    out.backoff = config_.chat_retry_base;
    out.next_retry = now + out.backoff;
    transmit(entry, out.pending, now);
    outgoing_.emplace(entry.message_id, std::move(out));

    emit_status(log_[index]);
    return {};
}

void ChatService::handle(const protocol::Message& msg, TimePoint now) {
    if (!session_ || msg.sender == self_.id()) return;

    if (auto* m = msg.as<protocol::ChatMessage>()) {
        handle_message(msg, *m, now);
    } else if (auto* a = msg.as<protocol::ChatAck>()) {
        handle_ack(msg, *a);
    }
}

void ChatService::handle_message(const protocol::Message& msg, const protocol::ChatMessage& m,
                                 TimePoint now) {
    // Every copy is acknowledged; the sender may have missed our last ack.
    outbox_.send_to(msg.sender, protocol::make_message(self_.id(), now,
                                                       protocol::ChatAck{msg.sender, m.message_id}));

    auto& stream = inbound_[msg.sender];
    if (!stream.seen.insert(m.message_id).second) {
        log::debug(kTag) << "duplicate " << msg.sender << "#" << m.message_id;
        return;
    }

    ChatEntry entry;
    entry.sender = msg.sender;
    entry.message_id = m.message_id;
    entry.text = m.text;
    entry.sent_at = from_wire_ms(msg.sent_at);
    entry.received_at = now;
    entry.status = ChatStatus::Received;

    if (m.message_id < stream.next) {
        // Its gap was already skipped.
        deliver(std::move(entry));
        return;
    }

    if (stream.held.empty()) stream.held_since = now;
    stream.held.emplace(m.message_id, std::move(entry));
    release(stream);
}

void ChatService::handle_ack(const protocol::Message& msg, const protocol::ChatAck& a) {
    if (a.original_sender != self_.id()) return;

    auto it = outgoing_.find(a.message_id);
    if (it == outgoing_.end()) return;

    auto& entry = log_[it->second.log_index];
    entry.acked_by.insert(msg.sender);
    it->second.pending.erase(msg.sender);

    if (it->second.pending.empty()) {
        settle(a.message_id, ChatStatus::Delivered);
    } else {
        emit_status(entry);
    }
}

void ChatService::tick(TimePoint now) {
    std::vector<std::uint32_t> failed;
    for (auto& [id, out] : outgoing_) {
        if (now < out.next_retry) continue;
        if (out.attempts >= config_.chat_max_attempts) {
            failed.push_back(id);
            continue;
        }
        ++out.attempts;
        out.backoff = std::min(out.backoff * 2, config_.chat_retry_max);
        out.next_retry = now + out.backoff;
        log::debug(kTag) << "resending #" << id << " to " << out.pending.size()
                         << " rider(s), attempt " << out.attempts;
        transmit(log_[out.log_index], out.pending, now);
    }
    for (auto id : failed) {
        log::warn(kTag) << "message #" << id << " not acknowledged by "
                        << outgoing_[id].pending.size() << " rider(s)";
        settle(id, ChatStatus::Failed);
    }

    for (auto& [sender, stream] : inbound_) {
        if (stream.held.empty() || now - stream.held_since < config_.chat_reorder_hold) continue;
        const auto first = stream.held.begin()->first;
        log::debug(kTag) << "gap " << stream.next << ".." << first - 1 << " from " << sender << " skipped";
        stream.next = first;
        release(stream);
        if (!stream.held.empty()) stream.held_since = now;
    }
}

std::optional<ChatEntry> ChatService::find(const RiderId& sender, std::uint32_t message_id) const {
    for (const auto& e : log_) {
        if (e.sender == sender && e.message_id == message_id) return e;
    }
    return std::nullopt;
}

std::string ChatService::truncate_utf8(std::string text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    std::size_t cut = max_bytes;
    // Back off continuation bytes (10xxxxxx) to the start of the sequence.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    text.resize(cut);
    return text;
}

// ---- helpers ----

void ChatService::transmit(const ChatEntry& entry, const std::set<RiderId>& to, TimePoint now) {
    auto msg = protocol::make_message(self_.id(), now, protocol::ChatMessage{entry.message_id, entry.text});
    msg.sent_at = to_wire_ms(entry.sent_at);
    for (const auto& rider : to) outbox_.send_to(rider, msg);
}

void ChatService::release(InboundStream& stream) {
    for (auto it = stream.held.begin(); it != stream.held.end() && it->first == stream.next;) {
        deliver(std::move(it->second));
        it = stream.held.erase(it);
        ++stream.next;
    }
}

void ChatService::deliver(ChatEntry entry) {
    log_.push_back(entry);
    emit(events::ChatReceived{std::move(entry)});
}

void ChatService::settle(std::uint32_t message_id, ChatStatus status) {
    auto it = outgoing_.find(message_id);
    if (it == outgoing_.end()) return;
    auto& entry = log_[it->second.log_index];
    entry.status = status;
    outgoing_.erase(it);
    emit_status(entry);
}

void ChatService::emit_status(const ChatEntry& entry) {
    emit(events::ChatStatusChanged{entry.message_id, entry.status, entry.acked_by.size(), entry.recipients});
}

void ChatService::emit(events::Event ev) {
    if (on_event_) on_event_(ev);
}

} // namespace groupride::chat
