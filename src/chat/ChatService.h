#pragma once

#include "chat/ChatTypes.h"
#include "core/Config.h"
#include "core/Rider.h"
#include "core/Types.h"
#include "engine/Events.h"
#include "networking/Outbox.h"
#include "protocol/Message.h"

#include <boost/system/error_code.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace groupride::chat {

// Reliable session chat over the unreliable transport.
//
// Outgoing messages are unicast to every other member and resent with
// exponential backoff until each recipient acknowledges or the attempt budget
// runs out. Incoming messages are acknowledged on every copy, deduplicated by
// (sender, message_id) and released to the application in per-sender order;
// a gap is skipped once it has been held for chat_reorder_hold.
class ChatService {
public:
    using error_code = boost::system::error_code;

    static constexpr std::size_t kMaxTextBytes = 500;

    ChatService(const Rider& self, const Config& config, networking::Outbox& outbox);

    void set_on_event(events::EventHandler handler);

    // Session scope. close() returns the log and forgets everything.
    void open(const SessionId& session_id);
    std::vector<ChatEntry> close();
    bool is_open() const noexcept { return session_.has_value(); }

    // Current members, self included or not. Recipients that drop out stop
    // being waited for; a message nobody acknowledged then fails.
    void set_roster(const std::vector<RiderId>& members);

    // Returns the assigned message id through `id` when given.
    error_code send(const std::string& text, TimePoint now, std::uint32_t* id = nullptr);

    void handle(const protocol::Message& msg, TimePoint now);

    // Resends due messages and releases held ones whose gap expired.
    void tick(TimePoint now);

    const std::vector<ChatEntry>& log() const noexcept { return log_; }
    std::optional<ChatEntry> find(const RiderId& sender, std::uint32_t message_id) const;

    // Cuts to at most kMaxTextBytes without splitting a UTF-8 sequence.
    static std::string truncate_utf8(std::string text, std::size_t max_bytes = kMaxTextBytes);

private:
    struct Outgoing {
        std::size_t log_index = 0;
        std::set<RiderId> pending;
        int attempts = 0;
        Millis backoff{0};
        TimePoint next_retry{};
    };

    struct InboundStream {
        std::uint32_t next = 1;  // next id to release in order
        std::set<std::uint32_t> seen;
        std::map<std::uint32_t, ChatEntry> held;
        TimePoint held_since{};
    };

    void handle_message(const protocol::Message& msg, const protocol::ChatMessage& m, TimePoint now);
    void handle_ack(const protocol::Message& msg, const protocol::ChatAck& a);

    void transmit(const ChatEntry& entry, const std::set<RiderId>& to, TimePoint now);
    void release(InboundStream& stream);
    void deliver(ChatEntry entry);
    void settle(std::uint32_t message_id, ChatStatus status);
    void emit_status(const ChatEntry& entry);
    void emit(events::Event ev);

private:
    Rider self_;
    const Config& config_;
    networking::Outbox& outbox_;
    events::EventHandler on_event_;

    std::optional<SessionId> session_;
    std::set<RiderId> roster_;
    std::uint32_t next_id_ = 1;
    std::vector<ChatEntry> log_;
    std::map<std::uint32_t, Outgoing> outgoing_;
    std::unordered_map<RiderId, InboundStream> inbound_;
};

} // namespace groupride::chat
