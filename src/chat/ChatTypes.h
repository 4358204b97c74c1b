#pragma once

#include "core/Types.h"

#include <cstdint>
#include <set>
#include <string>

namespace groupride::chat {

// Pending -> Delivered | Failed for our own messages; Received for others'.
enum class ChatStatus { Pending, Delivered, Failed, Received };

const char* to_string(ChatStatus status) noexcept;

struct ChatEntry {
    RiderId sender;
    std::uint32_t message_id = 0;
    std::string text;
    TimePoint sent_at{};        // sender clock
    TimePoint received_at{};    // local clock; equals sent_at for our own
    ChatStatus status = ChatStatus::Pending;
    std::set<RiderId> acked_by; // outgoing only
    std::size_t recipients = 0; // outgoing only
};

} // namespace groupride::chat
