#pragma once

#include "protocol/Message.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace groupride::protocol {

// Fixed-schema binary framing, all integers big-endian:
//   'G' 'R' | version u8 | tag u8 | sender str16 | sent_at i64 | payload
// Throws std::length_error when the result would not fit in one datagram.
std::vector<std::uint8_t> encode(const Message& msg);

// Returns nullopt for anything malformed: short buffer, bad magic, other
// protocol version, unknown tag, trailing bytes.
std::optional<Message> decode(const std::uint8_t* data, std::size_t size);

inline std::optional<Message> decode(const std::vector<std::uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

} // namespace groupride::protocol
