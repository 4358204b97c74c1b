#include "core/Rider.h"

#include <utility>

namespace groupride {

Rider::Rider(IdGenerator& idgen, std::string display_name)
    : id_(idgen.riderID()),
      name_(sanitize_name(std::move(display_name))) {}

Rider::Rider(RiderId id, std::string display_name)
    : id_(std::move(id)),
      name_(sanitize_name(std::move(display_name))) {}

bool Rider::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string Rider::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    return s.substr(start, end - start);
}

std::string Rider::sanitize_name(std::string s) {
    s = trim_copy(std::move(s));

    if (s.size() > kMaxNameLen) {
        // don't cut a UTF-8 sequence in half
        std::size_t cut = kMaxNameLen;
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
        s.resize(cut);
        s = trim_copy(std::move(s));
    }

    if (s.empty()) s = "guest";
    return s;
}

} // namespace groupride
