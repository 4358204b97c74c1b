#pragma once

#include <sstream>
#include <string_view>

namespace groupride::log {

enum class Level { debug, info, warn, error };

void set_level(Level level) noexcept;
Level level() noexcept;

// Accepts "debug", "info", "warn", "error".
bool parse_level(std::string_view text, Level& out) noexcept;

// One log line: "[Tag] text". Written on destruction so lines coming from
// different strands never interleave.
class Line {
public:
    Line(Level level, std::string_view tag);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        if (enabled_) out_ << value;
        return *this;
    }

private:
    Level level_;
    bool enabled_;
    std::ostringstream out_;
};

inline Line debug(std::string_view tag) { return Line(Level::debug, tag); }
inline Line info(std::string_view tag)  { return Line(Level::info, tag); }
inline Line warn(std::string_view tag)  { return Line(Level::warn, tag); }
inline Line error(std::string_view tag) { return Line(Level::error, tag); }

} // namespace groupride::log
