#include "core/Log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace groupride::log {

namespace {

std::atomic<Level> g_level{Level::info};
std::mutex g_mu;

} // namespace

void set_level(Level level) noexcept { g_level.store(level); }
Level level() noexcept { return g_level.load(); }

bool parse_level(std::string_view text, Level& out) noexcept {
    if (text == "debug") { out = Level::debug; return true; }
    if (text == "info")  { out = Level::info;  return true; }
    if (text == "warn")  { out = Level::warn;  return true; }
    if (text == "error") { out = Level::error; return true; }
    return false;
}

Line::Line(Level level, std::string_view tag)
    : level_(level),
      enabled_(level >= g_level.load()) {
    if (enabled_) out_ << "[" << tag << "] ";
}

Line::~Line() {
    if (!enabled_) return;
    out_ << "\n";

    std::lock_guard<std::mutex> lk(g_mu);
    if (level_ >= Level::warn) {
        std::cerr << out_.str();
    } else {
        std::cout << out_.str() << std::flush;
    }
}

} // namespace groupride::log
