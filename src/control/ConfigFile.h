#pragma once

#include "core/Config.h"

#include <string>
#include <string_view>

namespace groupride::control {

// JSON configuration. Missing keys keep their defaults, unknown keys are
// logged and ignored. A malformed document or a value of the wrong type or
// range throws std::runtime_error naming the offending key.
Config parse_config(std::string_view text, Config base = {});
Config load_config(const std::string& path, Config base = {});

} // namespace groupride::control
