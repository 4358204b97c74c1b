#pragma once

#include "core/IdGenerator.hpp"
#include "core/Types.h"

#include <cstddef>
#include <string>

namespace groupride {

// The local participant's identity. Immutable once the engine is running.
class Rider {
public:
    static constexpr std::size_t kMaxNameLen = 24;

    // Mints a fresh rider-<ulid>.
    Rider(IdGenerator& idgen, std::string display_name);

    // Restores a known id (profile on disk, tests, reconnect).
    Rider(RiderId id, std::string display_name);

    const RiderId& id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }

    static std::string sanitize_name(std::string s);

private:
    static std::string trim_copy(std::string s);
    static bool is_space(char c) noexcept;

private:
    RiderId id_;
    std::string name_;
};

} // namespace groupride
