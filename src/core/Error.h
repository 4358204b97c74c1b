#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace groupride {

enum class errc {
    already_in_session = 1,
    not_in_session,
    unknown_session,
    session_full,
    session_ended,
    duplicate_join,
    join_timeout,
    not_host,
    empty_message,
    no_race,
    race_exists,
    race_not_found,
    race_already_started,
    race_full,
    already_registered,
    not_organizer,
    invalid_schedule,
    invalid_transition,
    network_unavailable,
};

const boost::system::error_category& error_category() noexcept;

inline boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace groupride

namespace boost::system {

template <>
struct is_error_code_enum<groupride::errc> : std::true_type {};

} // namespace boost::system
