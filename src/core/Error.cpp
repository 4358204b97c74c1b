#include "core/Error.h"

#include <string>

namespace groupride {

namespace {

class Category : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "groupride"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::already_in_session:   return "already in a session";
            case errc::not_in_session:       return "not in a session";
            case errc::unknown_session:      return "unknown session";
            case errc::session_full:         return "session full";
            case errc::session_ended:        return "session ended";
            case errc::duplicate_join:       return "rider already joined from another node";
            case errc::join_timeout:         return "host did not answer the join request";
            case errc::not_host:             return "not hosting this session";
            case errc::empty_message:        return "empty chat message";
            case errc::no_race:              return "no race in this session";
            case errc::race_exists:          return "a race is already scheduled";
            case errc::race_not_found:       return "race not found";
            case errc::race_already_started: return "race already started";
            case errc::race_full:            return "race full";
            case errc::already_registered:   return "already registered for this race";
            case errc::not_organizer:        return "not the race organizer";
            case errc::invalid_schedule:     return "race start is too close or in the past";
            case errc::invalid_transition:   return "illegal status transition";
            case errc::network_unavailable:  return "networking unavailable";
        }
        return "unknown groupride error";
    }
};

} // namespace

const boost::system::error_category& error_category() noexcept {
    static const Category category;
    return category;
}

} // namespace groupride
