#pragma once

#include "rsvp/domain/event.hpp"
#include "rsvp/domain/registration.hpp"
#include "rsvp/domain/user.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// JSON shapes of the domain rows
// -----------------------------------------------------------------------------
// Field names are the snake_case column names, so a response body mirrors
// the stored row:
//
//   user          {"id", "name", "email", "role", "created_at_ms"}
//   event         {"id", "title", "capacity", "available_seats",
//                  "organizer_id", "created_at_ms"}
//   registration  {"id", "user_id", "event_id", "created_at_ms"}
//   error         {"error": "<message>"}
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::User& user);
nlohmann::json toJson(const domain::Event& event);
nlohmann::json toJson(const domain::Registration& registration);

nlohmann::json errorBody(const std::string& message);
nlohmann::json messageBody(const std::string& message);

}  // namespace rsvp
