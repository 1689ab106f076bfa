#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rsvp {
namespace domain {

// -----------------------------------------------------------------------------
// UserId
// -----------------------------------------------------------------------------
// SQLite INTEGER PRIMARY KEY of the users table. 0 is never assigned and is
// used as the "unset" value.
// -----------------------------------------------------------------------------
using UserId = std::int64_t;

// -----------------------------------------------------------------------------
// UserRole
// -----------------------------------------------------------------------------
// Organizers publish events, attendees register for them. Stored as the
// lower-case strings "organizer" / "attendee" (a CHECK constraint in the
// schema rejects anything else). Roles are informational only; no route is
// restricted by role.
// -----------------------------------------------------------------------------
enum class UserRole {
  Organizer,
  Attendee,
};

inline const char* roleToString(UserRole role) {
  switch (role) {
    case UserRole::Organizer: return "organizer";
    case UserRole::Attendee:  return "attendee";
  }
  return "attendee";
}

inline std::optional<UserRole> roleFromString(const std::string& text) {
  if (text == "organizer") {
    return UserRole::Organizer;
  }
  if (text == "attendee") {
    return UserRole::Attendee;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// User
// -----------------------------------------------------------------------------
// Plain value snapshot of one users row. email is unique across users.
// -----------------------------------------------------------------------------
struct User {
  UserId id{};
  std::string name;
  std::string email;
  UserRole role{UserRole::Attendee};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace rsvp
