#include "rsvp/api/json_mapping.hpp"

namespace rsvp {

nlohmann::json toJson(const domain::User& user) {
  nlohmann::json j;
  j["id"] = user.id;
  j["name"] = user.name;
  j["email"] = user.email;
  j["role"] = domain::roleToString(user.role);
  j["created_at_ms"] = user.created_at_ms;
  return j;
}

nlohmann::json toJson(const domain::Event& event) {
  nlohmann::json j;
  j["id"] = event.id;
  j["title"] = event.title;
  j["capacity"] = event.capacity;
  j["available_seats"] = event.available_seats;
  j["organizer_id"] = event.organizer_id;
  j["created_at_ms"] = event.created_at_ms;
  return j;
}

nlohmann::json toJson(const domain::Registration& registration) {
  nlohmann::json j;
  j["id"] = registration.id;
  j["user_id"] = registration.user_id;
  j["event_id"] = registration.event_id;
  j["created_at_ms"] = registration.created_at_ms;
  return j;
}

nlohmann::json errorBody(const std::string& message) {
  nlohmann::json j;
  j["error"] = message;
  return j;
}

nlohmann::json messageBody(const std::string& message) {
  nlohmann::json j;
  j["message"] = message;
  return j;
}

}  // namespace rsvp
