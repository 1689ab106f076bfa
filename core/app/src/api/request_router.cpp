#include "rsvp/api/request_router.hpp"
#include "rsvp/api/json_mapping.hpp"

#include <cctype>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace rsvp {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::string current;
  for (char c : path) {
    if (c == '/') {
      if (!current.empty()) {
        segments.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    segments.push_back(std::move(current));
  }
  return segments;
}

// Path ids are positive decimal integers; anything else is a 400.
std::optional<std::int64_t> parseId(const std::string& text) {
  if (text.empty() || text.size() > 18) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  if (value <= 0) {
    return std::nullopt;
  }
  return value;
}

void requireObject(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
}

std::int64_t requirePositiveId(const nlohmann::json& body, const char* field) {
  const nlohmann::json& value = body.at(field);
  if (!value.is_number_integer()) {
    throw std::invalid_argument(std::string(field) + " must be an integer");
  }
  auto id = value.get<std::int64_t>();
  if (id <= 0) {
    throw std::invalid_argument(std::string(field) + " must be positive");
  }
  return id;
}

std::string requireNonEmptyString(const nlohmann::json& value,
                                  const char* field) {
  if (!value.is_string()) {
    throw std::invalid_argument(std::string(field) + " must be a string");
  }
  auto text = value.get<std::string>();
  if (text.empty()) {
    throw std::invalid_argument(std::string(field) + " must not be empty");
  }
  return text;
}

domain::UserRole requireRole(const nlohmann::json& value) {
  auto role = domain::roleFromString(requireNonEmptyString(value, "role"));
  if (!role) {
    throw std::invalid_argument("role must be 'organizer' or 'attendee'");
  }
  return *role;
}

Response error(int status, const std::string& message) {
  return Response{status, errorBody(message)};
}

Response invalidId(const char* what) {
  return error(400, std::string("invalid ") + what + " ID");
}

Response methodNotAllowed(const std::string& method) {
  return error(405, "method " + method + " not allowed");
}

nlohmann::json apiInfo() {
  nlohmann::json j;
  j["message"] = "Event Registration API";
  j["version"] = "1.0";
  j["endpoints"] = {{"users", "/api/v1/users"},
                    {"events", "/api/v1/events"},
                    {"registrations", "/api/v1/registrations"},
                    {"health", "/health"}};
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RequestRouter::RequestRouter(ConnectionPool& pool,
                             RegistrationCoordinator& coordinator,
                             const UserRepository& users,
                             const EventRepository& events,
                             const RegistrationRepository& registrations)
    : pool_(pool),
      coordinator_(coordinator),
      users_(users),
      events_(events),
      registrations_(registrations) {}

// -----------------------------------------------------------------------------
// handle(): frame -> Response -> frame
// -----------------------------------------------------------------------------
std::string RequestRouter::handle(const std::string& frame) const {
  Response response;

  auto request = nlohmann::json::parse(frame, nullptr, false);
  if (request.is_discarded() || !request.is_object()) {
    response = error(400, "malformed JSON request");
  } else {
    try {
      auto method = request.value("method", std::string());
      auto path = request.value("path", std::string());
      nlohmann::json body =
          request.contains("body") ? request["body"] : nlohmann::json();
      response = dispatch(method, path, body);
    } catch (const nlohmann::json::exception& e) {
      response = error(400, e.what());
    }
  }

  nlohmann::json reply;
  reply["status"] = response.status;
  reply["body"] = std::move(response.body);
  return reply.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): route and translate exceptions into statuses
// -----------------------------------------------------------------------------
Response RequestRouter::dispatch(const std::string& method,
                                 const std::string& path,
                                 const nlohmann::json& body) const {
  try {
    return route(method, splitPath(path), body);
  } catch (const nlohmann::json::exception& e) {
    return error(400, e.what());
  } catch (const std::invalid_argument& e) {
    return error(400, e.what());
  } catch (const StoreError& e) {
    return fromStoreError(e);
  }
}

Response RequestRouter::route(const std::string& method,
                              const std::vector<std::string>& segments,
                              const nlohmann::json& body) const {
  if (segments.empty()) {
    return method == "GET" ? Response{200, apiInfo()}
                           : methodNotAllowed(method);
  }
  if (segments.size() == 1 && segments[0] == "health") {
    return method == "GET" ? Response{200, {{"status", "ok"}}}
                           : methodNotAllowed(method);
  }
  if (segments.size() < 3 || segments.size() > 4 || segments[0] != "api" ||
      segments[1] != "v1") {
    return error(404, "not found");
  }

  const std::string& collection = segments[2];
  const bool has_id = segments.size() == 4;

  if (collection == "users") {
    if (!has_id) {
      return method == "POST" ? createUser(body) : methodNotAllowed(method);
    }
    if (method == "GET") return getUser(segments[3]);
    if (method == "PUT") return updateUser(segments[3], body);
    if (method == "DELETE") return deleteUser(segments[3]);
    return methodNotAllowed(method);
  }

  if (collection == "events") {
    if (!has_id) {
      return method == "POST" ? createEvent(body) : methodNotAllowed(method);
    }
    if (method == "GET") return getEvent(segments[3]);
    if (method == "PUT") return updateEvent(segments[3], body);
    if (method == "DELETE") return deleteEvent(segments[3]);
    return methodNotAllowed(method);
  }

  if (collection == "registrations") {
    if (!has_id) {
      if (method == "POST") return registerForEvent(body);
      if (method == "DELETE") return cancelRegistration(body);
      return methodNotAllowed(method);
    }
    return method == "GET" ? getRegistration(segments[3])
                           : methodNotAllowed(method);
  }

  return error(404, "not found");
}

// =============================================================================
// Users
// =============================================================================

Response RequestRouter::createUser(const nlohmann::json& body) const {
  requireObject(body);
  auto name = requireNonEmptyString(body.at("name"), "name");
  auto email = requireNonEmptyString(body.at("email"), "email");
  auto role = body.contains("role") ? requireRole(body["role"])
                                    : domain::UserRole::Attendee;

  auto connection = pool_.acquire();
  try {
    return {201, toJson(users_.create(*connection, name, email, role))};
  } catch (const StoreError& e) {
    if (e.isUniqueViolation()) {
      return error(409, "email already in use");
    }
    throw;
  }
}

Response RequestRouter::getUser(const std::string& id_text) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("user");
  }
  auto connection = pool_.acquire();
  auto user = users_.find(*connection, *id);
  if (!user) {
    return error(404, "user not found");
  }
  return {200, toJson(*user)};
}

Response RequestRouter::updateUser(const std::string& id_text,
                                   const nlohmann::json& body) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("user");
  }
  requireObject(body);

  UserUpdate changes;
  if (body.contains("name")) {
    changes.name = requireNonEmptyString(body["name"], "name");
  }
  if (body.contains("email")) {
    changes.email = requireNonEmptyString(body["email"], "email");
  }
  if (body.contains("role")) {
    changes.role = requireRole(body["role"]);
  }

  auto connection = pool_.acquire();
  try {
    auto user = users_.update(*connection, *id, changes);
    if (!user) {
      return error(404, "user not found");
    }
    return {200, toJson(*user)};
  } catch (const StoreError& e) {
    if (e.isUniqueViolation()) {
      return error(409, "email already in use");
    }
    throw;
  }
}

Response RequestRouter::deleteUser(const std::string& id_text) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("user");
  }
  auto connection = pool_.acquire();
  try {
    if (!users_.remove(*connection, *id)) {
      return error(404, "user not found");
    }
  } catch (const StoreError& e) {
    if (e.isForeignKeyViolation()) {
      return error(409, "user still has registrations or organized events");
    }
    throw;
  }
  return {200, messageBody("user deleted successfully")};
}

// =============================================================================
// Events
// =============================================================================

Response RequestRouter::createEvent(const nlohmann::json& body) const {
  requireObject(body);
  auto title = requireNonEmptyString(body.at("title"), "title");
  const nlohmann::json& capacity_json = body.at("capacity");
  if (!capacity_json.is_number_integer()) {
    throw std::invalid_argument("capacity must be an integer");
  }
  auto capacity = capacity_json.get<std::int64_t>();
  if (capacity <= 0) {
    return error(400, "capacity must be greater than 0");
  }
  if (capacity > 1000000000) {
    return error(400, "capacity is too large");
  }
  auto organizer_id = requirePositiveId(body, "organizer_id");

  auto connection = pool_.acquire();
  try {
    auto event = events_.create(*connection, title,
                                static_cast<int>(capacity), organizer_id);
    return {201, toJson(event)};
  } catch (const StoreError& e) {
    if (e.isForeignKeyViolation()) {
      return error(404, "organizer not found");
    }
    throw;
  }
}

Response RequestRouter::getEvent(const std::string& id_text) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("event");
  }
  auto connection = pool_.acquire();
  auto event = events_.find(*connection, *id);
  if (!event) {
    return error(404, "event not found");
  }
  return {200, toJson(*event)};
}

Response RequestRouter::updateEvent(const std::string& id_text,
                                    const nlohmann::json& body) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("event");
  }
  requireObject(body);
  if (body.contains("capacity") || body.contains("available_seats")) {
    return error(400, "capacity and available_seats cannot be changed");
  }
  auto title = requireNonEmptyString(body.at("title"), "title");

  auto connection = pool_.acquire();
  auto event = events_.updateTitle(*connection, *id, title);
  if (!event) {
    return error(404, "event not found");
  }
  return {200, toJson(*event)};
}

Response RequestRouter::deleteEvent(const std::string& id_text) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("event");
  }
  auto connection = pool_.acquire();
  if (!events_.remove(*connection, *id)) {
    return error(404, "event not found");
  }
  return {200, messageBody("event deleted successfully")};
}

// =============================================================================
// Registrations
// =============================================================================

Response RequestRouter::registerForEvent(const nlohmann::json& body) const {
  requireObject(body);
  auto user_id = requirePositiveId(body, "user_id");
  auto event_id = requirePositiveId(body, "event_id");
  return toResponse(coordinator_.registerUser(user_id, event_id));
}

Response RequestRouter::cancelRegistration(const nlohmann::json& body) const {
  requireObject(body);
  auto user_id = requirePositiveId(body, "user_id");
  auto event_id = requirePositiveId(body, "event_id");
  return toResponse(coordinator_.cancel(user_id, event_id));
}

Response RequestRouter::getRegistration(const std::string& id_text) const {
  auto id = parseId(id_text);
  if (!id) {
    return invalidId("registration");
  }
  auto connection = pool_.acquire();
  auto registration = registrations_.find(*connection, *id);
  if (!registration) {
    return error(404, "registration not found");
  }
  return {200, toJson(*registration)};
}

// =============================================================================
// Outcome and error mapping
// =============================================================================

Response RequestRouter::toResponse(const RegisterOutcome& outcome) {
  if (auto* o = std::get_if<Registered>(&outcome)) {
    return {201, toJson(o->registration)};
  }
  if (std::get_if<AlreadyRegistered>(&outcome)) {
    return error(409, "user already registered for this event");
  }
  if (std::get_if<EventFull>(&outcome)) {
    return error(409, "event is full");
  }
  if (std::get_if<EventNotFound>(&outcome)) {
    return error(404, "event not found");
  }
  if (std::get_if<UserNotFound>(&outcome)) {
    return error(404, "user not found");
  }
  const auto& failure = std::get<TransientFailure>(outcome);
  return error(503, "temporarily unavailable, retry: " + failure.reason);
}

Response RequestRouter::toResponse(const CancelOutcome& outcome) {
  if (std::get_if<Cancelled>(&outcome)) {
    return {200, messageBody("registration cancelled successfully")};
  }
  if (std::get_if<NotRegistered>(&outcome)) {
    return {200, messageBody("no registration to cancel")};
  }
  const auto& failure = std::get<TransientFailure>(outcome);
  return error(503, "temporarily unavailable, retry: " + failure.reason);
}

Response RequestRouter::fromStoreError(const StoreError& e) {
  if (e.isTransient()) {
    return error(503, std::string("temporarily unavailable, retry: ") +
                          e.what());
  }
  if (e.isUniqueViolation() || e.isForeignKeyViolation()) {
    return error(409, e.what());
  }
  if (e.isCheckViolation()) {
    return error(400, e.what());
  }
  std::cerr << "[RequestRouter] store error: " << e.what() << "\n";
  return error(500, "internal error");
}

}  // namespace rsvp
