#pragma once

#include "rsvp/registration/outcome.hpp"
#include "rsvp/registration/registration_coordinator.hpp"
#include "rsvp/repository/event_repository.hpp"
#include "rsvp/repository/registration_repository.hpp"
#include "rsvp/repository/user_repository.hpp"
#include "rsvp/store/connection_pool.hpp"
#include "rsvp/store/store_error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace rsvp {

// HTTP-style status plus JSON body of one request.
struct Response {
  int status{200};
  nlohmann::json body;
};

// -----------------------------------------------------------------------------
// RequestRouter: JSON request to repository / coordinator call
// -----------------------------------------------------------------------------
//
// @brief  Decodes one request frame, runs it against the store, and encodes
//         the reply frame.
//
// @details
// Wire format (one ZeroMQ frame each way):
//
//   request   {"method": "POST", "path": "/api/v1/registrations",
//              "body": {"user_id": 1, "event_id": 2}}
//   response  {"status": 201, "body": {...}}
//
// Routes:
//
//   GET    /                              API info
//   GET    /health                        {"status": "ok"}
//   POST   /api/v1/users                  create user
//   GET    /api/v1/users/{id}
//   PUT    /api/v1/users/{id}             name / email / role
//   DELETE /api/v1/users/{id}
//   POST   /api/v1/events                 create event
//   GET    /api/v1/events/{id}
//   PUT    /api/v1/events/{id}            title only
//   DELETE /api/v1/events/{id}
//   POST   /api/v1/registrations          RegistrationCoordinator::registerUser
//   DELETE /api/v1/registrations          RegistrationCoordinator::cancel
//   GET    /api/v1/registrations/{id}
//
// Status mapping:
//   400  malformed JSON, missing or mistyped field, failed validation,
//        non-numeric id
//   404  unknown path, absent row, UserNotFound, EventNotFound
//   405  known path, unsupported method
//   409  EventFull, AlreadyRegistered, UNIQUE / FOREIGN KEY violation
//   503  TransientFailure, busy or I/O StoreError
//   500  any other StoreError
//
// Thread model: Holds only references. handle() is called concurrently by
//               every RequestServer worker; each call leases its own
//               Connection.
// Ownership:    Everything referenced is owned by RegistrationEngine and
//               outlives the router.
// -----------------------------------------------------------------------------
class RequestRouter {
 public:
  RequestRouter(ConnectionPool& pool, RegistrationCoordinator& coordinator,
                const UserRepository& users, const EventRepository& events,
                const RegistrationRepository& registrations);

  RequestRouter(const RequestRouter&) = delete;
  RequestRouter& operator=(const RequestRouter&) = delete;

  // Frame in, frame out. Never throws for bad input; a malformed frame
  // gets a 400 reply.
  std::string handle(const std::string& frame) const;

  // Routes an already decoded request. `body` may be null for methods
  // without a payload.
  Response dispatch(const std::string& method, const std::string& path,
                    const nlohmann::json& body) const;

  static Response toResponse(const RegisterOutcome& outcome);
  static Response toResponse(const CancelOutcome& outcome);

 private:
  Response route(const std::string& method,
                 const std::vector<std::string>& segments,
                 const nlohmann::json& body) const;

  Response createUser(const nlohmann::json& body) const;
  Response getUser(const std::string& id_text) const;
  Response updateUser(const std::string& id_text,
                      const nlohmann::json& body) const;
  Response deleteUser(const std::string& id_text) const;

  Response createEvent(const nlohmann::json& body) const;
  Response getEvent(const std::string& id_text) const;
  Response updateEvent(const std::string& id_text,
                       const nlohmann::json& body) const;
  Response deleteEvent(const std::string& id_text) const;

  Response registerForEvent(const nlohmann::json& body) const;
  Response cancelRegistration(const nlohmann::json& body) const;
  Response getRegistration(const std::string& id_text) const;

  static Response fromStoreError(const StoreError& e);

  ConnectionPool& pool_;
  RegistrationCoordinator& coordinator_;
  const UserRepository& users_;
  const EventRepository& events_;
  const RegistrationRepository& registrations_;
};

}  // namespace rsvp
