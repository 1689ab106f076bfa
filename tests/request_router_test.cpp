// =============================================================================
// request_router_test.cpp
// =============================================================================
// Tests for rsvp::RequestRouter: JSON frames in, status + JSON body out.
//
// Validates:
//   - Every RegisterOutcome / CancelOutcome maps to its status and message
//   - CRUD on users, events and registrations through dispatch()
//   - 400 for malformed JSON, missing fields, bad ids, zero capacity and
//     attempts to change capacity / available_seats
//   - 404 for unknown paths and rows, 405 for unsupported methods
//   - 409 for a taken email and for deleting a user with registrations
//   - handle() wraps everything in {"status", "body"}
// =============================================================================

#include "rsvp/api/request_router.hpp"
#include "rsvp/store/transaction.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using nlohmann::json;
using rsvp::RequestRouter;
using rsvp::Response;

class RequestRouterTest : public rsvp::test::StoreFixture {
 protected:
  RequestRouterTest()
      : router(pool, coordinator, users, events, registrations) {}

  Response call(const std::string& method, const std::string& path,
                const json& body = json()) {
    return router.dispatch(method, path, body);
  }

  std::int64_t createUserId(const std::string& name,
                            const std::string& email,
                            const std::string& role = "attendee") {
    auto r = call("POST", "/api/v1/users",
                  {{"name", name}, {"email", email}, {"role", role}});
    EXPECT_EQ(r.status, 201) << r.body.dump();
    return r.body.value("id", std::int64_t{0});
  }

  std::int64_t createEventId(std::int64_t organizer, int capacity) {
    auto r = call("POST", "/api/v1/events",
                  {{"title", "Meetup"},
                   {"capacity", capacity},
                   {"organizer_id", organizer}});
    EXPECT_EQ(r.status, 201) << r.body.dump();
    return r.body.value("id", std::int64_t{0});
  }

  RequestRouter router;
};

// =============================================================================
// Outcome mapping
// =============================================================================

TEST(RequestRouterOutcomeTest, RegisterOutcomeStatuses) {
  rsvp::domain::Registration reg{7, 1, 2, 99};
  auto created = RequestRouter::toResponse(
      rsvp::RegisterOutcome{rsvp::Registered{reg}});
  EXPECT_EQ(created.status, 201);
  EXPECT_EQ(created.body["id"], 7);
  EXPECT_EQ(created.body["user_id"], 1);
  EXPECT_EQ(created.body["event_id"], 2);

  auto dup = RequestRouter::toResponse(
      rsvp::RegisterOutcome{rsvp::AlreadyRegistered{}});
  EXPECT_EQ(dup.status, 409);
  EXPECT_EQ(dup.body["error"], "user already registered for this event");

  auto full =
      RequestRouter::toResponse(rsvp::RegisterOutcome{rsvp::EventFull{}});
  EXPECT_EQ(full.status, 409);
  EXPECT_EQ(full.body["error"], "event is full");

  auto no_event =
      RequestRouter::toResponse(rsvp::RegisterOutcome{rsvp::EventNotFound{}});
  EXPECT_EQ(no_event.status, 404);
  EXPECT_EQ(no_event.body["error"], "event not found");

  auto no_user =
      RequestRouter::toResponse(rsvp::RegisterOutcome{rsvp::UserNotFound{}});
  EXPECT_EQ(no_user.status, 404);
  EXPECT_EQ(no_user.body["error"], "user not found");

  auto transient = RequestRouter::toResponse(
      rsvp::RegisterOutcome{rsvp::TransientFailure{"database is locked"}});
  EXPECT_EQ(transient.status, 503);
  EXPECT_NE(transient.body["error"].get<std::string>().find("retry"),
            std::string::npos);
}

TEST(RequestRouterOutcomeTest, CancelOutcomeStatuses) {
  auto cancelled =
      RequestRouter::toResponse(rsvp::CancelOutcome{rsvp::Cancelled{}});
  EXPECT_EQ(cancelled.status, 200);
  EXPECT_EQ(cancelled.body["message"], "registration cancelled successfully");

  auto absent =
      RequestRouter::toResponse(rsvp::CancelOutcome{rsvp::NotRegistered{}});
  EXPECT_EQ(absent.status, 200);
  EXPECT_EQ(absent.body["message"], "no registration to cancel");

  auto transient = RequestRouter::toResponse(
      rsvp::CancelOutcome{rsvp::TransientFailure{"busy"}});
  EXPECT_EQ(transient.status, 503);
}

// =============================================================================
// Service routes
// =============================================================================

TEST_F(RequestRouterTest, InfoAndHealth) {
  auto info = call("GET", "/");
  EXPECT_EQ(info.status, 200);
  EXPECT_TRUE(info.body.contains("endpoints"));

  auto health = call("GET", "/health");
  EXPECT_EQ(health.status, 200);
  EXPECT_EQ(health.body["status"], "ok");

  EXPECT_EQ(call("POST", "/health").status, 405);
}

TEST_F(RequestRouterTest, UnknownPathAndMethod) {
  EXPECT_EQ(call("GET", "/api/v2/users").status, 404);
  EXPECT_EQ(call("GET", "/api/v1/tickets").status, 404);
  EXPECT_EQ(call("GET", "/api/v1/users/1/extra/more").status, 404);
  EXPECT_EQ(call("PATCH", "/api/v1/users/1").status, 405);
  EXPECT_EQ(call("GET", "/api/v1/users").status, 405);
  EXPECT_EQ(call("PUT", "/api/v1/registrations").status, 405);
  EXPECT_EQ(call("DELETE", "/api/v1/registrations/1").status, 405);
}

// =============================================================================
// Users
// =============================================================================

TEST_F(RequestRouterTest, UserLifecycle) {
  auto id = createUserId("Ada", "ada@example.com", "organizer");
  ASSERT_GT(id, 0);

  auto fetched = call("GET", "/api/v1/users/" + std::to_string(id));
  EXPECT_EQ(fetched.status, 200);
  EXPECT_EQ(fetched.body["email"], "ada@example.com");
  EXPECT_EQ(fetched.body["role"], "organizer");

  auto updated = call("PUT", "/api/v1/users/" + std::to_string(id),
                      {{"name", "Ada L."}});
  EXPECT_EQ(updated.status, 200);
  EXPECT_EQ(updated.body["name"], "Ada L.");
  EXPECT_EQ(updated.body["email"], "ada@example.com");

  auto removed = call("DELETE", "/api/v1/users/" + std::to_string(id));
  EXPECT_EQ(removed.status, 200);
  EXPECT_EQ(removed.body["message"], "user deleted successfully");
  EXPECT_EQ(call("GET", "/api/v1/users/" + std::to_string(id)).status, 404);
  EXPECT_EQ(call("DELETE", "/api/v1/users/" + std::to_string(id)).status,
            404);
}

TEST_F(RequestRouterTest, UserDefaultsToAttendee) {
  auto r = call("POST", "/api/v1/users",
                {{"name", "Bo"}, {"email", "bo@example.com"}});
  EXPECT_EQ(r.status, 201);
  EXPECT_EQ(r.body["role"], "attendee");
}

TEST_F(RequestRouterTest, UserValidation) {
  EXPECT_EQ(call("POST", "/api/v1/users", {{"email", "x@example.com"}}).status,
            400);
  EXPECT_EQ(call("POST", "/api/v1/users",
                 {{"name", ""}, {"email", "x@example.com"}})
                .status,
            400);
  EXPECT_EQ(call("POST", "/api/v1/users",
                 {{"name", "X"}, {"email", "x@example.com"}, {"role", "admin"}})
                .status,
            400);
  EXPECT_EQ(call("POST", "/api/v1/users", json::array()).status, 400);
  EXPECT_EQ(call("POST", "/api/v1/users").status, 400);

  auto bad_id = call("GET", "/api/v1/users/abc");
  EXPECT_EQ(bad_id.status, 400);
  EXPECT_EQ(bad_id.body["error"], "invalid user ID");
  EXPECT_EQ(call("GET", "/api/v1/users/0").status, 400);
  EXPECT_EQ(call("GET", "/api/v1/users/-3").status, 400);
}

TEST_F(RequestRouterTest, DuplicateEmailIsConflict) {
  createUserId("First", "same@example.com");
  auto second = call("POST", "/api/v1/users",
                     {{"name", "Second"}, {"email", "same@example.com"}});
  EXPECT_EQ(second.status, 409);
  EXPECT_EQ(second.body["error"], "email already in use");

  auto other = createUserId("Other", "other@example.com");
  auto taken = call("PUT", "/api/v1/users/" + std::to_string(other),
                    {{"email", "same@example.com"}});
  EXPECT_EQ(taken.status, 409);
}

TEST_F(RequestRouterTest, DeleteUserWithRegistrationIsConflict) {
  auto organizer = createUserId("Org", "org@example.com", "organizer");
  auto attendee = createUserId("Att", "att@example.com");
  auto event = createEventId(organizer, 3);
  ASSERT_EQ(call("POST", "/api/v1/registrations",
                 {{"user_id", attendee}, {"event_id", event}})
                .status,
            201);

  auto blocked = call("DELETE", "/api/v1/users/" + std::to_string(attendee));
  EXPECT_EQ(blocked.status, 409);
  EXPECT_EQ(blocked.body["error"],
            "user still has registrations or organized events");
  EXPECT_EQ(call("DELETE", "/api/v1/users/" + std::to_string(organizer)).status,
            409);
}

// =============================================================================
// Events
// =============================================================================

TEST_F(RequestRouterTest, EventLifecycle) {
  auto organizer = createUserId("Org", "org@example.com", "organizer");
  auto id = createEventId(organizer, 12);
  ASSERT_GT(id, 0);

  auto fetched = call("GET", "/api/v1/events/" + std::to_string(id));
  EXPECT_EQ(fetched.status, 200);
  EXPECT_EQ(fetched.body["capacity"], 12);
  EXPECT_EQ(fetched.body["available_seats"], 12);
  EXPECT_EQ(fetched.body["organizer_id"], organizer);

  auto renamed = call("PUT", "/api/v1/events/" + std::to_string(id),
                      {{"title", "Renamed"}});
  EXPECT_EQ(renamed.status, 200);
  EXPECT_EQ(renamed.body["title"], "Renamed");
  EXPECT_EQ(renamed.body["available_seats"], 12);

  EXPECT_EQ(call("DELETE", "/api/v1/events/" + std::to_string(id)).status,
            200);
  EXPECT_EQ(call("GET", "/api/v1/events/" + std::to_string(id)).status, 404);
}

TEST_F(RequestRouterTest, EventValidation) {
  auto organizer = createUserId("Org", "org@example.com", "organizer");

  auto zero = call("POST", "/api/v1/events",
                   {{"title", "T"}, {"capacity", 0}, {"organizer_id", organizer}});
  EXPECT_EQ(zero.status, 400);
  EXPECT_EQ(zero.body["error"], "capacity must be greater than 0");

  EXPECT_EQ(call("POST", "/api/v1/events",
                 {{"title", "T"}, {"capacity", "ten"},
                  {"organizer_id", organizer}})
                .status,
            400);

  auto orphan = call("POST", "/api/v1/events",
                     {{"title", "T"}, {"capacity", 5}, {"organizer_id", 9999}});
  EXPECT_EQ(orphan.status, 404);
  EXPECT_EQ(orphan.body["error"], "organizer not found");

  auto id = createEventId(organizer, 5);
  auto path = "/api/v1/events/" + std::to_string(id);
  EXPECT_EQ(call("PUT", path, {{"title", "T"}, {"capacity", 50}}).status, 400);
  EXPECT_EQ(call("PUT", path, {{"available_seats", 50}}).status, 400);
  EXPECT_EQ(reload(id).capacity, 5);
  EXPECT_EQ(call("PUT", "/api/v1/events/9999", {{"title", "T"}}).status, 404);
  EXPECT_EQ(call("GET", "/api/v1/events/x1").body["error"],
            "invalid event ID");
}

// =============================================================================
// Registrations
// =============================================================================

TEST_F(RequestRouterTest, RegisterCancelFlow) {
  auto organizer = createUserId("Org", "org@example.com", "organizer");
  auto alice = createUserId("Alice", "alice@example.com");
  auto bob = createUserId("Bob", "bob@example.com");
  auto event = createEventId(organizer, 1);
  json alice_body = {{"user_id", alice}, {"event_id", event}};
  json bob_body = {{"user_id", bob}, {"event_id", event}};

  auto registered = call("POST", "/api/v1/registrations", alice_body);
  ASSERT_EQ(registered.status, 201);
  auto registration_id = registered.body["id"].get<std::int64_t>();

  auto fetched =
      call("GET", "/api/v1/registrations/" + std::to_string(registration_id));
  EXPECT_EQ(fetched.status, 200);
  EXPECT_EQ(fetched.body["user_id"], alice);

  EXPECT_EQ(call("POST", "/api/v1/registrations", alice_body).status, 409);
  auto full = call("POST", "/api/v1/registrations", bob_body);
  EXPECT_EQ(full.status, 409);
  EXPECT_EQ(full.body["error"], "event is full");

  auto cancelled = call("DELETE", "/api/v1/registrations", alice_body);
  EXPECT_EQ(cancelled.status, 200);
  EXPECT_EQ(cancelled.body["message"], "registration cancelled successfully");
  auto again = call("DELETE", "/api/v1/registrations", alice_body);
  EXPECT_EQ(again.status, 200);
  EXPECT_EQ(again.body["message"], "no registration to cancel");

  EXPECT_EQ(call("POST", "/api/v1/registrations", bob_body).status, 201);
  expectLedgerConsistent(event);
}

TEST_F(RequestRouterTest, RegistrationValidation) {
  EXPECT_EQ(call("POST", "/api/v1/registrations", {{"user_id", 1}}).status,
            400);
  EXPECT_EQ(call("POST", "/api/v1/registrations",
                 {{"user_id", "1"}, {"event_id", 1}})
                .status,
            400);
  EXPECT_EQ(call("POST", "/api/v1/registrations",
                 {{"user_id", 0}, {"event_id", 1}})
                .status,
            400);
  EXPECT_EQ(call("POST", "/api/v1/registrations",
                 {{"user_id", 9999}, {"event_id", 1}})
                .body["error"],
            "user not found");
  EXPECT_EQ(call("GET", "/api/v1/registrations/9999").status, 404);
}

TEST_F(RequestRouterTest, LockTimeoutIsServiceUnavailable) {
  auto organizer = createUserId("Org", "org@example.com", "organizer");
  auto attendee = createUserId("Att", "att@example.com");
  auto event = createEventId(organizer, 2);

  rsvp::ConnectionPool short_pool(db.path(), 50);
  rsvp::RegistrationCoordinator impatient(short_pool, ledger, users,
                                          registrations);
  RequestRouter impatient_router(short_pool, impatient, users, events,
                                 registrations);

  rsvp::Connection holder(db.path(), 1000);
  rsvp::Transaction lock(holder, rsvp::Transaction::Mode::Immediate);
  auto r = impatient_router.dispatch(
      "POST", "/api/v1/registrations",
      {{"user_id", attendee}, {"event_id", event}});
  EXPECT_EQ(r.status, 503);
  lock.rollback();
  EXPECT_EQ(reload(event).available_seats, 2);
}

// =============================================================================
// Framing
// =============================================================================

TEST_F(RequestRouterTest, HandleWrapsStatusAndBody) {
  auto reply = json::parse(router.handle(
      R"({"method": "GET", "path": "/health"})"));
  EXPECT_EQ(reply["status"], 200);
  EXPECT_EQ(reply["body"]["status"], "ok");

  auto created = json::parse(router.handle(
      R"({"method": "POST", "path": "/api/v1/users",
          "body": {"name": "Cy", "email": "cy@example.com"}})"));
  EXPECT_EQ(created["status"], 201);
  EXPECT_EQ(created["body"]["name"], "Cy");
}

TEST_F(RequestRouterTest, HandleRejectsMalformedFrames) {
  auto garbage = json::parse(router.handle("{not json"));
  EXPECT_EQ(garbage["status"], 400);
  EXPECT_EQ(garbage["body"]["error"], "malformed JSON request");

  EXPECT_EQ(json::parse(router.handle("[1, 2]"))["status"], 400);
  EXPECT_EQ(json::parse(router.handle(R"({"method": 5, "path": "/"})"))
                ["status"],
            400);
  EXPECT_EQ(json::parse(router.handle(R"({"path": "/health"})"))["status"],
            405);
}
