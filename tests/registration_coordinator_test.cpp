// =============================================================================
// registration_coordinator_test.cpp
// =============================================================================
// Tests for rsvp::RegistrationCoordinator, the seat-reservation transaction.
//
// Validates:
//   - 50 concurrent registrations for 10 seats: exactly 10 Registered,
//     40 EventFull, available_seats ends at 0
//   - N concurrent registrations for capacity C admit exactly C
//   - Duplicate registration (sequential and concurrent) charges one seat
//   - cancel() then register again; cancel() when never registered
//   - UserNotFound / EventNotFound / EventFull outcomes
//   - Lock wait beyond the busy timeout yields TransientFailure with no
//     state change
//   - A user deleted after the existence check yields UserNotFound
//   - capacity - available_seats == live registrations after a mixed
//     concurrent register/cancel storm
//
// Threading model: concurrency tests release all threads together from a
// start gate so the attempts really overlap on the SQLite write lock. All
// threads are joined before assertions.
// =============================================================================

#include "rsvp/registration/outcome.hpp"
#include "rsvp/registration/registration_coordinator.hpp"
#include "rsvp/store/transaction.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using rsvp::RegisterOutcome;
using rsvp::domain::User;

namespace {

// Spins until the gate opens so every worker starts at the same moment.
void waitAtGate(const std::atomic<bool>& gate) {
  while (!gate.load()) {
    std::this_thread::yield();
  }
}

struct OutcomeTally {
  std::atomic<int> registered{0};
  std::atomic<int> already_registered{0};
  std::atomic<int> event_full{0};
  std::atomic<int> other{0};

  void count(const RegisterOutcome& outcome) {
    if (std::holds_alternative<rsvp::Registered>(outcome)) {
      registered.fetch_add(1);
    } else if (std::holds_alternative<rsvp::AlreadyRegistered>(outcome)) {
      already_registered.fetch_add(1);
    } else if (std::holds_alternative<rsvp::EventFull>(outcome)) {
      event_full.fetch_add(1);
    } else {
      other.fetch_add(1);
    }
  }
};

}  // namespace

class RegistrationCoordinatorTest : public rsvp::test::StoreFixture {
 protected:
  std::vector<User> makeUsers(int count) {
    std::vector<User> result;
    result.reserve(count);
    for (int i = 0; i < count; ++i) {
      result.push_back(makeUser("attendee" + std::to_string(i)));
    }
    return result;
  }

  // One thread per user, all registering for `event_id` at once.
  void registerConcurrently(const std::vector<User>& attendees,
                            rsvp::domain::EventId event_id,
                            OutcomeTally& tally) {
    std::atomic<bool> gate{false};
    std::vector<std::thread> threads;
    for (const auto& attendee : attendees) {
      threads.emplace_back([&, user_id = attendee.id] {
        waitAtGate(gate);
        tally.count(coordinator.registerUser(user_id, event_id));
      });
    }
    gate.store(true);
    for (auto& t : threads) t.join();
  }
};

// -----------------------------------------------------------------------------
// 1. capacity=10, 50 distinct users registering at once.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, FiftyConcurrentRegistrationsForTenSeats) {
  auto event = makeEvent(10);
  auto attendees = makeUsers(50);

  OutcomeTally tally;
  registerConcurrently(attendees, event.id, tally);

  EXPECT_EQ(tally.registered.load(), 10);
  EXPECT_EQ(tally.event_full.load(), 40);
  EXPECT_EQ(tally.already_registered.load(), 0);
  EXPECT_EQ(tally.other.load(), 0);
  EXPECT_EQ(reload(event.id).available_seats, 0);
  EXPECT_EQ(registrationCount(event.id), 10);
  expectLedgerConsistent(event.id);
}

// -----------------------------------------------------------------------------
// 2. N > C concurrent attempts admit exactly C, for several shapes.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, AdmitsExactlyCapacityUnderContention) {
  struct Shape {
    int capacity;
    int attempts;
  };
  const Shape shapes[] = {{1, 8}, {3, 12}, {7, 16}};

  int user_offset = 0;
  for (const auto& shape : shapes) {
    auto event = makeEvent(shape.capacity);
    std::vector<User> attendees;
    for (int i = 0; i < shape.attempts; ++i) {
      attendees.push_back(makeUser("shape" + std::to_string(user_offset++)));
    }

    OutcomeTally tally;
    registerConcurrently(attendees, event.id, tally);

    EXPECT_EQ(tally.registered.load(), shape.capacity)
        << "capacity " << shape.capacity;
    EXPECT_EQ(tally.event_full.load(), shape.attempts - shape.capacity);
    EXPECT_EQ(tally.other.load(), 0);
    expectLedgerConsistent(event.id);
  }
}

// -----------------------------------------------------------------------------
// 3. Registering twice: Registered then AlreadyRegistered, one seat taken.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, DuplicateRegistrationChargesOneSeat) {
  auto event = makeEvent(5);
  auto attendee = makeUser("u1");

  auto first = coordinator.registerUser(attendee.id, event.id);
  auto second = coordinator.registerUser(attendee.id, event.id);

  EXPECT_TRUE(std::holds_alternative<rsvp::Registered>(first));
  EXPECT_TRUE(std::holds_alternative<rsvp::AlreadyRegistered>(second));
  EXPECT_EQ(reload(event.id).available_seats, 4);
  expectLedgerConsistent(event.id);
}

// -----------------------------------------------------------------------------
// 4. The same user racing against themselves on many threads.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, ConcurrentDuplicateRegistration) {
  auto event = makeEvent(5);
  auto attendee = makeUser("racer");
  std::vector<User> same_user(10, attendee);

  OutcomeTally tally;
  registerConcurrently(same_user, event.id, tally);

  EXPECT_EQ(tally.registered.load(), 1);
  EXPECT_EQ(tally.already_registered.load(), 9);
  EXPECT_EQ(tally.other.load(), 0);
  EXPECT_EQ(reload(event.id).available_seats, 4);
  expectLedgerConsistent(event.id);
}

// -----------------------------------------------------------------------------
// 5. Registered carries the stored row built inside the transaction.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, RegisteredCarriesStoredRegistration) {
  auto event = makeEvent(3);
  auto attendee = makeUser("stamp");
  clock.advance_time(rsvp::test::kStartTimeMs + 1234);

  auto outcome = coordinator.registerUser(attendee.id, event.id);
  auto* registered = std::get_if<rsvp::Registered>(&outcome);
  ASSERT_NE(registered, nullptr);
  EXPECT_EQ(registered->registration.user_id, attendee.id);
  EXPECT_EQ(registered->registration.event_id, event.id);
  EXPECT_EQ(registered->registration.created_at_ms,
            rsvp::test::kStartTimeMs + 1234);

  auto connection = pool.acquire();
  auto stored = registrations.find(*connection, registered->registration.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->user_id, attendee.id);
  EXPECT_EQ(stored->created_at_ms, rsvp::test::kStartTimeMs + 1234);
}

// -----------------------------------------------------------------------------
// 6. Cancel then register again restores and retakes the seat.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, CancelThenRegisterAgain) {
  auto event = makeEvent(2);
  auto attendee = makeUser("returning");

  ASSERT_TRUE(std::holds_alternative<rsvp::Registered>(
      coordinator.registerUser(attendee.id, event.id)));
  EXPECT_EQ(reload(event.id).available_seats, 1);

  EXPECT_TRUE(std::holds_alternative<rsvp::Cancelled>(
      coordinator.cancel(attendee.id, event.id)));
  EXPECT_EQ(reload(event.id).available_seats, 2);
  EXPECT_EQ(registrationCount(event.id), 0);

  EXPECT_TRUE(std::holds_alternative<rsvp::Registered>(
      coordinator.registerUser(attendee.id, event.id)));
  EXPECT_EQ(reload(event.id).available_seats, 1);
  expectLedgerConsistent(event.id);
}

// -----------------------------------------------------------------------------
// 7. Cancelling something never registered is a harmless no-op; repeated
//    cancels never inflate the counter.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, CancelWhenNeverRegistered) {
  auto event = makeEvent(3);
  auto attendee = makeUser("stranger");

  EXPECT_TRUE(std::holds_alternative<rsvp::NotRegistered>(
      coordinator.cancel(attendee.id, event.id)));
  EXPECT_EQ(reload(event.id).available_seats, 3);

  ASSERT_TRUE(std::holds_alternative<rsvp::Registered>(
      coordinator.registerUser(attendee.id, event.id)));
  EXPECT_TRUE(std::holds_alternative<rsvp::Cancelled>(
      coordinator.cancel(attendee.id, event.id)));
  EXPECT_TRUE(std::holds_alternative<rsvp::NotRegistered>(
      coordinator.cancel(attendee.id, event.id)));
  EXPECT_EQ(reload(event.id).available_seats, 3);
  expectLedgerConsistent(event.id);

  // Unknown event: still just NotRegistered.
  EXPECT_TRUE(std::holds_alternative<rsvp::NotRegistered>(
      coordinator.cancel(attendee.id, 99999)));
}

// -----------------------------------------------------------------------------
// 8. Missing user or event.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, UserAndEventNotFound) {
  auto event = makeEvent(3);
  auto attendee = makeUser("lost");

  EXPECT_TRUE(std::holds_alternative<rsvp::UserNotFound>(
      coordinator.registerUser(99999, event.id)));
  EXPECT_TRUE(std::holds_alternative<rsvp::EventNotFound>(
      coordinator.registerUser(attendee.id, 99999)));
  EXPECT_EQ(reload(event.id).available_seats, 3);
}

// -----------------------------------------------------------------------------
// 9. A full event rejects newcomers; an existing registrant is told they
//    are already registered rather than that the event is full.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, FullEventRejectsNewcomers) {
  auto event = makeEvent(1);
  auto first = makeUser("first");
  auto late = makeUser("late");

  ASSERT_TRUE(std::holds_alternative<rsvp::Registered>(
      coordinator.registerUser(first.id, event.id)));
  EXPECT_TRUE(std::holds_alternative<rsvp::EventFull>(
      coordinator.registerUser(late.id, event.id)));
  EXPECT_TRUE(std::holds_alternative<rsvp::AlreadyRegistered>(
      coordinator.registerUser(first.id, event.id)));
  EXPECT_EQ(reload(event.id).available_seats, 0);
  expectLedgerConsistent(event.id);
}

// -----------------------------------------------------------------------------
// 10. Another connection holds the write lock past the busy timeout: the
//     attempt fails as TransientFailure and leaves nothing behind.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, LockTimeoutIsTransientFailure) {
  auto event = makeEvent(2);
  auto attendee = makeUser("impatient");

  rsvp::ConnectionPool short_pool(db.path(), 50);
  rsvp::RegistrationCoordinator impatient(short_pool, ledger, users,
                                          registrations);

  {
    rsvp::Connection holder(db.path(), 1000);
    rsvp::Transaction lock(holder, rsvp::Transaction::Mode::Immediate);

    auto outcome = impatient.registerUser(attendee.id, event.id);
    auto* failure = std::get_if<rsvp::TransientFailure>(&outcome);
    ASSERT_NE(failure, nullptr) << rsvp::outcomeName(outcome);
    EXPECT_FALSE(failure->reason.empty());

    EXPECT_TRUE(std::holds_alternative<rsvp::TransientFailure>(
        impatient.cancel(attendee.id, event.id)));
    // `lock` rolls back here.
  }

  EXPECT_EQ(reload(event.id).available_seats, 2);
  EXPECT_EQ(registrationCount(event.id), 0);

  // Retrying the whole operation after the lock is gone succeeds.
  EXPECT_TRUE(std::holds_alternative<rsvp::Registered>(
      impatient.registerUser(attendee.id, event.id)));
  expectLedgerConsistent(event.id);
}

// -----------------------------------------------------------------------------
// 10b. The user is deleted while the attempt waits for the write lock: the
//      existence check already passed, the insert then fails on the foreign
//      key, and the attempt reports UserNotFound with nothing charged.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, UserDeletedBeforeInsertIsUserNotFound) {
  auto event = makeEvent(2);
  auto doomed = makeUser("doomed");

  rsvp::Connection holder(db.path(), 1000);
  rsvp::Transaction lock(holder, rsvp::Transaction::Mode::Immediate);

  RegisterOutcome outcome{rsvp::TransientFailure{"not run"}};
  std::thread attempt(
      [&] { outcome = coordinator.registerUser(doomed.id, event.id); });

  // The existence check is a plain read and does not wait for the lock;
  // give it time to pass before the user disappears.
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  holder.exec("DELETE FROM users WHERE id = " + std::to_string(doomed.id));
  lock.commit();
  attempt.join();

  EXPECT_TRUE(std::holds_alternative<rsvp::UserNotFound>(outcome))
      << rsvp::outcomeName(outcome);
  EXPECT_EQ(reload(event.id).available_seats, 2);
  EXPECT_EQ(registrationCount(event.id), 0);
}

// -----------------------------------------------------------------------------
// 11. Mixed register/cancel storm keeps the ledger consistent.
// -----------------------------------------------------------------------------
TEST_F(RegistrationCoordinatorTest, MixedRegisterAndCancelKeepInvariant) {
  constexpr int kCapacity = 4;
  constexpr int kUsers = 12;
  constexpr int kRounds = 6;
  auto event = makeEvent(kCapacity);
  auto attendees = makeUsers(kUsers);

  std::atomic<bool> gate{false};
  std::atomic<int> transient{0};
  std::vector<std::thread> threads;
  for (const auto& attendee : attendees) {
    threads.emplace_back([&, user_id = attendee.id] {
      waitAtGate(gate);
      for (int round = 0; round < kRounds; ++round) {
        auto reg = coordinator.registerUser(user_id, event.id);
        if (std::holds_alternative<rsvp::TransientFailure>(reg)) {
          transient.fetch_add(1);
        }
        if (round % 2 == 0) {
          auto cancelled = coordinator.cancel(user_id, event.id);
          if (std::holds_alternative<rsvp::TransientFailure>(cancelled)) {
            transient.fetch_add(1);
          }
        }
      }
    });
  }
  gate.store(true);
  for (auto& t : threads) t.join();

  EXPECT_EQ(transient.load(), 0);
  expectLedgerConsistent(event.id);
  EXPECT_LE(registrationCount(event.id), kCapacity);
}

TEST(OutcomeNameTest, NamesEveryAlternative) {
  EXPECT_STREQ(rsvp::outcomeName(RegisterOutcome{rsvp::Registered{}}),
               "REGISTERED");
  EXPECT_STREQ(rsvp::outcomeName(RegisterOutcome{rsvp::EventFull{}}),
               "EVENT_FULL");
  EXPECT_STREQ(rsvp::outcomeName(RegisterOutcome{rsvp::UserNotFound{}}),
               "USER_NOT_FOUND");
  EXPECT_STREQ(
      rsvp::outcomeName(rsvp::CancelOutcome{rsvp::NotRegistered{}}),
      "NOT_REGISTERED");
  EXPECT_STREQ(
      rsvp::outcomeName(rsvp::CancelOutcome{rsvp::TransientFailure{"x"}}),
      "TRANSIENT_FAILURE");
}
