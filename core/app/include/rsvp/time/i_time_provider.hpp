#pragma once

#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// ITimeProvider: source of creation timestamps
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" for every component that stamps a row with
//         created_at_ms.
//
// @details
// The repositories receive a `const ITimeProvider&` (through
// RegistrationEngine) and never call std::chrono directly:
//   - LiveTimeProvider       wall clock, used by the server binary.
//   - SimulationTimeProvider value set by the caller, used by tests that
//                            assert on stored timestamps.
//
// Timestamps are int64 milliseconds since the Unix epoch. That is what the
// schema stores and what the JSON responses carry.
//
// Thread-safety: Implementations must allow concurrent now_ms() calls from
//                every request-handler thread.
// Ownership:     Borrowed. The provider must outlive the RegistrationEngine
//                (and everything it builds) that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time in epoch milliseconds. No side effects.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace rsvp
