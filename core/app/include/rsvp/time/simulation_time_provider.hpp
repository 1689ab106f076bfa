#pragma once

#include "rsvp/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace rsvp {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is whatever the owner last set.
//
// @details
// Tests inject it to get deterministic created_at_ms values on users,
// events and registrations. The clock does not move on its own; it starts
// at the value given to the constructor (0 by default) and changes only
// through advance_time().
//
// Thread model: The value is a std::atomic, so a test thread may call
//               advance_time() while request-handler threads read now_ms().
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's business; tests may move
  // it backwards.
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace rsvp
