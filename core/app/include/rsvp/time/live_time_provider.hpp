#pragma once

#include "rsvp/time/i_time_provider.hpp"

namespace rsvp {

// -----------------------------------------------------------------------------
// LiveTimeProvider
// -----------------------------------------------------------------------------
// Wall-clock ITimeProvider backed by std::chrono::system_clock. Stateless,
// so one instance can be shared by all request-handler threads. main()
// owns the instance used by the server.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace rsvp
