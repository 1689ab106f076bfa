#pragma once

#include "rsvp/api/request_router.hpp"
#include "rsvp/config/config.hpp"
#include "rsvp/ledger/seat_ledger.hpp"
#include "rsvp/network/request_server.hpp"
#include "rsvp/registration/registration_coordinator.hpp"
#include "rsvp/repository/event_repository.hpp"
#include "rsvp/repository/registration_repository.hpp"
#include "rsvp/repository/user_repository.hpp"
#include "rsvp/store/connection_pool.hpp"
#include "rsvp/time/i_time_provider.hpp"

#include <memory>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// RegistrationEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the registration server: owns the datastore
//         pool, the seat ledger, the repositories, the coordinator, the
//         request router and the network server.
//
// @details
// main() and the tests use the engine through start()/stop() instead of
// wiring components by hand.
//
// start():
//   1. open the ConnectionPool on config.database_path
//   2. ensureSchema() (WAL mode, tables, indexes; idempotent)
//   3. build RegistrationCoordinator and RequestRouter
//   4. start the RequestServer on config.endpoint, unless it is empty
//
// stop() tears down in reverse. The server goes first so no worker is
// still inside the router when the components it references are
// destroyed.
//
// Thread model:
//   Constructed, started and stopped on the caller's thread. Between
//   start() and stop(), handleRequest() and the coordinator may be used
//   from any thread.
//
// Ownership:
//   RegistrationEngine
//    ├── config_          (Config: value)
//    ├── time_provider_   (const ITimeProvider&: non-owning)
//    ├── ledger_, users_, events_, registrations_   (stateless values)
//    ├── pool_            (unique_ptr<ConnectionPool>)
//    ├── coordinator_     (unique_ptr<RegistrationCoordinator>)
//    ├── router_          (unique_ptr<RequestRouter>)
//    └── server_          (unique_ptr<RequestServer>, only with an endpoint)
//
// Failure: start() throws StoreError if the database cannot be opened or
//          the schema cannot be created, and zmq::error_t if the endpoint
//          cannot be bound. The engine is left stopped in both cases.
// -----------------------------------------------------------------------------
class RegistrationEngine {
 public:
  RegistrationEngine(Config config, const ITimeProvider& time_provider);

  ~RegistrationEngine();

  RegistrationEngine(const RegistrationEngine&) = delete;
  RegistrationEngine& operator=(const RegistrationEngine&) = delete;
  RegistrationEngine(RegistrationEngine&&) = delete;
  RegistrationEngine& operator=(RegistrationEngine&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return running_; }

  // In-process request path, same wire format as the network server.
  // Throws std::logic_error when the engine is not running.
  std::string handleRequest(const std::string& frame) const;

  // Component accessors. Valid only while the engine is running.
  RegistrationCoordinator& coordinator();
  ConnectionPool& connectionPool();

  const SeatLedger& ledger() const { return ledger_; }
  const UserRepository& users() const { return users_; }
  const EventRepository& events() const { return events_; }
  const RegistrationRepository& registrations() const {
    return registrations_;
  }
  const Config& config() const { return config_; }

 private:
  void requireRunning() const;

  Config config_;
  const ITimeProvider& time_provider_;

  SeatLedger ledger_;
  UserRepository users_;
  EventRepository events_;
  RegistrationRepository registrations_;

  std::unique_ptr<ConnectionPool> pool_;
  std::unique_ptr<RegistrationCoordinator> coordinator_;
  std::unique_ptr<RequestRouter> router_;
  std::unique_ptr<RequestServer> server_;

  bool running_{false};
};

}  // namespace rsvp
