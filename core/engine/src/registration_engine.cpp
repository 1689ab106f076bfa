#include "rsvp/engine/registration_engine.hpp"
#include "rsvp/store/schema.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace rsvp {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RegistrationEngine::RegistrationEngine(Config config,
                                       const ITimeProvider& time_provider)
    : config_(std::move(config)),
      time_provider_(time_provider),
      users_(time_provider_),
      events_(time_provider_),
      registrations_(time_provider_) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
RegistrationEngine::~RegistrationEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void RegistrationEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Datastore ---------------------------------------------------------
  pool_ = std::make_unique<ConnectionPool>(config_.database_path,
                                           config_.lock_timeout_ms);
  try {
    auto connection = pool_->acquire();
    ensureSchema(*connection);
  } catch (const StoreError&) {
    pool_.reset();
    throw;
  }

  // ---  2) Core and request routing ------------------------------------------
  coordinator_ = std::make_unique<RegistrationCoordinator>(
      *pool_, ledger_, users_, registrations_);
  router_ = std::make_unique<RequestRouter>(*pool_, *coordinator_, users_,
                                            events_, registrations_);

  // ---  3) Network server (skipped when no endpoint is configured) -----------
  if (!config_.endpoint.empty()) {
    server_ = std::make_unique<RequestServer>(
        [this](const std::string& frame) { return router_->handle(frame); },
        config_.endpoint, config_.worker_threads);
    try {
      server_->start();
    } catch (const zmq::error_t&) {
      server_.reset();
      router_.reset();
      coordinator_.reset();
      pool_.reset();
      throw;
    }
  }

  running_ = true;

  std::cout << "[RegistrationEngine] started. database="
            << config_.database_path << " lock_timeout_ms="
            << config_.lock_timeout_ms
            << (server_ ? " endpoint=" + config_.endpoint
                        : std::string(" (no network server)"))
            << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void RegistrationEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop accepting requests; joins every worker -----------------------
  server_.reset();

  // ---  2) Components that borrow the pool ------------------------------------
  router_.reset();
  coordinator_.reset();

  // ---  3) Close every idle connection ----------------------------------------
  pool_.reset();

  running_ = false;

  std::cout << "[RegistrationEngine] stopped.\n";
}

std::string RegistrationEngine::handleRequest(const std::string& frame) const {
  requireRunning();
  return router_->handle(frame);
}

RegistrationCoordinator& RegistrationEngine::coordinator() {
  requireRunning();
  return *coordinator_;
}

ConnectionPool& RegistrationEngine::connectionPool() {
  requireRunning();
  return *pool_;
}

void RegistrationEngine::requireRunning() const {
  if (!running_) {
    throw std::logic_error("RegistrationEngine is not running");
  }
}

}  // namespace rsvp
