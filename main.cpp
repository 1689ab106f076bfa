// -----------------------------------------------------------------------------
// rsvp_server: single executable entry point.
//
//   1) Load the Config: defaults, optional JSON file (argv[1]), RSVP_*
//      environment variables.
//   2) Create the wall clock and the RegistrationEngine, then start it. The
//      engine bootstraps the SQLite schema and binds the ZeroMQ ROUTER
//      endpoint; request-handler threads serve clients from then on.
//   3) Sleep on the main thread until SIGINT or SIGTERM.
//   4) Stop the engine (joins every worker) and exit.
//
// Exit codes: 0 clean shutdown, 1 bad configuration, 2 startup failure.
// -----------------------------------------------------------------------------

#include "rsvp/config/config.hpp"
#include "rsvp/engine/registration_engine.hpp"
#include "rsvp/store/store_error.hpp"
#include "rsvp/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

// Set by the signal handler, polled by main(). The only global in the
// program; a lock-free atomic store is async-signal-safe.
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  rsvp::Config config;
  try {
    config = rsvp::loadConfig(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[main] invalid configuration: " << e.what() << "\n";
    return 1;
  }
  if (config.endpoint.empty()) {
    std::cerr << "[main] invalid configuration: endpoint must not be empty\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Engine
  // -------------------------------------------------------------------------
  rsvp::LiveTimeProvider clock;
  rsvp::RegistrationEngine engine(config, clock);

  try {
    engine.start();
  } catch (const rsvp::StoreError& e) {
    std::cerr << "[main] cannot open database: " << e.what() << "\n";
    return 2;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] cannot bind " << config.endpoint << ": " << e.what()
              << "\n";
    return 2;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  // -------------------------------------------------------------------------
  // 3) Wait for shutdown
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 4) Clean shutdown
  // -------------------------------------------------------------------------
  std::cout << "[main] shutdown requested.\n";
  engine.stop();
  return 0;
}
