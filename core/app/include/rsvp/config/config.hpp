#pragma once

#include <cstddef>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// Config: startup settings of the registration server
// -----------------------------------------------------------------------------
//
// Sources, later ones win:
//   1. the defaults below
//   2. a JSON file (first command-line argument), e.g.
//        {"database_path": "/var/lib/rsvp/rsvp.db",
//         "endpoint": "tcp://0.0.0.0:5560",
//         "worker_threads": 16,
//         "lock_timeout_ms": 5000}
//      Unknown keys are ignored.
//   3. environment variables RSVP_DB_PATH, RSVP_ENDPOINT, RSVP_WORKERS,
//      RSVP_LOCK_TIMEOUT_MS
//
// An empty endpoint means "no network server"; the engine is then driven
// in-process only (tests do this).
//
// Invalid values throw std::invalid_argument; a file that cannot be read
// or parsed throws std::runtime_error.
// -----------------------------------------------------------------------------
struct Config {
  std::string database_path{"rsvp.db"};
  std::string endpoint{"tcp://127.0.0.1:5560"};
  std::size_t worker_threads{16};
  // SQLite busy timeout: upper bound on any wait for the database lock.
  int lock_timeout_ms{5000};
};

// Overlays the keys present in the JSON file at `path` onto `config`.
void applyJsonFile(Config& config, const std::string& path);

// Overlays the RSVP_* environment variables that are set onto `config`.
void applyEnvironment(Config& config);

// Rejects an empty or in-memory database_path, worker_threads outside
// [1, 1024] and a negative lock_timeout_ms.
void validate(const Config& config);

// Defaults, then argv[1] if given, then the environment; validated.
Config loadConfig(int argc, char** argv);

}  // namespace rsvp
