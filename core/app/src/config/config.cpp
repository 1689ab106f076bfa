#include "rsvp/config/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace rsvp {

namespace {

constexpr std::size_t kMaxWorkerThreads = 1024;

long long parseInteger(const char* name, const std::string& text) {
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::logic_error&) {
    // std::stoll reports both bad syntax and overflow as logic_error
    // subclasses.
    consumed = 0;
  }
  if (consumed == 0 || consumed != text.size()) {
    throw std::invalid_argument(std::string(name) +
                                ": not an integer: '" + text + "'");
  }
  return value;
}

std::size_t toWorkerCount(const char* name, long long value) {
  if (value < 1 || static_cast<unsigned long long>(value) > kMaxWorkerThreads) {
    throw std::invalid_argument(std::string(name) + ": must be in [1, " +
                                std::to_string(kMaxWorkerThreads) + "]");
  }
  return static_cast<std::size_t>(value);
}

int toLockTimeout(const char* name, long long value) {
  if (value < 0 || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(std::string(name) +
                                ": must be a non-negative millisecond count");
  }
  return static_cast<int>(value);
}

// ":memory:", and URI forms such as "file::memory:" or "file:x?mode=memory".
bool isInMemoryPath(const std::string& path) {
  return path == ":memory:" || path.rfind("file::memory:", 0) == 0 ||
         (path.rfind("file:", 0) == 0 &&
          path.find("mode=memory") != std::string::npos);
}

}  // namespace

// -----------------------------------------------------------------------------
// applyJsonFile()
// -----------------------------------------------------------------------------
void applyJsonFile(Config& config, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file '" + path + "'");
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("config file '" + path + "': " + e.what());
  }
  if (!j.is_object()) {
    throw std::invalid_argument("config file '" + path +
                                "': top level must be an object");
  }

  try {
    if (j.contains("database_path")) {
      config.database_path = j["database_path"].get<std::string>();
    }
    if (j.contains("endpoint")) {
      config.endpoint = j["endpoint"].get<std::string>();
    }
    if (j.contains("worker_threads")) {
      config.worker_threads = toWorkerCount(
          "worker_threads", j["worker_threads"].get<long long>());
    }
    if (j.contains("lock_timeout_ms")) {
      config.lock_timeout_ms = toLockTimeout(
          "lock_timeout_ms", j["lock_timeout_ms"].get<long long>());
    }
  } catch (const nlohmann::json::type_error& e) {
    throw std::invalid_argument("config file '" + path + "': " + e.what());
  }
}

// -----------------------------------------------------------------------------
// applyEnvironment()
// -----------------------------------------------------------------------------
void applyEnvironment(Config& config) {
  if (const char* value = std::getenv("RSVP_DB_PATH")) {
    config.database_path = value;
  }
  if (const char* value = std::getenv("RSVP_ENDPOINT")) {
    config.endpoint = value;
  }
  if (const char* value = std::getenv("RSVP_WORKERS")) {
    config.worker_threads = toWorkerCount(
        "RSVP_WORKERS", parseInteger("RSVP_WORKERS", value));
  }
  if (const char* value = std::getenv("RSVP_LOCK_TIMEOUT_MS")) {
    config.lock_timeout_ms = toLockTimeout(
        "RSVP_LOCK_TIMEOUT_MS", parseInteger("RSVP_LOCK_TIMEOUT_MS", value));
  }
}

void validate(const Config& config) {
  if (config.database_path.empty()) {
    throw std::invalid_argument("database_path must not be empty");
  }
  // Each pooled connection would open its own private, empty database.
  if (isInMemoryPath(config.database_path)) {
    throw std::invalid_argument("database_path must name a file, not '" +
                                config.database_path + "'");
  }
  toWorkerCount("worker_threads",
                static_cast<long long>(config.worker_threads));
  toLockTimeout("lock_timeout_ms", config.lock_timeout_ms);
}

Config loadConfig(int argc, char** argv) {
  Config config;
  if (argc > 1) {
    applyJsonFile(config, argv[1]);
  }
  applyEnvironment(config);
  validate(config);
  return config;
}

}  // namespace rsvp
