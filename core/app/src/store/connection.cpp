#include "rsvp/store/connection.hpp"
#include "rsvp/store/store_error.hpp"

#include <utility>

namespace rsvp {

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                              static_cast<int>(sql.size()), &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    // sqlite3_prepare_v2 leaves stmt_ null on failure; nothing to finalize.
    throw StoreError("prepare failed: " + std::string(sqlite3_errmsg(db_)) +
                         " [" + sql + "]",
                     sqlite3_extended_errcode(db_));
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    db_ = std::exchange(other.db_, nullptr);
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

Statement& Statement::bind(int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
    fail("bind");
  }
  return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
  // SQLITE_TRANSIENT: SQLite copies the bytes, so `value` may die before
  // the statement is stepped.
  if (sqlite3_bind_text(stmt_, index, value.data(),
                        static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    fail("bind");
  }
  return *this;
}

// -----------------------------------------------------------------------------
// step(): one row or done; everything else is an error
// -----------------------------------------------------------------------------
bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  fail("step");
}

void Statement::run() {
  while (step()) {
  }
}

std::int64_t Statement::columnInt64(int column) const {
  return sqlite3_column_int64(stmt_, column);
}

int Statement::columnInt(int column) const {
  return sqlite3_column_int(stmt_, column);
}

std::string Statement::columnText(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  int size = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(size));
}

void Statement::fail(const char* what) const {
  throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db_),
                   sqlite3_extended_errcode(db_));
}

// =============================================================================
// Connection
// =============================================================================

// -----------------------------------------------------------------------------
// Constructor: open, set busy timeout, enable foreign keys
// -----------------------------------------------------------------------------
Connection::Connection(const std::string& path, int busy_timeout_ms)
    : path_(path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
              SQLITE_OPEN_NOMUTEX;
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message =
        db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    int code = db_ != nullptr ? sqlite3_extended_errcode(db_) : rc;
    // A handle is allocated even when open fails; it must still be closed.
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("cannot open database '" + path_ + "': " + message,
                     code);
  }

  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, busy_timeout_ms);

  try {
    exec("PRAGMA foreign_keys = ON; PRAGMA synchronous = NORMAL");
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Connection::~Connection() {
  if (db_ != nullptr) {
    // All Statements are scoped to a single operation, so none are live
    // here and sqlite3_close succeeds.
    sqlite3_close(db_);
  }
}

void Connection::exec(const std::string& sql) {
  char* errmsg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    std::string message = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
    sqlite3_free(errmsg);
    throw StoreError(message + " [" + sql + "]",
                     sqlite3_extended_errcode(db_));
  }
}

Statement Connection::prepare(const std::string& sql) {
  return Statement(db_, sql);
}

std::int64_t Connection::lastInsertRowId() const {
  return sqlite3_last_insert_rowid(db_);
}

int Connection::changes() const { return sqlite3_changes(db_); }

bool Connection::inAutocommit() const {
  return sqlite3_get_autocommit(db_) != 0;
}

}  // namespace rsvp
