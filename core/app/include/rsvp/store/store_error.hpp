#pragma once

#include <stdexcept>
#include <string>

namespace rsvp {

// -----------------------------------------------------------------------------
// StoreError: failure reported by the SQLite datastore
// -----------------------------------------------------------------------------
//
// @brief  Exception thrown by Connection, Statement, Transaction and the
//         repositories whenever SQLite returns an error result code.
//
// @details
// Carries the extended SQLite result code so callers can classify the
// failure without parsing the message:
//
//   Busy        SQLITE_BUSY / SQLITE_LOCKED. The datastore lock could not be
//               acquired within the busy timeout. Transient.
//   Io          SQLITE_IOERR, SQLITE_FULL, SQLITE_CANTOPEN, SQLITE_PROTOCOL.
//               Storage or connectivity loss. Transient.
//   Constraint  SQLITE_CONSTRAINT_*. A schema rule (UNIQUE, CHECK,
//               FOREIGN KEY, NOT NULL) rejected the write. Deterministic.
//   Other       Everything else (misuse, corrupt file, schema mismatch).
//
// Business outcomes (EventFull, AlreadyRegistered, ...) are NOT reported
// through this type; they are values of RegisterOutcome / CancelOutcome.
// A StoreError always means the current transaction must be abandoned.
//
// Thread model: Value type, safe to copy between threads.
// -----------------------------------------------------------------------------
class StoreError : public std::runtime_error {
 public:
  enum class Kind {
    Busy,
    Io,
    Constraint,
    Other,
  };

  StoreError(const std::string& message, int extended_code);

  // Extended SQLite result code (e.g. SQLITE_CONSTRAINT_UNIQUE).
  int code() const { return code_; }

  Kind kind() const { return kind_; }

  // True for failures that are safe to retry from the start of the
  // operation: lock timeouts and I/O loss.
  bool isTransient() const {
    return kind_ == Kind::Busy || kind_ == Kind::Io;
  }

  bool isUniqueViolation() const;
  bool isForeignKeyViolation() const;
  bool isCheckViolation() const;

 private:
  static Kind classify(int extended_code);

  int code_;
  Kind kind_;
};

}  // namespace rsvp
