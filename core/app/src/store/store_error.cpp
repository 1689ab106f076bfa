#include "rsvp/store/store_error.hpp"

#include <sqlite3.h>

namespace rsvp {

StoreError::StoreError(const std::string& message, int extended_code)
    : std::runtime_error(message),
      code_(extended_code),
      kind_(classify(extended_code)) {}

// -----------------------------------------------------------------------------
// classify(): map the primary result code (low byte) onto Kind
// -----------------------------------------------------------------------------
StoreError::Kind StoreError::classify(int extended_code) {
  switch (extended_code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Kind::Busy;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_PROTOCOL:
      return Kind::Io;
    case SQLITE_CONSTRAINT:
      return Kind::Constraint;
    default:
      return Kind::Other;
  }
}

bool StoreError::isUniqueViolation() const {
  return code_ == SQLITE_CONSTRAINT_UNIQUE ||
         code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

bool StoreError::isForeignKeyViolation() const {
  return code_ == SQLITE_CONSTRAINT_FOREIGNKEY;
}

bool StoreError::isCheckViolation() const {
  return code_ == SQLITE_CONSTRAINT_CHECK;
}

}  // namespace rsvp
