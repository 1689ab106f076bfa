#include "rsvp/repository/user_repository.hpp"
#include "rsvp/store/transaction.hpp"

namespace rsvp {

namespace {

constexpr const char* kSelectUser =
    "SELECT id, name, email, role, created_at_ms FROM users WHERE id = ?";

domain::User rowToUser(const Statement& stmt) {
  domain::User user;
  user.id = stmt.columnInt64(0);
  user.name = stmt.columnText(1);
  user.email = stmt.columnText(2);
  // The CHECK constraint only admits the two known role strings.
  user.role = domain::roleFromString(stmt.columnText(3))
                  .value_or(domain::UserRole::Attendee);
  user.created_at_ms = stmt.columnInt64(4);
  return user;
}

}  // namespace

UserRepository::UserRepository(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

domain::User UserRepository::create(Connection& connection,
                                    const std::string& name,
                                    const std::string& email,
                                    domain::UserRole role) const {
  domain::User user;
  user.name = name;
  user.email = email;
  user.role = role;
  user.created_at_ms = time_provider_.now_ms();

  connection
      .prepare(
          "INSERT INTO users (name, email, role, created_at_ms) "
          "VALUES (?, ?, ?, ?)")
      .bind(1, user.name)
      .bind(2, user.email)
      .bind(3, std::string(domain::roleToString(user.role)))
      .bind(4, user.created_at_ms)
      .run();
  user.id = connection.lastInsertRowId();
  return user;
}

std::optional<domain::User> UserRepository::find(Connection& connection,
                                                 domain::UserId id) const {
  Statement stmt = connection.prepare(kSelectUser);
  stmt.bind(1, id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return rowToUser(stmt);
}

bool UserRepository::exists(Connection& connection, domain::UserId id) const {
  Statement stmt = connection.prepare("SELECT 1 FROM users WHERE id = ?");
  stmt.bind(1, id);
  return stmt.step();
}

// -----------------------------------------------------------------------------
// update(): read-modify-write under one write transaction
// -----------------------------------------------------------------------------
std::optional<domain::User> UserRepository::update(
    Connection& connection, domain::UserId id,
    const UserUpdate& changes) const {
  Transaction tx(connection);

  auto user = find(connection, id);
  if (!user) {
    return std::nullopt;
  }
  if (changes.name) {
    user->name = *changes.name;
  }
  if (changes.email) {
    user->email = *changes.email;
  }
  if (changes.role) {
    user->role = *changes.role;
  }

  connection
      .prepare("UPDATE users SET name = ?, email = ?, role = ? WHERE id = ?")
      .bind(1, user->name)
      .bind(2, user->email)
      .bind(3, std::string(domain::roleToString(user->role)))
      .bind(4, id)
      .run();

  tx.commit();
  return user;
}

bool UserRepository::remove(Connection& connection, domain::UserId id) const {
  connection.prepare("DELETE FROM users WHERE id = ?").bind(1, id).run();
  return connection.changes() > 0;
}

}  // namespace rsvp
