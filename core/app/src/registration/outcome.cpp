#include "rsvp/registration/outcome.hpp"

namespace rsvp {

namespace {

struct NameOf {
  const char* operator()(const Registered&) const { return "REGISTERED"; }
  const char* operator()(const AlreadyRegistered&) const {
    return "ALREADY_REGISTERED";
  }
  const char* operator()(const EventFull&) const { return "EVENT_FULL"; }
  const char* operator()(const EventNotFound&) const {
    return "EVENT_NOT_FOUND";
  }
  const char* operator()(const UserNotFound&) const { return "USER_NOT_FOUND"; }
  const char* operator()(const TransientFailure&) const {
    return "TRANSIENT_FAILURE";
  }
  const char* operator()(const Cancelled&) const { return "CANCELLED"; }
  const char* operator()(const NotRegistered&) const {
    return "NOT_REGISTERED";
  }
};

}  // namespace

const char* outcomeName(const RegisterOutcome& outcome) {
  return std::visit(NameOf{}, outcome);
}

const char* outcomeName(const CancelOutcome& outcome) {
  return std::visit(NameOf{}, outcome);
}

}  // namespace rsvp
