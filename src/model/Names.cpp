#include "model/Errors.hpp"
#include "model/Session.hpp"

namespace seagreen::model {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NoSuchProcess:    return "NoSuchProcess";
    case ErrorKind::ProcessGone:      return "ProcessGone";
    case ErrorKind::InvalidArgument:  return "InvalidArgument";
    case ErrorKind::UnknownCommand:   return "UnknownCommand";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::Cancelled:        return "Cancelled";
  }
  return "Unknown";
}

const char* to_string(Tier tier) {
  switch (tier) {
    case Tier::Excellent: return "Excellent";
    case Tier::Good:      return "Good";
    case Tier::Fair:      return "Fair";
    case Tier::NeedsWork: return "Needs Work";
  }
  return "Unknown";
}

const char* to_string(SessionState state) {
  switch (state) {
    case SessionState::Pending:   return "pending";
    case SessionState::Running:   return "running";
    case SessionState::Completed: return "completed";
    case SessionState::Aborted:   return "aborted";
  }
  return "unknown";
}

} // namespace seagreen::model
