#pragma once
#include <cstdint>
#include <string>

namespace seagreen::model {

enum class ErrorKind {
  NoSuchProcess,    // target does not resolve at session start
  ProcessGone,      // target exited mid-session (ends the session normally)
  InvalidArgument,  // malformed command arguments
  UnknownCommand,   // unrecognized slash command
  PermissionDenied, // OS refused to read the target
  Cancelled         // external interrupt during a session
};

[[nodiscard]] const char* to_string(ErrorKind kind);

struct SessionError {
  ErrorKind kind{ErrorKind::NoSuchProcess};
  int32_t pid{};
  std::string detail;
};

} // namespace seagreen::model
