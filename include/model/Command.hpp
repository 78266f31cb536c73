#pragma once
#include "model/Errors.hpp"
#include "model/Process.hpp"
#include "model/Session.hpp"
#include <optional>
#include <string>
#include <vector>

namespace seagreen::model {

// One line of interactive input split into a lowercased command name and
// its arguments
struct CommandInvocation {
  std::string name;
  std::vector<std::string> args;
};

enum class ReplyKind { None, Help, List, Report, Error, Quit };

// What a dispatched command produced, ready for a renderer
struct Reply {
  ReplyKind kind{ReplyKind::None};
  ErrorKind error{ErrorKind::UnknownCommand}; // kind == Error
  std::string message;
  std::vector<ProcessEntry> processes;        // kind == List
  std::optional<Report> report;               // kind == Report
};

} // namespace seagreen::model
