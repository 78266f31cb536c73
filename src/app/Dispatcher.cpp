#include "app/Dispatcher.hpp"
#include "app/Session.hpp"
#include "util/Diag.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <sstream>

using seagreen::model::CommandInvocation;
using seagreen::model::ErrorKind;
using seagreen::model::Reply;
using seagreen::model::ReplyKind;

namespace seagreen::app {

namespace {

enum class Command { List, Track, Help, Quit };

struct CommandName { const char* name; Command cmd; };

// Bare quit/exit are accepted so a forgotten slash still leaves the loop
constexpr CommandName kCommands[] = {
  {"/list",  Command::List},
  {"/track", Command::Track},
  {"/help",  Command::Help},
  {"/quit",  Command::Quit},
  {"/exit",  Command::Quit},
  {"quit",   Command::Quit},
  {"exit",   Command::Quit},
};

std::optional<Command> lookup(const std::string& name) {
  for (const auto& c : kCommands)
    if (name == c.name) return c.cmd;
  return std::nullopt;
}

Reply error_reply(ErrorKind kind, std::string message) {
  Reply r;
  r.kind = ReplyKind::Error;
  r.error = kind;
  r.message = std::move(message);
  return r;
}

std::string ascii_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

const char* kTrackUsage = "Usage: /track <pid> [seconds]";

} // namespace

std::optional<CommandInvocation> parse_command(std::string_view line) {
  std::istringstream iss{std::string(line)};
  std::string word;
  if (!(iss >> word)) return std::nullopt;
  CommandInvocation inv;
  inv.name = ascii_lower(word);
  while (iss >> word) inv.args.push_back(word);
  return inv;
}

std::optional<int64_t> parse_positive_int(std::string_view token) {
  if (token.empty()) return std::nullopt;
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), v);
  if (ec != std::errc() || ptr != token.data() + token.size() || v <= 0) return std::nullopt;
  return v;
}

Dispatcher::Dispatcher(seagreen::collectors::IProcessTable& table, seagreen::ui::IRenderer& renderer, DispatchSettings settings)
  : table_(table), renderer_(renderer), settings_(std::move(settings)), sampler_(table) {}

Reply Dispatcher::dispatch(std::string_view line, std::stop_token st) {
  auto inv = parse_command(line);
  if (!inv) return Reply{};
  auto cmd = lookup(inv->name);
  if (!cmd) {
    seagreen::util::debugf("dispatch", "unknown command '%s'", inv->name.c_str());
    return error_reply(ErrorKind::UnknownCommand, "Unknown command: " + inv->name + ". Type /help for commands.");
  }
  // Only /track takes arguments
  if (*cmd != Command::Track && !inv->args.empty())
    return error_reply(ErrorKind::InvalidArgument, inv->name + " takes no arguments.");
  switch (*cmd) {
    case Command::List:  return handle_list();
    case Command::Track: return handle_track(*inv, st);
    case Command::Help:  return handle_help();
    case Command::Quit:  return handle_quit();
  }
  return Reply{};
}

Reply Dispatcher::handle_help() {
  Reply r;
  r.kind = ReplyKind::Help;
  return r;
}

Reply Dispatcher::handle_quit() {
  Reply r;
  r.kind = ReplyKind::Quit;
  r.message = "Goodbye!";
  return r;
}

Reply Dispatcher::handle_list() {
  const auto needle = ascii_lower(settings_.list_match);
  Reply r;
  r.kind = ReplyKind::List;
  for (auto& p : table_.list_processes()) {
    if (p.pid == settings_.self_pid) continue;
    if (!needle.empty() && ascii_lower(p.name).find(needle) == std::string::npos &&
        ascii_lower(p.cmd).find(needle) == std::string::npos) continue;
    r.processes.push_back(std::move(p));
  }
  std::sort(r.processes.begin(), r.processes.end(), [](const auto& a, const auto& b){ return a.pid < b.pid; });
  if (r.processes.size() > settings_.list_max_rows) r.processes.resize(settings_.list_max_rows);
  if (r.processes.empty()) {
    r.message = needle.empty() ? "No processes found."
                               : "No processes matching '" + settings_.list_match + "' found. Start one first!";
  }
  return r;
}

Reply Dispatcher::handle_track(const CommandInvocation& cmd, std::stop_token st) {
  if (cmd.args.empty() || cmd.args.size() > 2)
    return error_reply(ErrorKind::InvalidArgument, kTrackUsage);

  auto pid = parse_positive_int(cmd.args[0]);
  if (!pid || *pid > INT32_MAX)
    return error_reply(ErrorKind::InvalidArgument, "PID must be a positive integer. Example: /track 1234");

  int64_t seconds = settings_.default_seconds;
  if (cmd.args.size() == 2) {
    auto s = parse_positive_int(cmd.args[1]);
    if (!s || *s > settings_.max_seconds)
      return error_reply(ErrorKind::InvalidArgument,
                         "Seconds must be a positive integer no larger than " + std::to_string(settings_.max_seconds) + ".");
    seconds = *s;
  }

  ++sessions_attempted_;
  SessionController session(table_, sampler_, SessionOptions{std::chrono::seconds(seconds), settings_.interval});
  session.set_hooks(SessionHooks{
    [this](const seagreen::model::ProcessHandle& h, const SessionOptions& o){
      renderer_.session_started(h, static_cast<int>(o.duration.count()));
    },
    [this](const seagreen::model::Progress& p){ renderer_.session_tick(p); },
  });

  const auto target = static_cast<int32_t>(*pid);
  auto result = session.run(target, st);
  if (result) {
    Reply r;
    r.kind = ReplyKind::Report;
    r.report = std::move(*result);
    return r;
  }

  const auto& err = result.error();
  switch (err.kind) {
    case ErrorKind::NoSuchProcess:
      return error_reply(err.kind, "Process " + std::to_string(target) + " not found. Use /list to see available processes.");
    case ErrorKind::PermissionDenied:
      return error_reply(err.kind, "Permission denied for process " + std::to_string(target) + ". Try a process you own.");
    case ErrorKind::Cancelled:
      return error_reply(err.kind, "Stopped early. No report for an interrupted session.");
    default:
      return error_reply(err.kind, std::string("Tracking failed: ") + seagreen::model::to_string(err.kind));
  }
}

int Dispatcher::run(seagreen::ui::ILineSource& in, InterruptWatch* watch) {
  std::string line;
  for (;;) {
    renderer_.prompt();
    auto status = in.read_line(line);
    if (status != seagreen::ui::ReadStatus::Line) {
      // The prompt is still open on this line
      auto bye = handle_quit();
      bye.message.insert(0, "\n");
      renderer_.reply(bye);
      return 0;
    }
    std::stop_token token = watch ? watch->arm() : std::stop_token{};
    auto reply = dispatch(line, token);
    if (watch) watch->disarm();
    renderer_.reply(reply);
    if (reply.kind == ReplyKind::Quit) return 0;
  }
}

} // namespace seagreen::app
