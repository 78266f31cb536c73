#pragma once
#include "app/Aggregator.hpp"
#include "app/Sampler.hpp"
#include "collectors/IProcessTable.hpp"
#include "model/Errors.hpp"
#include "model/Session.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>

namespace seagreen::app {

struct SessionOptions {
  std::chrono::seconds duration{10};
  std::chrono::milliseconds interval{1000};
};

// Optional observers; both run on the polling thread
struct SessionHooks {
  std::function<void(const seagreen::model::ProcessHandle&, const SessionOptions&)> started;
  std::function<void(const seagreen::model::Progress&)> tick;
};

// Drives one tracking session: Pending -> Running -> {Completed, Aborted}.
// run() blocks for at most the requested duration plus one interval. The
// target exiting early still completes; only a bad target, a permission
// failure or a stop request abort.
class SessionController {
public:
  SessionController(seagreen::collectors::IProcessTable& table, Sampler& sampler, SessionOptions opts);

  void set_hooks(SessionHooks hooks) { hooks_ = std::move(hooks); }

  [[nodiscard]] std::expected<seagreen::model::Report, seagreen::model::SessionError>
  run(int32_t pid, std::stop_token st = {});

  [[nodiscard]] seagreen::model::SessionState state() const { return state_; }

private:
  std::unexpected<seagreen::model::SessionError> fail(seagreen::model::ErrorKind kind, int32_t pid, std::string detail);

  seagreen::collectors::IProcessTable& table_;
  Sampler& sampler_;
  SessionOptions opts_;
  SessionHooks hooks_{};
  Aggregator aggregator_{};
  seagreen::model::SessionState state_{seagreen::model::SessionState::Pending};
  std::optional<seagreen::model::ProcessHandle> handle_{};
};

} // namespace seagreen::app
