#pragma once
#include "app/InterruptWatch.hpp"
#include "app/Sampler.hpp"
#include "collectors/IProcessTable.hpp"
#include "model/Command.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace seagreen::app {

struct DispatchSettings {
  int default_seconds{10};
  int max_seconds{86400};
  std::chrono::milliseconds interval{1000};
  std::string list_match{"python"};
  size_t list_max_rows{20};
  int32_t self_pid{0}; // hidden from /list
};

// Split one input line into a lowercased command and its arguments.
// Returns std::nullopt for a blank line.
[[nodiscard]] std::optional<seagreen::model::CommandInvocation> parse_command(std::string_view line);

// Whole-token, strictly positive decimal integer
[[nodiscard]] std::optional<int64_t> parse_positive_int(std::string_view token);

class Dispatcher {
public:
  Dispatcher(seagreen::collectors::IProcessTable& table, seagreen::ui::IRenderer& renderer, DispatchSettings settings);

  // Run one command. /track blocks until its session ends; st cancels it.
  [[nodiscard]] seagreen::model::Reply dispatch(std::string_view line, std::stop_token st = {});

  // Prompt, read, dispatch, render until /quit, end of input or an
  // interrupt at the prompt. Returns the process exit code.
  int run(seagreen::ui::ILineSource& in, InterruptWatch* watch = nullptr);

  [[nodiscard]] uint64_t sessions_attempted() const { return sessions_attempted_; }
  [[nodiscard]] const DispatchSettings& settings() const { return settings_; }

private:
  seagreen::model::Reply handle_list();
  seagreen::model::Reply handle_track(const seagreen::model::CommandInvocation& cmd, std::stop_token st);
  seagreen::model::Reply handle_help();
  seagreen::model::Reply handle_quit();

  seagreen::collectors::IProcessTable& table_;
  seagreen::ui::IRenderer& renderer_;
  DispatchSettings settings_;
  Sampler sampler_;
  uint64_t sessions_attempted_{0};
};

} // namespace seagreen::app
