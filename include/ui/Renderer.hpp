#pragma once

#include "model/Command.hpp"
#include "model/Process.hpp"
#include "model/Session.hpp"
#include "ui/Config.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace seagreen::ui {

// Everything the command loop shows goes through this
class IRenderer {
public:
  virtual ~IRenderer() = default;
  virtual void banner() = 0;
  virtual void prompt() = 0;
  virtual void session_started(const seagreen::model::ProcessHandle& handle, int seconds) = 0;
  virtual void session_tick(const seagreen::model::Progress& progress) = 0;
  virtual void reply(const seagreen::model::Reply& reply) = 0;
};

// Box drawing
std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width);

// Report as box lines (no color)
std::vector<std::string> report_lines(const seagreen::model::Report& r, int width);

class TextRenderer : public IRenderer {
public:
  // color=false renders plain text regardless of the terminal
  TextRenderer(std::ostream& out, const Config::Colors& colors, bool color, bool live_progress);

  void banner() override;
  void prompt() override;
  void session_started(const seagreen::model::ProcessHandle& handle, int seconds) override;
  void session_tick(const seagreen::model::Progress& progress) override;
  void reply(const seagreen::model::Reply& reply) override;

private:
  void help();
  void process_list(const std::vector<seagreen::model::ProcessEntry>& procs);
  void report(const seagreen::model::Report& r);
  void error(const seagreen::model::Reply& reply);
  void end_progress_line();

  std::string paint(const std::string& sgr, const std::string& text) const;

  std::ostream& out_;
  bool live_progress_;
  bool progress_open_{false};
  struct Palette {
    std::string primary, secondary, accent, leaf, ocean, error, bold, dim, reset;
  } pal_{};
};

} // namespace seagreen::ui
