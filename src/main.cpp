#include "app/Dispatcher.hpp"
#include "app/InterruptWatch.hpp"
#include "collectors/ProcfsProcessTable.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Diag.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <unistd.h>

static void usage(std::FILE* to) {
  std::fprintf(to, "Usage: seagreen [--config PATH] [--interval-ms MS] [--no-banner] [--debug]\n");
  std::fprintf(to, "Interactive: /list, /track <pid> [seconds], /help, /quit\n");
}

static bool parse_int_flag(const char* flag, const char* value, int& out) {
  try {
    size_t used = 0;
    out = std::stoi(value, &used);
    if (used == std::char_traits<char>::length(value)) return true;
  } catch (const std::exception&) {}
  std::fprintf(stderr, "seagreen: %s expects an integer, got '%s'\n", flag, value);
  return false;
}

int main(int argc, char** argv) {
  std::string config_path = seagreen::ui::config_file_path();
  int interval_override = 0;
  bool no_banner = false;
  bool debug = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--interval-ms" && i + 1 < argc) {
      if (!parse_int_flag("--interval-ms", argv[++i], interval_override)) return 2;
    }
    else if (a == "--no-banner") no_banner = true;
    else if (a == "--debug") debug = true;
    else if (a == "-h" || a == "--help") { usage(stdout); return 0; }
    else {
      std::fprintf(stderr, "seagreen: unknown option '%s'\n", a.c_str());
      usage(stderr);
      return 2;
    }
  }

  auto cfg = seagreen::ui::load_config(config_path);
  if (interval_override > 0) cfg.session.interval_ms = std::clamp(interval_override, 50, 10000);
  seagreen::util::set_debug(cfg.log.debug || debug);
  seagreen::util::debugf("config", "file '%s', interval %dms, default %ds", config_path.c_str(),
                         cfg.session.interval_ms, cfg.session.default_seconds);

  // Without a readable /proc nothing can be tracked
  std::error_code ec;
  if (!seagreen::util::read_file_string("/proc/self/stat", ec)) {
    seagreen::util::warnf("startup", "cannot read /proc/self/stat: %s", ec.message().c_str());
    return 1;
  }

  seagreen::ui::install_interrupt_handler();

  seagreen::collectors::ProcfsProcessTable table;
  const bool tty = seagreen::ui::tty_stdout();
  seagreen::ui::TextRenderer renderer(std::cout, cfg.colors, tty, tty);

  seagreen::app::DispatchSettings settings;
  settings.default_seconds = cfg.session.default_seconds;
  settings.max_seconds = cfg.session.max_seconds;
  settings.interval = std::chrono::milliseconds(cfg.session.interval_ms);
  settings.list_match = cfg.list.match;
  settings.list_max_rows = static_cast<size_t>(cfg.list.max_rows);
  settings.self_pid = static_cast<int32_t>(::getpid());

  seagreen::app::Dispatcher dispatcher(table, renderer, settings);
  seagreen::app::InterruptWatch watch(seagreen::ui::g_interrupted);
  seagreen::ui::FdLineSource input(STDIN_FILENO, seagreen::ui::g_interrupted);

  if (cfg.ui.banner && !no_banner) renderer.banner();
  return dispatcher.run(input, &watch);
}
