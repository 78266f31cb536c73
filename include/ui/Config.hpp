#pragma once

#include <string>

namespace seagreen::ui {

struct Config {
  struct Session {
    int interval_ms{1000};
    int default_seconds{10};
    int max_seconds{86400};
  } session;

  struct List {
    std::string match{"python"}; // case-insensitive substring; empty = all
    int max_rows{20};
  } list;

  struct UI {
    bool banner{true};
  } ui;

  struct Log {
    bool debug{false};
  } log;

  // "#RRGGBB"
  struct Colors {
    std::string primary{"#3d8b6f"};
    std::string secondary{"#4a9b6e"};
    std::string accent{"#5ab88a"};
    std::string leaf{"#6bc99a"};
    std::string ocean{"#2d6b5d"};
    std::string error{"#ea1717"};
  } colors;
};

// $SEAGREEN_CONFIG, else XDG/HOME config.toml; empty when neither is set
[[nodiscard]] std::string config_file_path();

// TOML -> env -> compiled default. A missing file yields env/defaults.
[[nodiscard]] Config load_config(const std::string& path);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace seagreen::ui
