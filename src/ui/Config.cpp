#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace seagreen::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // Accept both SEAGREEN_ and seagreen_ prefixes
  std::string alt;
  std::string n(name);
  if (n.rfind("SEAGREEN_", 0) == 0) {
    alt = std::string("seagreen_") + n.substr(9);
  } else if (n.rfind("seagreen_", 0) == 0) {
    alt = std::string("SEAGREEN_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* p = getenv_compat("SEAGREEN_CONFIG"); p && *p)
    return std::string(p);
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/seagreen/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/seagreen/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const seagreen::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const seagreen::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default. An explicitly
// empty TOML value is kept (list.match = "" means no filter).
static std::string resolve_string(const seagreen::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Colors only come from TOML; an unparsable value keeps the default
static std::string resolve_color(const seagreen::util::TomlReader& toml, bool have_toml,
                                 const char* role, const std::string& def) {
  if (!have_toml || !toml.has("colors", role)) return def;
  std::string val = toml.get_string("colors", role);
  int r, g, b;
  return parse_hex_rgb(val, r, g, b) ? val : def;
}

Config load_config(const std::string& path) {
  Config c{};
  seagreen::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);

  // --- [session] ---
  c.session.interval_ms     = resolve_int(toml, have_toml, "session", "interval_ms",     "SEAGREEN_INTERVAL_MS", c.session.interval_ms);
  c.session.default_seconds = resolve_int(toml, have_toml, "session", "default_seconds", "SEAGREEN_DEFAULT_SECONDS", c.session.default_seconds);
  c.session.max_seconds     = resolve_int(toml, have_toml, "session", "max_seconds",     "SEAGREEN_MAX_SECONDS", c.session.max_seconds);
  c.session.interval_ms = std::clamp(c.session.interval_ms, 50, 10000);
  if (c.session.max_seconds < 1) c.session.max_seconds = 1;
  c.session.default_seconds = std::clamp(c.session.default_seconds, 1, c.session.max_seconds);

  // --- [list] ---
  c.list.match    = resolve_string(toml, have_toml, "list", "match",    "SEAGREEN_LIST_MATCH", c.list.match);
  c.list.max_rows = resolve_int(toml, have_toml, "list", "max_rows",    "SEAGREEN_LIST_MAX_ROWS", c.list.max_rows);
  if (c.list.max_rows < 1) c.list.max_rows = 1;

  // --- [ui] / [log] ---
  c.ui.banner = resolve_bool(toml, have_toml, "ui", "banner", "SEAGREEN_BANNER", c.ui.banner);
  c.log.debug = resolve_bool(toml, have_toml, "log", "debug", "SEAGREEN_DEBUG", c.log.debug);

  // --- [colors] ---
  c.colors.primary   = resolve_color(toml, have_toml, "primary",   c.colors.primary);
  c.colors.secondary = resolve_color(toml, have_toml, "secondary", c.colors.secondary);
  c.colors.accent    = resolve_color(toml, have_toml, "accent",    c.colors.accent);
  c.colors.leaf      = resolve_color(toml, have_toml, "leaf",      c.colors.leaf);
  c.colors.ocean     = resolve_color(toml, have_toml, "ocean",     c.colors.ocean);
  c.colors.error     = resolve_color(toml, have_toml, "error",     c.colors.error);

  return c;
}

} // namespace seagreen::ui
