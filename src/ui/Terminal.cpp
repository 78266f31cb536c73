#include "ui/Terminal.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <string>

namespace seagreen::ui {

std::atomic<bool> g_interrupted{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

void on_sigint(int) {
  // Async-signal-safe: drop any half-written color, then flag
  const char* reset = "\x1B[0m";
  if (::isatty(STDOUT_FILENO) == 1) best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
  g_interrupted.store(true);
}

void install_interrupt_handler() {
  std::signal(SIGINT, on_sigint);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool truecolor_capable() {
  const char* ct = std::getenv("COLORTERM");
  if (ct) {
    std::string s = ct;
    for (auto& c : s) c = std::tolower((unsigned char)c);
    if (s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos) return true;
  }
  return false;
}

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LC_CTYPE");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = std::tolower((unsigned char)c);
  return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
    return ws.ws_col;
  const char* c = std::getenv("COLUMNS");
  if (c && *c) {
    try { return std::max(20, std::stoi(c)); } catch (const std::exception&) {}
  }
  return 80;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() { return sgr("0"); }

std::string sgr_bold() { return sgr("1"); }

std::string sgr_dim() { return sgr("2"); }

std::string sgr_palette_idx(int idx) {
  if (!tty_stdout()) return {};
  if (idx < 0) idx = 0;
  if (idx <= 7) return std::string("\x1B[") + std::to_string(30 + idx) + "m";
  if (idx <= 15) return std::string("\x1B[") + std::to_string(90 + (idx - 8)) + "m";
  // 256-color fallback
  return std::string("\x1B[38;5;") + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  r = std::clamp(r,0,255); g = std::clamp(g,0,255); b = std::clamp(b,0,255);
  return std::string("\x1B[38;2;") + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

int nearest_palette_idx(int r, int g, int b) {
  // xterm defaults for indices 0..15
  static constexpr std::array<std::array<int,3>,16> kBasic{{
    {0,0,0}, {205,0,0}, {0,205,0}, {205,205,0}, {0,0,238}, {205,0,205}, {0,205,205}, {229,229,229},
    {127,127,127}, {255,0,0}, {0,255,0}, {255,255,0}, {92,92,255}, {255,0,255}, {0,255,255}, {255,255,255},
  }};
  int best = 7; long best_d = -1;
  for (int i = 0; i < 16; ++i) {
    long dr = r - kBasic[i][0], dg = g - kBasic[i][1], db = b - kBasic[i][2];
    long d = dr*dr + dg*dg + db*db;
    if (best_d < 0 || d < best_d) { best_d = d; best = i; }
  }
  return best;
}

std::string sgr_hex(const std::string& hex, int fallback_idx) {
  int r, g, b;
  if (!parse_hex_rgb(hex, r, g, b)) return sgr_palette_idx(fallback_idx);
  if (truecolor_capable()) return sgr_truecolor(r, g, b);
  return sgr_palette_idx(nearest_palette_idx(r, g, b));
}

} // namespace seagreen::ui
