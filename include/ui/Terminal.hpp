#pragma once

#include <atomic>
#include <cstddef>
#include <string>

namespace seagreen::ui {

// Set by the SIGINT handler, consumed by the prompt and the interrupt bridge
extern std::atomic<bool> g_interrupted;

void on_sigint(int);
void install_interrupt_handler();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool truecolor_capable();
[[nodiscard]] bool use_unicode();
[[nodiscard]] int term_cols();

// SGR code generation (empty when stdout is not a terminal)
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();
[[nodiscard]] std::string sgr_bold();
[[nodiscard]] std::string sgr_dim();
[[nodiscard]] std::string sgr_palette_idx(int idx);
[[nodiscard]] std::string sgr_truecolor(int r, int g, int b);

// "#RRGGBB" as truecolor when the terminal advertises it, else the closest
// of the 16 basic palette entries; fallback_idx when hex does not parse
[[nodiscard]] std::string sgr_hex(const std::string& hex, int fallback_idx);

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);
[[nodiscard]] int nearest_palette_idx(int r, int g, int b);

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

} // namespace seagreen::ui
