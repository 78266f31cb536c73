#include "util/Diag.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace seagreen::util {

static std::atomic<bool> g_debug{false};

void set_debug(bool on) { g_debug.store(on); }

bool debug_enabled() { return g_debug.load(); }

static void vemit(const char* area, const char* fmt, va_list ap) {
  // One fprintf per line
  char body[512];
  std::vsnprintf(body, sizeof(body), fmt, ap);
  std::fprintf(stderr, "seagreen: %s: %s\n", area, body);
}

void warnf(const char* area, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  vemit(area, fmt, ap);
  va_end(ap);
}

void debugf(const char* area, const char* fmt, ...) {
  if (!debug_enabled()) return;
  va_list ap;
  va_start(ap, fmt);
  vemit(area, fmt, ap);
  va_end(ap);
}

} // namespace seagreen::util
