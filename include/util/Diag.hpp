// stderr diagnostics: "seagreen: <area>: message"
#pragma once

namespace seagreen::util {

void set_debug(bool on);
[[nodiscard]] bool debug_enabled();

// Always printed
void warnf(const char* area, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// Printed only when debug is enabled
void debugf(const char* area, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace seagreen::util
