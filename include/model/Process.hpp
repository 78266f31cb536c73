#pragma once
#include <cstdint>
#include <string>

namespace seagreen::model {

// One row of the process table as shown by /list
struct ProcessEntry {
  int32_t pid{};
  std::string name; // comm
  std::string cmd;  // full command line, space separated
};

// A resolved target. start_time (jiffies since boot) pins the identity so
// a recycled pid is not mistaken for the original process.
struct ProcessHandle {
  int32_t pid{};
  std::string name;
  uint64_t start_time{};
};

// Cumulative counters as read from the OS at one instant
struct RawUsage {
  uint64_t cpu_ticks{}; // utime+stime
  uint64_t rss_bytes{};
};

} // namespace seagreen::model
