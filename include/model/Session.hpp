#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace seagreen::model {

// One instant's reading. cpu_pct is relative to a single core (100 = one
// core fully busy) and only meaningful when cpu_valid is set; the first
// reading for a handle is a warm-up with no delta behind it.
struct Observation {
  std::chrono::steady_clock::time_point at{};
  double   cpu_pct{};
  bool     cpu_valid{false};
  double   cpu_time_s{}; // cumulative CPU seconds of the target
  uint64_t memory_bytes{};
};

struct RunningStats {
  uint64_t samples{};     // every ingested observation
  uint64_t cpu_samples{}; // observations that carried a CPU delta
  double   cpu_sum{};
  double   cpu_peak{};
  double   memory_sum{};  // bytes
  uint64_t memory_peak{};
  double   cpu_time_first_s{};
  double   cpu_time_last_s{};

  [[nodiscard]] double avg_cpu() const { return cpu_samples ? cpu_sum / static_cast<double>(cpu_samples) : 0.0; }
  [[nodiscard]] double avg_memory() const { return samples ? memory_sum / static_cast<double>(samples) : 0.0; }
  [[nodiscard]] double cpu_seconds() const { return samples ? cpu_time_last_s - cpu_time_first_s : 0.0; }
  bool operator==(const RunningStats&) const = default;
};

// Per-tick view handed to progress observers
struct Progress {
  double   elapsed_s{};
  int      requested_seconds{};
  uint64_t samples{};
  const Observation* last{nullptr};
};

// Ordered best to worst
enum class Tier { Excellent, Good, Fair, NeedsWork };

[[nodiscard]] const char* to_string(Tier tier);

struct Score {
  int  value{100};
  Tier tier{Tier::Excellent};
  bool insufficient_data{false};
};

enum class SessionState { Pending, Running, Completed, Aborted };

[[nodiscard]] const char* to_string(SessionState state);

// Why a completed session stopped polling
enum class EndReason { Deadline, ProcessGone };

struct Report {
  int32_t     pid{};
  std::string process_name;
  int         requested_seconds{};
  double      duration_s{};
  uint64_t    samples{};
  uint64_t    cpu_samples{};
  double      avg_cpu_pct{};
  double      peak_cpu_pct{};
  double      avg_memory_bytes{};
  uint64_t    peak_memory_bytes{};
  double      cpu_seconds{};
  Score       score{};
  EndReason   end_reason{EndReason::Deadline};
};

} // namespace seagreen::model
