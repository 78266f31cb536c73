#include "app/Aggregator.hpp"
#include <algorithm>

namespace seagreen::app {

void Aggregator::ingest(const seagreen::model::Observation& obs) {
  if (stats_.samples == 0) stats_.cpu_time_first_s = obs.cpu_time_s;
  stats_.cpu_time_last_s = obs.cpu_time_s;
  ++stats_.samples;
  stats_.memory_sum += static_cast<double>(obs.memory_bytes);
  stats_.memory_peak = std::max(stats_.memory_peak, obs.memory_bytes);
  // Warm-up readings only count towards memory
  if (!obs.cpu_valid) return;
  ++stats_.cpu_samples;
  stats_.cpu_sum += obs.cpu_pct;
  stats_.cpu_peak = std::max(stats_.cpu_peak, obs.cpu_pct);
}

} // namespace seagreen::app
