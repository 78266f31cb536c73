#include "app/Sampler.hpp"

namespace seagreen::app {

Sampler::Sampler(seagreen::collectors::IProcessTable& table) : table_(table) {}

std::expected<seagreen::model::Observation, seagreen::model::ErrorKind>
Sampler::sample(const seagreen::model::ProcessHandle& handle) {
  return sample_at(handle, std::chrono::steady_clock::now());
}

std::expected<seagreen::model::Observation, seagreen::model::ErrorKind>
Sampler::sample_at(const seagreen::model::ProcessHandle& handle, std::chrono::steady_clock::time_point now) {
  auto usage = table_.read_usage(handle);
  if (!usage) {
    forget(handle);
    return std::unexpected(usage.error());
  }
  const double hz = table_.ticks_per_second() > 0.0 ? table_.ticks_per_second() : 100.0;

  seagreen::model::Observation obs;
  obs.at = now;
  obs.memory_bytes = usage->rss_bytes;
  obs.cpu_time_s = static_cast<double>(usage->cpu_ticks) / hz;

  Key key{handle.pid, handle.start_time};
  auto it = last_.find(key);
  if (it != last_.end()) {
    double dt = std::chrono::duration<double>(now - it->second.at).count();
    uint64_t dp = (usage->cpu_ticks > it->second.cpu_ticks) ? (usage->cpu_ticks - it->second.cpu_ticks) : 0;
    if (dt > 0.0) {
      obs.cpu_pct = 100.0 * (static_cast<double>(dp) / hz) / dt;
      obs.cpu_valid = true;
    }
  }
  last_[key] = Previous{usage->cpu_ticks, now};
  return obs;
}

void Sampler::forget(const seagreen::model::ProcessHandle& handle) {
  last_.erase(Key{handle.pid, handle.start_time});
}

} // namespace seagreen::app
