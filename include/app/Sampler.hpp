#pragma once
#include "collectors/IProcessTable.hpp"
#include "model/Session.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <utility>

namespace seagreen::app {

// Turns cumulative OS counters into per-tick observations. CPU% needs the
// previous reading, which is kept here per handle; the first reading for a
// handle is returned as a warm-up (cpu_valid == false).
class Sampler {
public:
  explicit Sampler(seagreen::collectors::IProcessTable& table);

  // Fails with ProcessGone or PermissionDenied
  [[nodiscard]] std::expected<seagreen::model::Observation, seagreen::model::ErrorKind>
  sample(const seagreen::model::ProcessHandle& handle);

  // As sample(), with the wall-clock instant supplied by the caller
  [[nodiscard]] std::expected<seagreen::model::Observation, seagreen::model::ErrorKind>
  sample_at(const seagreen::model::ProcessHandle& handle, std::chrono::steady_clock::time_point now);

  // Drop the previous reading so the next session starts with a warm-up
  void forget(const seagreen::model::ProcessHandle& handle);

  [[nodiscard]] size_t tracked() const { return last_.size(); }

private:
  struct Previous {
    uint64_t cpu_ticks{};
    std::chrono::steady_clock::time_point at{};
  };
  using Key = std::pair<int32_t, uint64_t>; // pid, start_time

  seagreen::collectors::IProcessTable& table_;
  std::map<Key, Previous> last_{};
};

} // namespace seagreen::app
