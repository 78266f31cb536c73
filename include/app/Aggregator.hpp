#pragma once
#include "model/Session.hpp"

namespace seagreen::app {

// Running statistics over one session's observations. Keeps no history.
class Aggregator {
public:
  void ingest(const seagreen::model::Observation& obs);

  // Snapshot of the accumulators; calling it repeatedly changes nothing
  [[nodiscard]] seagreen::model::RunningStats finalize() const { return stats_; }

  void reset() { stats_ = {}; }

private:
  seagreen::model::RunningStats stats_{};
};

} // namespace seagreen::app
