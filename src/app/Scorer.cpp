#include "app/Scorer.hpp"
#include <algorithm>
#include <cmath>

namespace seagreen::app {

seagreen::model::Tier tier_for(int score) {
  auto it = std::find_if(kTierTable.begin(), kTierTable.end(),
                         [score](const TierThreshold& t){ return score >= t.minimum_score; });
  return it != kTierTable.end() ? it->tier : seagreen::model::Tier::NeedsWork;
}

// NaN, infinities and negatives all read as zero
static double non_negative(double v) {
  return (!std::isfinite(v) || v < 0.0) ? 0.0 : v;
}

seagreen::model::Score score(double avg_cpu_pct, double duration_s) {
  double cpu = non_negative(avg_cpu_pct);
  double dur = non_negative(duration_s);
  double load = (cpu == 0.0 || dur == 0.0) ? 0.0 : cpu * (dur / 60.0);
  double raw = 100.0 - load;
  raw = std::clamp(raw, 0.0, 100.0);
  seagreen::model::Score s;
  s.value = static_cast<int>(std::lround(raw));
  s.tier = tier_for(s.value);
  return s;
}

seagreen::model::Score score_or_sentinel(std::optional<double> avg_cpu_pct, double duration_s) {
  if (!avg_cpu_pct || !(duration_s > 0.0)) {
    return seagreen::model::Score{100, seagreen::model::Tier::Excellent, true};
  }
  return score(*avg_cpu_pct, duration_s);
}

} // namespace seagreen::app
