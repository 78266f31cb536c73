#pragma once
#include "model/Session.hpp"
#include <array>
#include <optional>

namespace seagreen::app {

struct TierThreshold {
  int minimum_score;
  seagreen::model::Tier tier;
};

// Inclusive lower bounds, best tier first
inline constexpr std::array<TierThreshold, 4> kTierTable{{
  {90, seagreen::model::Tier::Excellent},
  {70, seagreen::model::Tier::Good},
  {40, seagreen::model::Tier::Fair},
  {0,  seagreen::model::Tier::NeedsWork},
}};

[[nodiscard]] seagreen::model::Tier tier_for(int score);

// raw = 100 - avg_cpu * (duration / 60), rounded and clamped to [0,100]
[[nodiscard]] seagreen::model::Score score(double avg_cpu_pct, double duration_s);

// No CPU average or no elapsed time: {100, Excellent} flagged insufficient_data
[[nodiscard]] seagreen::model::Score score_or_sentinel(std::optional<double> avg_cpu_pct, double duration_s);

} // namespace seagreen::app
