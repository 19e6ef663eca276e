#pragma once
#include <array>
#include <optional>
#include <string>
#include <upace/types.hpp>
#include <upace/zones.hpp>

namespace upace {

enum class StrategyTier : int { Aggressive = 0, Balanced = 1, Conservative = 2 };

inline constexpr double kAggressiveMultiplier   = 0.93;
inline constexpr double kBalancedMultiplier     = 1.00;
inline constexpr double kConservativeMultiplier = 1.08;

struct PaceStrategy {
  StrategyTier tier = StrategyTier::Balanced;
  double pace = 0.0;                 // min/mile
  double adjustment_percent = 0.0;   // vs. base pace
  Confidence confidence = Confidence::Low;
  std::string description;
  std::string best_for;
  std::string reasoning;
  std::optional<HrZoneSuggestion> suggested_hr;
  std::optional<PowerZoneSuggestion> suggested_power;
};

// Always aggressive, balanced, conservative in that order. HR and power
// ranges are rescaled to each tier's speed.
std::array<PaceStrategy, 3> generate_pace_options(double base_pace,
                                                  Confidence confidence,
                                                  const std::string& reasoning,
                                                  const std::optional<HrZoneSuggestion>& hr = std::nullopt,
                                                  const std::optional<PowerZoneSuggestion>& power = std::nullopt);

const char* to_string(StrategyTier t);

} // namespace upace
