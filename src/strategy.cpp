#include <upace/strategy.hpp>
#include <algorithm>
#include <cmath>

namespace upace {

namespace {

Confidence shift(Confidence c, int by) {
  const int v = std::clamp(static_cast<int>(c) + by,
                           static_cast<int>(Confidence::Low),
                           static_cast<int>(Confidence::High));
  return static_cast<Confidence>(v);
}

// Heart rate moves roughly half as much as speed does.
HrZoneSuggestion scale_hr(const HrZoneSuggestion& z, double r, const char* suffix) {
  HrZoneSuggestion out = z;
  const double k = 1.0 + 0.5 * (r - 1.0);
  out.min_bpm = std::clamp(std::round(z.min_bpm * k), 50.0, 220.0);
  out.max_bpm = std::clamp(std::round(z.max_bpm * k), 50.0, 220.0);
  if (suffix) out.reasoning += suffix;
  return out;
}

PowerZoneSuggestion scale_power(const PowerZoneSuggestion& z, double r, const char* suffix) {
  PowerZoneSuggestion out = z;
  out.min_watts = std::round(z.min_watts * r);
  out.max_watts = std::round(z.max_watts * r);
  out.pct_ftp_min = std::round(z.pct_ftp_min * r);
  out.pct_ftp_max = std::round(z.pct_ftp_max * r);
  if (suffix) out.reasoning += suffix;
  return out;
}

} // namespace

std::array<PaceStrategy, 3> generate_pace_options(double base_pace,
                                                  Confidence confidence,
                                                  const std::string& reasoning,
                                                  const std::optional<HrZoneSuggestion>& hr,
                                                  const std::optional<PowerZoneSuggestion>& power) {
  struct TierDef {
    StrategyTier tier;
    double mult;
    int conf_shift;
    const char* description;
    const char* best_for;
    const char* hr_suffix;
    const char* power_suffix;
  };
  static constexpr std::array<TierDef, 3> defs{{
    {StrategyTier::Aggressive, kAggressiveMultiplier, -1,
     "Push 7% faster than your recorded performance",
     "Optimal conditions, strong training block",
     " (pushed effort)", " (pushed watts)"},
    {StrategyTier::Balanced, kBalancedMultiplier, 0,
     "Match your proven recorded performance",
     "Similar conditions to your reference race",
     nullptr, nullptr},
    {StrategyTier::Conservative, kConservativeMultiplier, +1,
     "8% slower buffer for safety margin",
     "Tough weather, unknown terrain, first attempt",
     " (conservative effort)", " (conservative watts)"},
  }};

  std::array<PaceStrategy, 3> out{};
  for (std::size_t i = 0; i < defs.size(); ++i) {
    const auto& d = defs[i];
    auto& s = out[i];
    s.tier = d.tier;
    s.pace = base_pace * d.mult;
    s.adjustment_percent = (d.mult - 1.0) * 100.0;
    s.confidence = shift(confidence, d.conf_shift);
    s.description = d.description;
    s.best_for = d.best_for;
    s.reasoning = reasoning;

    // Speed ratio of this tier relative to the base pace.
    const double r = (s.pace > 0.0 && base_pace > 0.0) ? base_pace / s.pace : 1.0;
    if (hr) s.suggested_hr = scale_hr(*hr, r, d.hr_suffix);
    if (power) s.suggested_power = scale_power(*power, r, d.power_suffix);
  }
  return out;
}

const char* to_string(StrategyTier t) {
  switch (t) {
    case StrategyTier::Aggressive:   return "aggressive";
    case StrategyTier::Balanced:     return "balanced";
    case StrategyTier::Conservative: return "conservative";
  }
  return "balanced";
}

} // namespace upace
