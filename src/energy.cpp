#include <upace/energy.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace upace {

namespace {

void require_body_weight(const AthleteMetrics& a) {
  if (!std::isfinite(a.body_weight_kg) || a.body_weight_kg <= 0.0) {
    throw std::invalid_argument("energy model requires a positive body weight");
  }
}

BonkRisk max_risk(BonkRisk a, BonkRisk b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

BonkRisk escalate(BonkRisk r) {
  return r == BonkRisk::Critical ? r : static_cast<BonkRisk>(static_cast<int>(r) + 1);
}

// Each of the last `window` deficits is worse than the one before.
bool deficit_worsening(const std::vector<double>& d, int window) {
  if (window < 2 || d.size() < static_cast<std::size_t>(window)) return false;
  if (d.back() >= 0.0) return false;
  for (std::size_t i = d.size() - window + 1; i < d.size(); ++i) {
    if (!(d[i] < d[i - 1])) return false;
  }
  return true;
}

std::string fmt(const char* f, const std::string& name, double v) {
  char buf[192];
  std::snprintf(buf, sizeof(buf), f, name.c_str(), v);
  return buf;
}

} // namespace

double glycogen_capacity_grams(const AthleteMetrics& athlete, const EnergyModelConfig& cfg) {
  require_body_weight(athlete);
  double per_kg = cfg.glycogen_g_per_kg_trained;
  switch (athlete.fitness) {
    case FitnessLevel::Recreational: per_kg = cfg.glycogen_g_per_kg_recreational; break;
    case FitnessLevel::Trained:      per_kg = cfg.glycogen_g_per_kg_trained; break;
    case FitnessLevel::Elite:        per_kg = cfg.glycogen_g_per_kg_elite; break;
  }
  return per_kg * athlete.body_weight_kg;
}

EnergyBalanceState initial_energy_state(const AthleteMetrics& athlete,
                                        const EnergyModelConfig& cfg) {
  EnergyBalanceState s;
  s.glycogen_grams = glycogen_capacity_grams(athlete, cfg);
  return s;
}

double calories_burned(double distance_miles, double gain_m, double loss_m,
                       double pace, const AthleteMetrics& athlete,
                       const EnergyModelConfig& cfg) {
  require_body_weight(athlete);
  const double weight = (athlete.body_weight_kg + std::max(0.0, athlete.gear_weight_kg)) / 70.0;
  const double km = std::max(0.0, distance_miles) * kKmPerMile;
  const double gain_ft = std::max(0.0, gain_m) * kFeetPerMeter;
  const double loss_ft = std::max(0.0, loss_m) * kFeetPerMeter;

  const double base = cfg.base_kcal_per_km_70kg * km * weight;
  const double climb = gain_ft / 100.0 * cfg.climb_kcal_per_100ft_70kg * weight;
  const double descent = loss_ft / 100.0 * cfg.climb_kcal_per_100ft_70kg
                       * cfg.descent_cost_factor * weight;

  // Fast running costs more per km; hiking slightly less.
  double intensity = 1.0;
  if (pace > 0.0 && std::isfinite(pace)) {
    const double kmh = 60.0 / pace * kKmPerMile;
    if (kmh > 12.0)      intensity = 1.10;
    else if (kmh > 10.0) intensity = 1.05;
    else if (kmh < 6.0)  intensity = 0.95;
  }
  return (base + climb + descent) * intensity;
}

double calories_consumed(const std::vector<NutritionItem>& items, const EnergyModelConfig& cfg) {
  double kcal = 0.0;
  for (const auto& it : items) {
    if (it.carbs_per_serving > 0.0 && it.quantity > 0.0) {
      kcal += it.carbs_per_serving * it.quantity * cfg.kcal_per_gram_carb;
    }
  }
  return kcal;
}

double fat_oxidation_rate(double miles, double hours) {
  const double dist = std::min(0.40, std::max(0.0, miles) / 100.0 * 0.40);
  const double time = std::min(0.10, std::max(0.0, hours) / 12.0 * 0.10);
  return std::min(0.70, 0.30 + dist + time);
}

BonkRisk glycogen_risk(double pct) {
  if (pct >= 50.0) return BonkRisk::None;
  if (pct >= 30.0) return BonkRisk::Low;
  if (pct >= 15.0) return BonkRisk::Moderate;
  return BonkRisk::High;
}

BonkRisk segment_deficit_risk(double burned, double consumed) {
  const double deficit = consumed - burned;
  if (consumed <= 0.0 && burned > 400.0) return BonkRisk::High;
  if (consumed <= 0.0 && burned > 200.0) return BonkRisk::Moderate;
  if (deficit < -500.0) return BonkRisk::High;
  if (deficit < -400.0) return BonkRisk::Moderate;
  if (deficit < -300.0) return BonkRisk::Low;
  return BonkRisk::None;
}

EnergyBalanceCalculation calculate_segment_energy_balance(const Segment& segment,
                                                          double segment_time_minutes,
                                                          double gain_m,
                                                          double loss_m,
                                                          const EnergyBalanceState& prev,
                                                          const AthleteMetrics& athlete,
                                                          const EnergyModelConfig& cfg) {
  require_body_weight(athlete);
  const double capacity = glycogen_capacity_grams(athlete, cfg);

  const double minutes = std::isfinite(segment_time_minutes) ? std::max(0.0, segment_time_minutes) : 0.0;
  const double hours = minutes / 60.0;
  const double dist = std::max(0.0, segment.segment_distance);
  const double pace = dist > 0.0 ? minutes / dist : cfg.default_pace;

  EnergyBalanceCalculation out;
  out.segment_calories_burned = calories_burned(dist, gain_m, loss_m, pace, athlete, cfg);
  out.segment_calories_consumed = calories_consumed(segment.nutrition, cfg);
  out.segment_deficit = out.segment_calories_consumed - out.segment_calories_burned;

  EnergyBalanceState& next = out.next;
  next.calories_burned = prev.calories_burned + out.segment_calories_burned;
  next.calories_consumed = prev.calories_consumed + out.segment_calories_consumed;
  next.distance_miles = prev.distance_miles + dist;
  next.time_hours = prev.time_hours + hours;
  next.recent_deficits = prev.recent_deficits;
  next.recent_deficits.push_back(out.segment_deficit);
  const std::size_t keep = static_cast<std::size_t>(std::max(1, cfg.trend_window));
  if (next.recent_deficits.size() > keep) {
    next.recent_deficits.erase(next.recent_deficits.begin(),
                               next.recent_deficits.end() - static_cast<std::ptrdiff_t>(keep));
  }

  // Glycogen drawn this segment, less carbohydrate the gut could absorb.
  const double fat = fat_oxidation_rate(next.distance_miles, next.time_hours);
  const double drawn_kcal = out.segment_calories_burned * (1.0 - fat);
  const double absorbed_kcal = std::min(out.segment_calories_consumed,
                                        cfg.absorption_ceiling_kcal_per_hour * hours);
  const double net_kcal = drawn_kcal - absorbed_kcal;
  const double prev_grams = std::clamp(prev.glycogen_grams, 0.0, capacity);
  next.glycogen_grams = std::clamp(prev_grams - net_kcal / cfg.kcal_per_gram_carb, 0.0, capacity);

  out.cumulative_deficit = next.calories_consumed - next.calories_burned;
  out.glycogen_capacity_grams = capacity;
  out.estimated_glycogen_grams = next.glycogen_grams;
  out.estimated_glycogen_percent = capacity > 0.0 ? next.glycogen_grams / capacity * 100.0 : 0.0;

  if (net_kcal > 0.0 && hours > 0.0) {
    const double kcal_per_hour = net_kcal / hours;
    out.time_to_bonk_minutes = next.glycogen_grams * cfg.kcal_per_gram_carb / kcal_per_hour * 60.0;
  }

  BonkRisk risk = max_risk(glycogen_risk(out.estimated_glycogen_percent),
                           segment_deficit_risk(out.segment_calories_burned,
                                                out.segment_calories_consumed));
  if (deficit_worsening(next.recent_deficits, cfg.trend_window)) risk = escalate(risk);
  out.bonk_risk = risk;

  // No work done (start line), nothing to advise.
  if (out.segment_calories_burned <= 0.0) return out;

  const std::string& name = segment.checkpoint_name;
  const double deficit_abs = std::fabs(std::round(out.segment_deficit));
  if (!name.empty()) {
    switch (risk) {
      case BonkRisk::Critical:
        out.segment_warnings.push_back(fmt("Critical risk at %s (%.0f kcal deficit) - immediate action needed", name, deficit_abs));
        break;
      case BonkRisk::High:
        out.segment_warnings.push_back(fmt("High risk at %s (%.0f kcal deficit) - increase carb intake significantly", name, deficit_abs));
        break;
      case BonkRisk::Moderate:
        out.segment_warnings.push_back(fmt("Moderate risk at %s (%.0f kcal deficit) - increase nutrition intake", name, deficit_abs));
        break;
      case BonkRisk::Low:
        out.segment_warnings.push_back(fmt("Low risk at %s (%.0f kcal deficit) - maintain nutrition intake", name, deficit_abs));
        break;
      case BonkRisk::None:
        break;
    }
    const double used = prev_grams - next.glycogen_grams;
    if (used > cfg.high_depletion_fraction * capacity) {
      out.segment_warnings.push_back(fmt("High glycogen depletion on %s (%.0f g)", name, used));
    }
  }

  if (risk == BonkRisk::Critical) {
    out.general_tips.push_back("CRITICAL: Glycogen nearly depleted - increase carb intake immediately");
    out.general_tips.push_back("Consider slowing pace to reduce energy expenditure");
  }
  if (hours > 0.0 && out.segment_calories_consumed / hours > cfg.absorption_ceiling_kcal_per_hour) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "Intake of %.0f kcal/h exceeds the ~%.0f kcal/h absorption limit; extra carbs will not slow depletion",
                  out.segment_calories_consumed / hours, cfg.absorption_ceiling_kcal_per_hour);
    out.general_tips.push_back(buf);
  }
  return out;
}

std::vector<EnergyBalanceCalculation> fold_energy_balance(const std::vector<EnergySegmentInput>& inputs,
                                                          const AthleteMetrics& athlete,
                                                          const EnergyModelConfig& cfg) {
  std::vector<EnergyBalanceCalculation> out;
  out.reserve(inputs.size());
  EnergyBalanceState state = initial_energy_state(athlete, cfg);
  for (const auto& in : inputs) {
    out.push_back(calculate_segment_energy_balance(in.segment, in.time_minutes,
                                                   in.gain_m, in.loss_m, state, athlete, cfg));
    state = out.back().next;
  }
  return out;
}

} // namespace upace
