#pragma once
#include <optional>
#include <string>
#include <vector>
#include <upace/athlete.hpp>
#include <upace/types.hpp>

namespace upace {

// Tuned physiological constants. Defaults sit inside published ranges
// (gut absorption 200-350 kcal/h, 6-8 g/kg glycogen storage).
struct EnergyModelConfig {
  double absorption_ceiling_kcal_per_hour = 280.0;
  double kcal_per_gram_carb = 4.0;
  double base_kcal_per_km_70kg = 60.0;
  double climb_kcal_per_100ft_70kg = 10.0;
  double descent_cost_factor = 0.4;      // fraction of climbing cost
  double glycogen_g_per_kg_recreational = 6.0;
  double glycogen_g_per_kg_trained = 7.0;
  double glycogen_g_per_kg_elite = 8.0;
  double default_pace = 15.0;            // min/mile when a segment has no distance
  int trend_window = 3;                  // segments in the worsening-deficit check
  double high_depletion_fraction = 0.20; // of capacity, per segment
};

// Running totals threaded from one segment to the next.
struct EnergyBalanceState {
  double calories_burned = 0.0;
  double calories_consumed = 0.0;
  double distance_miles = 0.0;
  double time_hours = 0.0;
  double glycogen_grams = 0.0;
  std::vector<double> recent_deficits;   // consumed - burned, oldest first
};

struct EnergyBalanceCalculation {
  double segment_calories_burned = 0.0;
  double segment_calories_consumed = 0.0;
  double segment_deficit = 0.0;          // consumed - burned
  double cumulative_deficit = 0.0;
  double glycogen_capacity_grams = 0.0;
  double estimated_glycogen_grams = 0.0;
  double estimated_glycogen_percent = 0.0;
  std::optional<double> time_to_bonk_minutes;
  BonkRisk bonk_risk = BonkRisk::None;
  std::vector<std::string> segment_warnings;
  std::vector<std::string> general_tips;
  EnergyBalanceState next;               // feed into the following segment
};

// Throws std::invalid_argument when body weight is not positive.
double glycogen_capacity_grams(const AthleteMetrics& athlete, const EnergyModelConfig& cfg = {});

// Full stores, nothing burned yet.
EnergyBalanceState initial_energy_state(const AthleteMetrics& athlete,
                                        const EnergyModelConfig& cfg = {});

double calories_burned(double distance_miles, double gain_m, double loss_m,
                       double pace_min_per_mile, const AthleteMetrics& athlete,
                       const EnergyModelConfig& cfg = {});

double calories_consumed(const std::vector<NutritionItem>& items,
                         const EnergyModelConfig& cfg = {});

// Fraction of energy drawn from fat; rises with distance and time.
double fat_oxidation_rate(double cumulative_miles, double cumulative_hours);

BonkRisk glycogen_risk(double glycogen_percent);
BonkRisk segment_deficit_risk(double burned, double consumed);

// One step of the fold. Precondition: athlete.body_weight_kg > 0,
// otherwise std::invalid_argument.
EnergyBalanceCalculation calculate_segment_energy_balance(const Segment& segment,
                                                          double segment_time_minutes,
                                                          double elevation_gain_m,
                                                          double elevation_loss_m,
                                                          const EnergyBalanceState& prev,
                                                          const AthleteMetrics& athlete,
                                                          const EnergyModelConfig& cfg = {});

struct EnergySegmentInput {
  Segment segment;
  double time_minutes = 0.0;
  double gain_m = 0.0;
  double loss_m = 0.0;
};

// Left-to-right fold over the ordered inputs, starting from full stores.
std::vector<EnergyBalanceCalculation> fold_energy_balance(const std::vector<EnergySegmentInput>& inputs,
                                                          const AthleteMetrics& athlete,
                                                          const EnergyModelConfig& cfg = {});

} // namespace upace
