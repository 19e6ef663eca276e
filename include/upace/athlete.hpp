#pragma once
#include <optional>
#include <string>
#include <vector>

namespace upace {

enum class FitnessLevel : int { Recreational = 0, Trained = 1, Elite = 2 };

struct AthleteMetrics {
  double body_weight_kg = 0.0;
  double gear_weight_kg = 0.0;
  FitnessLevel fitness = FitnessLevel::Trained;
  std::optional<double> max_hr;      // overrides detection from the recording
  std::optional<double> resting_hr;
  std::optional<double> ftp;         // watts
};

struct AthleteProfile {
  std::string key;                   // e.g., "default"
  AthleteMetrics metrics;
};

// Built-in tiny catalog (default/fallback).
const std::vector<AthleteProfile>& athlete_catalog();

std::optional<AthleteProfile> athlete_by_key(const std::string& key);
std::optional<AthleteProfile> athlete_by_key_in(const std::vector<AthleteProfile>& cat,
                                                const std::string& key);

// Case-insensitive "recreational" / "trained" / "elite".
std::optional<FitnessLevel> parse_fitness_level(const std::string& s);
const char* to_string(FitnessLevel f);

} // namespace upace
