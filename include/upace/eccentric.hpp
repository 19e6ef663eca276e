#pragma once
#include <string>
#include <vector>
#include <upace/types.hpp>

namespace upace {

// Lower bounds (percent grade) of the descent categories.
inline constexpr double kEasyDescent      = -6.0;
inline constexpr double kModerateDescent  = -10.0;
inline constexpr double kTechnicalDescent = -15.0;
inline constexpr double kExtremeDescent   = -20.0;

enum class DescentCategory : int { Easy = 0, Moderate, Technical, Extreme };

struct DescentStrategy {
  DescentCategory category = DescentCategory::Easy;
  double gradient = 0.0;
  const char* advice = "";
  double pace_multiplier = 1.0;  // advisory, on top of any terrain factor
};

DescentStrategy descent_strategy(double gradient_percent);

// 0..100. Grade severity (steeper past -10%) times distance (capped at
// 5 miles) times elevation loss (capped at ~3000 ft). 0 for non-descents.
double segment_eccentric_score(double gradient_percent, double distance_miles, double loss_m);

struct SegmentEccentricAnalysis {
  double gradient = 0.0;
  double distance_miles = 0.0;
  double loss_m = 0.0;
  double score = 0.0;
  DescentStrategy strategy;
  std::vector<std::string> warnings;
};

SegmentEccentricAnalysis analyze_segment_eccentric_load(double gradient_percent,
                                                        double distance_miles,
                                                        double loss_m);

enum class EccentricLoadLevel : int { Low = 0, Moderate, High, Extreme };

// Race total score: <100 low, <250 moderate, <500 high, else extreme.
EccentricLoadLevel eccentric_load_level(double total_score);
const char* load_message(EccentricLoadLevel l);
const char* training_advice(EccentricLoadLevel l);

struct EccentricSegmentInput {
  double gradient = 0.0;        // percent
  double distance_miles = 0.0;
  double loss_m = 0.0;
};

struct RaceEccentricSummary {
  double total_loss_m = 0.0;    // descending segments only
  double total_score = 0.0;
  EccentricLoadLevel level = EccentricLoadLevel::Low;
  int steep_descent_segments = 0;    // steeper than -10%
  int extreme_descent_segments = 0;  // steeper than -15%
  std::vector<std::string> recommendations;
};

RaceEccentricSummary calculate_race_eccentric_summary(const std::vector<EccentricSegmentInput>& segments);

const char* to_string(DescentCategory c);
const char* to_string(EccentricLoadLevel l);

} // namespace upace
