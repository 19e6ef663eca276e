#pragma once
#include <array>
#include <optional>
#include <vector>
#include <upace/athlete.hpp>
#include <upace/eccentric.hpp>
#include <upace/energy.hpp>
#include <upace/gradient_profile.hpp>
#include <upace/pace_model.hpp>
#include <upace/race_summary.hpp>
#include <upace/strategy.hpp>
#include <upace/types.hpp>

namespace upace {

struct PlanOptions {
  PaceModelConfig pace;
  EnergyModelConfig energy;
  std::optional<double> fatigue_factor;  // percent per 10 miles; estimated when unset
  StrategyTier tier = StrategyTier::Balanced;
  bool use_custom_pace = true;           // a segment's custom pace overrides the model
};

struct SegmentPlan {
  Segment segment;                       // predicted_time_minutes filled in
  PaceDerivation derivation;
  std::array<PaceStrategy, 3> strategies{};
  double pace = 0.0;                     // chosen tier (or custom) pace, min/mile
  double start_distance = 0.0;
  double minutes_without_fatigue = 0.0;
  double minutes_with_fatigue = 0.0;
  double gain_m = 0.0;
  double loss_m = 0.0;
  SegmentEccentricAnalysis eccentric;
  std::optional<EnergyBalanceCalculation> energy;
};

struct RacePlan {
  std::vector<SegmentPlan> segments;
  GradientProfile profile;
  double fatigue_factor = 0.0;
  double total_minutes_without_fatigue = 0.0;
  double total_minutes_with_fatigue = 0.0;
  RaceTimeSummary summary;               // running + checkpoint stop times
  RaceEccentricSummary eccentric;        // descent load over the whole course
};

// Full pipeline: order/validate segments, build the gradient profile,
// derive pace and strategies per segment, integrate fatigue over each
// segment's course range, score descent load and fold the energy
// balance when an athlete with a valid body weight is supplied.
// nullopt when the segments violate cumulative-distance ordering.
std::optional<RacePlan> build_race_plan(const std::vector<TrackPoint>& track,
                                        const std::vector<Segment>& segments,
                                        const std::vector<ActivityRecord>& activity,
                                        const AthleteMetrics* athlete = nullptr,
                                        const PlanOptions& opt = {});

} // namespace upace
