#include <upace/planner.hpp>
#include <upace/elevation.hpp>
#include <upace/fatigue.hpp>
#include <upace/segments.hpp>
#include <cmath>

namespace upace {

static inline bool energy_modelable(const AthleteMetrics* a) {
  return a && std::isfinite(a->body_weight_kg) && a->body_weight_kg > 0.0;
}

std::optional<RacePlan> build_race_plan(const std::vector<TrackPoint>& track,
                                        const std::vector<Segment>& segments,
                                        const std::vector<ActivityRecord>& activity,
                                        const AthleteMetrics* athlete,
                                        const PlanOptions& opt) {
  const auto ordered = ordered_segments(segments);
  if (!ordered) return std::nullopt;

  RacePlan plan;
  plan.profile = build_gradient_profile(activity, opt.pace.profile);
  plan.fatigue_factor = opt.fatigue_factor ? *opt.fatigue_factor
                                           : estimate_fatigue_factor(activity);
  if (!std::isfinite(plan.fatigue_factor) || plan.fatigue_factor < 0.0) {
    plan.fatigue_factor = kDefaultFatigueFactor;
  }

  plan.segments.reserve(ordered->size());
  for (std::size_t i = 0; i < ordered->size(); ++i) {
    SegmentPlan sp;
    sp.segment = (*ordered)[i];
    sp.derivation = derive_segment_pace(sp.segment, i, plan.profile, track, activity,
                                        opt.pace, athlete);
    const auto& d = sp.derivation;
    sp.strategies = generate_pace_options(d.pace, d.confidence, d.reasoning,
                                          d.suggested_hr, d.suggested_power);

    sp.pace = sp.strategies[static_cast<std::size_t>(opt.tier)].pace;
    if (opt.use_custom_pace && sp.segment.custom_pace && *sp.segment.custom_pace > 0.0) {
      sp.pace = *sp.segment.custom_pace;
    }

    sp.start_distance = segment_start_distance(sp.segment);
    sp.minutes_without_fatigue = sp.pace * sp.segment.segment_distance;
    sp.minutes_with_fatigue = segment_time_with_fatigue(sp.pace, sp.start_distance,
                                                        sp.segment.cumulative_distance,
                                                        plan.fatigue_factor);
    sp.gain_m = d.elevation_details.gain_m;
    sp.loss_m = d.elevation_details.loss_m;
    sp.segment.predicted_time_minutes = sp.minutes_with_fatigue;
    sp.eccentric = analyze_segment_eccentric_load(d.elevation_details.avg_gradient,
                                                  sp.segment.segment_distance, sp.loss_m);

    plan.total_minutes_without_fatigue += sp.minutes_without_fatigue;
    plan.total_minutes_with_fatigue += sp.minutes_with_fatigue;
    plan.segments.push_back(std::move(sp));
  }

  if (energy_modelable(athlete)) {
    std::vector<EnergySegmentInput> inputs;
    inputs.reserve(plan.segments.size());
    for (const auto& sp : plan.segments) {
      inputs.push_back({sp.segment, sp.minutes_with_fatigue, sp.gain_m, sp.loss_m});
    }
    auto balance = fold_energy_balance(inputs, *athlete, opt.energy);
    for (std::size_t i = 0; i < balance.size(); ++i) {
      plan.segments[i].energy = std::move(balance[i]);
    }
  }

  std::vector<EccentricSegmentInput> descents;
  descents.reserve(plan.segments.size());
  for (const auto& sp : plan.segments) {
    descents.push_back({sp.eccentric.gradient, sp.eccentric.distance_miles, sp.eccentric.loss_m});
  }
  plan.eccentric = calculate_race_eccentric_summary(descents);

  std::vector<Segment> planned;
  planned.reserve(plan.segments.size());
  for (const auto& sp : plan.segments) planned.push_back(sp.segment);
  plan.summary = calculate_race_time_summary(planned);
  return plan;
}

} // namespace upace
