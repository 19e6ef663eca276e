#include <upace/pace_model.hpp>
#include <upace/gap.hpp>
#include <upace/segments.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace upace {

namespace {

ElevationDetails elevation_details_for(const Segment& s, const std::vector<TrackPoint>& track) {
  ElevationDetails d;
  const double start = segment_start_distance(s);
  const double end = s.cumulative_distance;
  if (auto st = segment_elevation(track, start, end)) {
    d.gain_m = st->gain_m;
    d.loss_m = st->loss_m;
    d.avg_gradient = gradient_percent(st->net_m, st->covered_miles);
    d.has_course_data = true;
  }
  if (!std::isfinite(d.avg_gradient)) d.avg_gradient = 0.0;
  d.climb = classify_climb(d.avg_gradient, d.gain_m);
  return d;
}

PaceDerivation fallback(const Segment& s, std::size_t idx, ElevationDetails det,
                        const PaceModelConfig& cfg, const char* why) {
  PaceDerivation out;
  out.segment_index = idx;
  out.pace = s.custom_pace && std::isfinite(*s.custom_pace) && *s.custom_pace > 0.0
               ? *s.custom_pace : cfg.fallback_pace;
  out.confidence = Confidence::Low;
  out.elevation_details = det;
  char buf[160];
  std::snprintf(buf, sizeof(buf), "%s; using default %.2f min/mi", why, out.pace);
  out.reasoning = buf;
  return out;
}

Confidence grade_confidence(const GradientMatch& m, const PaceModelConfig& cfg) {
  if (m.samples >= cfg.high_confidence_samples && m.gradient_gap < cfg.high_confidence_gap
      && !m.low_confidence && !m.interpolated) {
    return Confidence::High;
  }
  if (m.samples >= cfg.profile.min_samples) return Confidence::Medium;
  return Confidence::Low;
}

HrZoneSuggestion observed_hr(double bpm) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "Observed %.0f bpm at this gradient", bpm);
  return HrZoneSuggestion{std::round(bpm - 5.0), std::round(bpm + 5.0), "Observed", buf};
}

PowerZoneSuggestion observed_power(double watts) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "Observed %.0f W at this gradient", watts);
  PowerZoneSuggestion p;
  p.min_watts = std::round(watts * 0.95);
  p.max_watts = std::round(watts * 1.05);
  p.zone_name = "Observed";
  p.reasoning = buf;
  return p;
}

} // namespace

PaceDerivation derive_segment_pace(const Segment& segment,
                                   std::size_t segment_index,
                                   const GradientProfile& profile,
                                   const std::vector<TrackPoint>& track,
                                   const std::vector<ActivityRecord>& activity,
                                   const PaceModelConfig& cfg,
                                   const AthleteMetrics* athlete) {
  const ElevationDetails det = elevation_details_for(segment, track);

  if (activity.empty() || profile.empty())
    return fallback(segment, segment_index, det, cfg, "No usable activity data");
  if (!(segment.segment_distance > 0.0))
    return fallback(segment, segment_index, det, cfg, "Zero-length segment");

  const auto match = match_gradient(profile, det.avg_gradient);
  if (!match || !(match->pace > 0.0))
    return fallback(segment, segment_index, det, cfg, "No populated gradient bucket");

  // Scale the observed pace by the relative energy cost of the two grades.
  const double ratio = grade_cost_multiplier(det.avg_gradient) /
                       grade_cost_multiplier(match->reference_gradient);
  const double bound = std::clamp(cfg.max_extrapolation, 0.0, 1.0);
  double pace = match->pace * std::clamp(ratio, 1.0 - bound, 1.0 + bound);
  if (segment.terrain_factor && *segment.terrain_factor > 0.0) {
    pace *= *segment.terrain_factor;
  }
  if (!std::isfinite(pace) || pace <= 0.0)
    return fallback(segment, segment_index, det, cfg, "Non-finite pace estimate");

  PaceDerivation out;
  out.segment_index = segment_index;
  out.pace = pace;
  out.confidence = det.has_course_data ? grade_confidence(*match, cfg) : Confidence::Low;
  out.elevation_details = det;

  char buf[256];
  if (det.has_course_data) {
    std::snprintf(buf, sizeof(buf),
                  "%s %.1f%% grade, %.0f m gain; %s bucket at %.1f%% (%d samples)",
                  to_string(det.climb), det.avg_gradient, det.gain_m,
                  match->interpolated ? "interpolated" : "matched",
                  match->reference_gradient, match->samples);
  } else {
    std::snprintf(buf, sizeof(buf),
                  "No course elevation data, assuming flat; %s bucket at %.1f%% (%d samples)",
                  match->interpolated ? "interpolated" : "matched",
                  match->reference_gradient, match->samples);
  }
  out.reasoning = buf;
  if (segment.terrain_factor && *segment.terrain_factor > 0.0) {
    std::snprintf(buf, sizeof(buf), "; terrain x%.2f", *segment.terrain_factor);
    out.reasoning += buf;
  }

  const double cum_start = segment_start_distance(segment);
  if (match->heart_rate && std::isfinite(*match->heart_rate)) {
    if (auto z = derive_hr_zones(activity, athlete)) {
      out.suggested_hr = suggest_hr_zone(det.avg_gradient, cum_start, *z);
    } else {
      out.suggested_hr = observed_hr(*match->heart_rate);
    }
  }
  if (match->power && std::isfinite(*match->power)) {
    if (auto z = derive_power_zones(activity, athlete)) {
      out.suggested_power = suggest_power_zone(det.avg_gradient, cum_start, *z);
    } else {
      out.suggested_power = observed_power(*match->power);
    }
  }
  return out;
}

} // namespace upace
