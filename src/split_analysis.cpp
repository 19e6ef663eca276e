#include <upace/split_analysis.hpp>
#include <upace/elevation.hpp>
#include <upace/gap.hpp>
#include <upace/geo.hpp>
#include <upace/segments.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace upace {

namespace {

bool activity_has_gps(const std::vector<ActivityRecord>& a) {
  if (a.empty()) return false;
  return std::all_of(a.begin(), a.end(),
                     [](const ActivityRecord& r){ return r.lat && r.lng; });
}

std::size_t nearest_by_distance(const std::vector<ActivityRecord>& a, double d) {
  auto it = std::lower_bound(a.begin(), a.end(), d,
                             [](const ActivityRecord& r, double v){ return r.distance < v; });
  if (it == a.end()) return a.size() - 1;
  const auto idx = static_cast<std::size_t>(std::distance(a.begin(), it));
  if (idx > 0 && d - a[idx - 1].distance < it->distance - d) return idx - 1;
  return idx;
}

double planned_pace_for(const Segment& s, const SplitOptions& opt) {
  if (s.custom_pace && *s.custom_pace > 0.0) return *s.custom_pace;
  if (s.predicted_time_minutes && *s.predicted_time_minutes > 0.0 && s.segment_distance > 0.0)
    return *s.predicted_time_minutes / s.segment_distance;
  return opt.default_planned_pace;
}

EffortLevel effort_for(double hr, double max_hr) {
  const double pct = hr / max_hr * 100.0;
  if (pct < 70.0) return EffortLevel::Easy;
  if (pct < 80.0) return EffortLevel::Moderate;
  if (pct < 90.0) return EffortLevel::Hard;
  return EffortLevel::Maximal;
}

double mean(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  double s = 0.0;
  for (double x : v) s += x;
  return s / static_cast<double>(v.size());
}

double stddev(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  const double m = mean(v);
  double s = 0.0;
  for (double x : v) s += (x - m) * (x - m);
  return std::sqrt(s / static_cast<double>(v.size()));
}

std::string format1(const char* f, double v) {
  char buf[128];
  std::snprintf(buf, sizeof(buf), f, v);
  return buf;
}

} // namespace

std::vector<std::size_t> align_checkpoints(const std::vector<Segment>& ordered,
                                           const std::vector<ActivityRecord>& activity) {
  std::vector<std::size_t> idx;
  if (activity.empty()) return idx;
  idx.reserve(ordered.size());

  std::vector<TrackPoint> path;
  if (activity_has_gps(activity)) {
    path.reserve(activity.size());
    for (const auto& r : activity) path.push_back({r.distance, r.elevation, *r.lat, *r.lng});
  }

  std::size_t from = 0;
  for (const auto& s : ordered) {
    std::size_t i = 0;
    if (!path.empty() && s.has_gps()) {
      i = find_closest_track_point(*s.latitude, *s.longitude, path, from).value_or(from);
    } else {
      i = nearest_by_distance(activity, s.cumulative_distance);
    }
    i = std::max(i, from);
    idx.push_back(i);
    from = i;
  }
  return idx;
}

std::vector<CheckpointSplit> calculate_split_analysis(const std::vector<Segment>& segments,
                                                      const std::vector<ActivityRecord>& activity,
                                                      const SplitOptions& opt) {
  std::vector<CheckpointSplit> out;
  if (activity.empty()) return out;
  const auto ordered = ordered_segments(segments);
  if (!ordered) return out;

  const auto ends = align_checkpoints(*ordered, activity);
  std::size_t start = 0;
  for (std::size_t i = 0; i < ordered->size(); ++i) {
    const Segment& s = (*ordered)[i];
    const std::size_t end = ends[i];
    const std::size_t first = start;
    start = end;
    if (s.segment_distance < opt.min_segment_distance) continue;
    if (end <= first) continue;

    CheckpointSplit sp;
    sp.segment_index = i;
    sp.checkpoint_name = s.checkpoint_name;
    sp.segment_distance = s.segment_distance;
    sp.cumulative_distance = s.cumulative_distance;
    sp.start_record = first;
    sp.end_record = end;

    std::vector<double> hrs, pws;
    for (std::size_t k = first; k <= end; ++k) {
      const auto& r = activity[k];
      if (k > first) {
        const double run = r.distance - activity[k - 1].distance;
        if (run > 0.0 && r.pace > 0.0 && std::isfinite(r.pace)) sp.actual_time += run * r.pace;
        const double dz = r.elevation - activity[k - 1].elevation;
        if (dz > 0.0) sp.elevation_gain_m += dz;
        else          sp.elevation_loss_m -= dz;
      }
      if (r.heart_rate && *r.heart_rate > 0.0) hrs.push_back(*r.heart_rate);
      if (r.power && *r.power > 0.0) pws.push_back(*r.power);
    }

    sp.planned_pace = planned_pace_for(s, opt);
    sp.planned_time = sp.segment_distance * sp.planned_pace;
    sp.actual_pace = sp.actual_time / sp.segment_distance;
    sp.time_difference = sp.actual_time - sp.planned_time;
    sp.pace_variance = (sp.actual_pace - sp.planned_pace) / sp.planned_pace * 100.0;

    if (!hrs.empty()) {
      sp.avg_heart_rate = mean(hrs);
      sp.max_heart_rate = *std::max_element(hrs.begin(), hrs.end());
      sp.effort = effort_for(*sp.avg_heart_rate, opt.max_heart_rate);
    }
    if (!pws.empty()) sp.avg_power = mean(pws);

    sp.avg_grade = gradient_percent(sp.elevation_gain_m - sp.elevation_loss_m, sp.segment_distance);
    sp.planned_gap = grade_adjusted_pace(sp.planned_pace, sp.avg_grade);
    if (auto g = segment_gap(activity, activity[first].distance, activity[end].distance)) {
      sp.avg_gap = g->avg_gap;
      sp.gap_variance = g->gap_variance;
    }

    const double expected = sp.planned_pace * (1.0 + static_cast<double>(i) * 0.02);
    sp.fatigue_index = (sp.actual_pace - expected) / expected * 100.0;
    out.push_back(std::move(sp));
  }
  return out;
}

std::optional<RaceAnalytics> calculate_race_analytics(const std::vector<Segment>& segments,
                                                      const std::vector<ActivityRecord>& activity,
                                                      const SplitOptions& opt) {
  auto splits = calculate_split_analysis(segments, activity, opt);
  if (splits.empty()) return std::nullopt;

  RaceAnalytics ra;
  std::vector<double> paces, planned, hrs;
  for (const auto& s : splits) {
    ra.total_planned_time += s.planned_time;
    ra.total_actual_time += s.actual_time;
    paces.push_back(s.actual_pace);
    planned.push_back(s.planned_pace);
    if (s.avg_heart_rate) hrs.push_back(*s.avg_heart_rate);
  }
  ra.time_difference = ra.total_actual_time - ra.total_planned_time;
  ra.avg_pace = mean(paces);
  ra.avg_planned_pace = mean(planned);
  ra.pace_variance = ra.avg_planned_pace > 0.0
                   ? (ra.avg_pace - ra.avg_planned_pace) / ra.avg_planned_pace * 100.0 : 0.0;
  if (!hrs.empty()) {
    ra.avg_heart_rate = mean(hrs);
    ra.avg_hr_zone = std::clamp(static_cast<int>(std::floor(*ra.avg_heart_rate / opt.max_heart_rate * 5.0)) + 1, 1, 5);
  }

  // Score: closeness to plan averaged with pacing consistency.
  const double pace_score = std::max(0.0, 100.0 - std::fabs(ra.pace_variance));
  double consistency_score = 100.0;
  if (paces.size() >= 2 && ra.avg_pace > 0.0) {
    const double cv = stddev(paces) / ra.avg_pace * 100.0;
    consistency_score = std::max(0.0, 100.0 - cv * 10.0);
  }
  ra.efficiency_score = static_cast<int>(std::lround((pace_score + consistency_score) / 2.0));
  ra.efficiency_grade = ra.efficiency_score >= 90 ? 'A'
                      : ra.efficiency_score >= 80 ? 'B'
                      : ra.efficiency_score >= 70 ? 'C'
                      : ra.efficiency_score >= 60 ? 'D' : 'F';

  if (paces.size() >= 2) {
    const std::size_t half = paces.size() / 2;
    const std::vector<double> first(paces.begin(), paces.begin() + static_cast<std::ptrdiff_t>(half));
    const std::vector<double> second(paces.begin() + static_cast<std::ptrdiff_t>(half), paces.end());
    ra.negative_split = mean(second) < mean(first);
  }

  const double sd = stddev(paces);
  ra.pacing_consistency = sd < 0.5 ? PacingConsistency::Excellent
                        : sd < 1.0 ? PacingConsistency::Good
                        : sd < 1.5 ? PacingConsistency::Fair : PacingConsistency::Poor;

  const double hours = ra.total_actual_time / 60.0;
  if (paces.size() >= 2 && hours > 0.0 && paces.front() > 0.0) {
    ra.fade_rate_per_hour = (paces.back() - paces.front()) / paces.front() * 100.0 / hours;
  }

  if (ra.fade_rate_per_hour > 5.0) {
    ra.insights.push_back({InsightCategory::Pacing, InsightPriority::High,
                           "Significant pace degradation detected",
                           "Consider starting more conservatively to maintain energy",
                           format1("Your pace dropped by %.1f%% per hour", ra.fade_rate_per_hour)});
  }
  if (!ra.negative_split && splits.size() > 4) {
    ra.insights.push_back({InsightCategory::Strategy, InsightPriority::Medium,
                           "Positive split pacing strategy",
                           "Try maintaining consistent effort for better overall time",
                           "You started faster than you finished"});
  }
  const auto erratic = std::count_if(splits.begin(), splits.end(),
                                     [](const CheckpointSplit& s){ return std::fabs(s.pace_variance) > 20.0; });
  if (static_cast<double>(erratic) > static_cast<double>(splits.size()) * 0.3) {
    ra.insights.push_back({InsightCategory::Nutrition, InsightPriority::Medium,
                           "Inconsistent pacing suggests energy management issues",
                           "Review nutrition strategy for more consistent energy",
                           format1("%.0f segments had >20%% pace variance", static_cast<double>(erratic))});
  }
  if (ra.avg_heart_rate && *ra.avg_heart_rate > 165.0) {
    ra.insights.push_back({InsightCategory::Training, InsightPriority::Medium,
                           "High average heart rate for ultra distance",
                           "Consider more aerobic base training",
                           format1("Average HR: %.0f bpm", *ra.avg_heart_rate)});
  }
  const auto tired = std::count_if(splits.begin(), splits.end(),
                                   [](const CheckpointSplit& s){ return s.fatigue_index > 10.0; });
  if (tired > 0) {
    ra.insights.push_back({InsightCategory::Recovery, InsightPriority::Low,
                           "Fatigue accumulated in later segments",
                           "Focus on recovery strategies and checkpoint rest times",
                           format1("%.0f segments showed elevated fatigue", static_cast<double>(tired))});
  }

  ra.splits = std::move(splits);
  return ra;
}

const char* to_string(EffortLevel e) {
  switch (e) {
    case EffortLevel::Easy:     return "easy";
    case EffortLevel::Moderate: return "moderate";
    case EffortLevel::Hard:     return "hard";
    case EffortLevel::Maximal:  return "maximal";
  }
  return "easy";
}

const char* to_string(PacingConsistency p) {
  switch (p) {
    case PacingConsistency::Excellent: return "Excellent";
    case PacingConsistency::Good:      return "Good";
    case PacingConsistency::Fair:      return "Fair";
    case PacingConsistency::Poor:      return "Poor";
  }
  return "Poor";
}

const char* to_string(InsightCategory c) {
  switch (c) {
    case InsightCategory::Pacing:    return "pacing";
    case InsightCategory::Strategy:  return "strategy";
    case InsightCategory::Nutrition: return "nutrition";
    case InsightCategory::Training:  return "training";
    case InsightCategory::Recovery:  return "recovery";
  }
  return "pacing";
}

const char* to_string(InsightPriority p) {
  switch (p) {
    case InsightPriority::High:   return "high";
    case InsightPriority::Medium: return "medium";
    case InsightPriority::Low:    return "low";
  }
  return "low";
}

} // namespace upace
