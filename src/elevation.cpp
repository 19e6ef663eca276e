#include <upace/elevation.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace upace {

namespace {

// Linear elevation at distance d; it must lie within (*prev, *next].
double elevation_between(const TrackPoint& prev, const TrackPoint& next, double d) {
  const double run = next.distance - prev.distance;
  if (run <= 0.0) return next.elevation;
  return prev.elevation + (next.elevation - prev.elevation) * (d - prev.distance) / run;
}

double elevation_at(const std::vector<TrackPoint>& points, double d) {
  auto it = std::lower_bound(points.begin(), points.end(), d,
                             [](const TrackPoint& p, double x){ return p.distance < x; });
  if (it == points.begin()) return it->elevation;
  if (it == points.end()) return points.back().elevation;
  return elevation_between(*std::prev(it), *it, d);
}

} // namespace

std::optional<ElevationStats> segment_elevation(const std::vector<TrackPoint>& points,
                                                double start_miles,
                                                double end_miles) {
  if (end_miles < start_miles) std::swap(start_miles, end_miles);
  if (points.size() < 2) return std::nullopt;

  // Clip to the recorded course; a window entirely outside it has no data.
  const double lo = std::max(start_miles, points.front().distance);
  const double hi = std::min(end_miles, points.back().distance);
  if (!(hi > lo)) return std::nullopt;

  // Points are distance-ordered; binary search the strictly interior ones.
  auto first = std::upper_bound(points.begin(), points.end(), lo,
                                [](double d, const TrackPoint& p){ return d < p.distance; });
  auto last = std::lower_bound(first, points.end(), hi,
                               [](const TrackPoint& p, double d){ return p.distance < d; });

  std::vector<double> profile;
  profile.reserve(static_cast<std::size_t>(std::distance(first, last)) + 2);
  profile.push_back(elevation_at(points, lo));
  for (auto it = first; it != last; ++it) profile.push_back(it->elevation);
  profile.push_back(elevation_at(points, hi));

  ElevationStats st;
  st.covered_miles = hi - lo;
  st.min_m = profile.front();
  st.max_m = profile.front();
  for (std::size_t i = 1; i < profile.size(); ++i) {
    const double dz = profile[i] - profile[i - 1];
    if (dz > 0.0) st.gain_m += dz;
    else          st.loss_m -= dz;
    st.min_m = std::min(st.min_m, profile[i]);
    st.max_m = std::max(st.max_m, profile[i]);
  }
  st.net_m = st.gain_m - st.loss_m;
  return st;
}

double gradient_percent(double rise_m, double run_miles) {
  if (run_miles <= 0.0) return 0.0;
  return rise_m / (run_miles * kMetersPerMile) * 100.0;
}

ClimbType classify_climb(double gradient, double gain_m) {
  const double g = std::fabs(gradient);
  if (gain_m * kFeetPerMeter < 50.0) return ClimbType::FlatRolling;
  if (g >= 15.0) return ClimbType::VerySteep;
  if (g >= 10.0) return ClimbType::Steep;
  if (g >= 6.0)  return ClimbType::ModerateSteep;
  if (g >= 3.0)  return ClimbType::Moderate;
  if (g >= 1.0)  return ClimbType::Gradual;
  return ClimbType::FlatRolling;
}

const char* to_string(ClimbType c) {
  switch (c) {
    case ClimbType::VerySteep:     return "Very Steep";
    case ClimbType::Steep:         return "Steep";
    case ClimbType::ModerateSteep: return "Moderate-Steep";
    case ClimbType::Moderate:      return "Moderate";
    case ClimbType::Gradual:       return "Gradual";
    case ClimbType::FlatRolling:   return "Flat/Rolling";
  }
  return "Flat/Rolling";
}

} // namespace upace
