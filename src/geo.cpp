#include <upace/geo.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace upace {

static constexpr double kDegToRad = std::numbers::pi_v<double> / 180.0;

double haversine_miles(double lat1, double lon1, double lat2, double lon2) {
  const double dlat = (lat2 - lat1) * kDegToRad;
  const double dlon = (lon2 - lon1) * kDegToRad;
  const double s_lat = std::sin(dlat / 2.0);
  const double s_lon = std::sin(dlon / 2.0);
  double a = s_lat * s_lat +
             std::cos(lat1 * kDegToRad) * std::cos(lat2 * kDegToRad) * s_lon * s_lon;
  // Rounding can push a marginally outside [0,1] for antipodal points.
  a = std::clamp(a, 0.0, 1.0);
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadiusMiles * c;
}

double bearing_deg(double lat1, double lon1, double lat2, double lon2) {
  const double p1 = lat1 * kDegToRad;
  const double p2 = lat2 * kDegToRad;
  const double dl = (lon2 - lon1) * kDegToRad;
  const double y = std::sin(dl) * std::cos(p2);
  const double x = std::cos(p1) * std::sin(p2) - std::sin(p1) * std::cos(p2) * std::cos(dl);
  const double theta = std::atan2(y, x) / kDegToRad;
  return std::fmod(theta + 360.0, 360.0);
}

std::optional<std::size_t> find_closest_track_point(double target_lat, double target_lon,
                                                    const std::vector<TrackPoint>& points,
                                                    std::size_t search_start) {
  if (search_start >= points.size()) return std::nullopt;
  double best_m = std::numeric_limits<double>::infinity();
  std::size_t best = search_start;

  for (std::size_t i = search_start; i < points.size(); ++i) {
    const double d_m = haversine_miles(target_lat, target_lon,
                                       points[i].lat, points[i].lng) * kMetersPerMile;
    if (d_m < best_m) {
      best_m = d_m;
      best = i;
    }
    if (best_m < kEarlyExitMeters && d_m > best_m * 2.0) break;
  }
  return best;
}

std::vector<RouteSegment> split_track_by_checkpoints(const std::vector<TrackPoint>& points,
                                                     const std::vector<Segment>& segments) {
  std::vector<RouteSegment> out;
  if (points.empty()) return out;

  std::vector<const Segment*> checkpoints;
  for (const auto& s : segments) {
    if (s.has_gps()) checkpoints.push_back(&s);
  }
  std::stable_sort(checkpoints.begin(), checkpoints.end(),
                   [](const Segment* a, const Segment* b){ return a->order < b->order; });

  if (checkpoints.empty()) {
    out.push_back(RouteSegment{points, 0, std::nullopt});
    return out;
  }

  struct Match { std::size_t index; const Segment* seg; };
  std::vector<Match> matches;
  matches.reserve(checkpoints.size());
  std::size_t search_from = 0;
  for (const Segment* cp : checkpoints) {
    const std::size_t idx = find_closest_track_point(*cp->latitude, *cp->longitude,
                                                     points, search_from).value_or(search_from);
    matches.push_back({idx, cp});
    search_from = idx;
  }
  std::stable_sort(matches.begin(), matches.end(),
                   [](const Match& a, const Match& b){ return a.index < b.index; });

  std::size_t start = 0;
  for (std::size_t i = 0; i < matches.size(); ++i) {
    const std::size_t end = matches[i].index;
    if (end > start) {
      RouteSegment rs;
      rs.points.assign(points.begin() + static_cast<std::ptrdiff_t>(start),
                       points.begin() + static_cast<std::ptrdiff_t>(end) + 1);
      rs.segment_index = i;
      rs.checkpoint_name = matches[i].seg->checkpoint_name;
      out.push_back(std::move(rs));
    }
    start = end;
  }

  if (start + 1 < points.size()) {
    RouteSegment tail;
    tail.points.assign(points.begin() + static_cast<std::ptrdiff_t>(start), points.end());
    tail.segment_index = out.size();
    out.push_back(std::move(tail));
  }

  // Every checkpoint collapsed onto a single point (e.g. one-point track).
  if (out.empty()) {
    out.push_back(RouteSegment{points, 0, std::nullopt});
  }
  return out;
}

std::vector<TrackPoint> sample_track_points(const std::vector<TrackPoint>& points,
                                            double interval_miles) {
  if (points.size() < 2) return points;

  std::vector<TrackPoint> out;
  out.push_back(points.front());
  double acc = 0.0;
  std::size_t last_emitted = 0;
  for (std::size_t i = 1; i < points.size(); ++i) {
    acc += haversine_miles(points[i-1].lat, points[i-1].lng, points[i].lat, points[i].lng);
    if (acc >= interval_miles) {
      out.push_back(points[i]);
      last_emitted = i;
      acc = 0.0;
    }
  }
  if (last_emitted != points.size() - 1) out.push_back(points.back());
  return out;
}

} // namespace upace
