#include <upace/fatigue.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace upace {

static constexpr int kIntegrationSteps = 100;

double fatigue_multiplier(double distance, double fatigue_factor) {
  return 1.0 + (distance / 10.0) * (fatigue_factor / 100.0);
}

double expected_pace_at(double base_pace, double distance, double fatigue_factor) {
  return base_pace * fatigue_multiplier(distance, fatigue_factor);
}

FatigueCurve::FatigueCurve(double base_pace, double total_distance, double fatigue_factor,
                           std::size_t num_points)
  : base_pace_(base_pace), total_distance_(total_distance),
    fatigue_factor_(fatigue_factor), num_points_(num_points) {}

bool FatigueCurve::degenerate_() const {
  return num_points_ == 0 || !std::isfinite(total_distance_) || total_distance_ <= 0.0
      || !std::isfinite(base_pace_) || !std::isfinite(fatigue_factor_);
}

FatigueCurvePoint FatigueCurve::at(std::size_t i) const {
  FatigueCurvePoint p;
  if (degenerate_()) {
    p.expected_pace = std::isfinite(base_pace_) ? base_pace_ : 0.0;
    return p;
  }
  // Last sample lands exactly on the total distance.
  p.distance = (i >= num_points_) ? total_distance_
                                  : total_distance_ * static_cast<double>(i) / num_points_;
  p.fatigue_multiplier = fatigue_multiplier(p.distance, fatigue_factor_);
  p.expected_pace = base_pace_ * p.fatigue_multiplier;
  p.percent_degradation = (p.fatigue_multiplier - 1.0) * 100.0;
  return p;
}

std::vector<FatigueCurvePoint> FatigueCurve::to_vector() const {
  return std::vector<FatigueCurvePoint>(begin(), end());
}

FatigueCurve generate_fatigue_curve(double base_pace, double total_distance,
                                    double fatigue_factor,
                                    std::optional<std::size_t> num_points) {
  std::size_t n = 0;
  if (num_points) {
    n = *num_points;
  } else if (std::isfinite(total_distance) && total_distance > 0.0) {
    n = static_cast<std::size_t>(std::ceil(total_distance));
  }
  return FatigueCurve(base_pace, total_distance, fatigue_factor, n);
}

double segment_time_with_fatigue(double base_pace, double start_miles, double end_miles,
                                 double fatigue_factor) {
  const double span = end_miles - start_miles;
  if (!std::isfinite(span) || span <= 0.0 || !std::isfinite(base_pace)
      || !std::isfinite(fatigue_factor)) {
    return 0.0;
  }
  const double h = span / kIntegrationSteps;
  double total = 0.0;
  for (int i = 0; i < kIntegrationSteps; ++i) {
    const double d1 = start_miles + i * h;
    const double d2 = start_miles + (i + 1) * h;
    total += 0.5 * (expected_pace_at(base_pace, d1, fatigue_factor) +
                    expected_pace_at(base_pace, d2, fatigue_factor)) * h;
  }
  return total;
}

double calculate_total_time_with_fatigue(double base_pace, double total_distance,
                                         double fatigue_factor) {
  return segment_time_with_fatigue(base_pace, 0.0, total_distance, fatigue_factor);
}

double calculate_actual_fade_rate(const std::vector<double>& paces,
                                  const std::vector<double>& distances) {
  if (paces.size() < 2 || distances.size() != paces.size()) return 0.0;

  const double total = distances.back();
  if (!std::isfinite(total) || total <= 0.0) return 0.0;
  const double mid = total / 2.0;

  double p1 = 0.0, d1 = 0.0, p2 = 0.0, d2 = 0.0;
  int n1 = 0, n2 = 0;
  for (std::size_t i = 0; i < paces.size(); ++i) {
    if (!std::isfinite(paces[i]) || !std::isfinite(distances[i])) continue;
    if (distances[i] < mid) { p1 += paces[i]; d1 += distances[i]; ++n1; }
    else                    { p2 += paces[i]; d2 += distances[i]; ++n2; }
  }
  if (n1 == 0 || n2 == 0) return 0.0;
  p1 /= n1; d1 /= n1;
  p2 /= n2; d2 /= n2;

  const double dd = d2 - d1;
  if (dd <= 0.0) return 0.0;
  // Linear pace-vs-distance through the two half centroids, referenced
  // to its value at distance 0.
  const double slope = (p2 - p1) / dd;
  const double pace0 = p1 - slope * d1;
  if (!(pace0 > 0.0)) return 0.0;
  const double rate = slope / pace0 * 1000.0;
  return std::isfinite(rate) ? rate : 0.0;
}

FatigueComparison compare_fatigue(double expected_factor, double actual_fade_rate) {
  FatigueComparison c;
  c.difference = actual_fade_rate - expected_factor;
  char buf[128];
  if (c.difference < -1.0) {
    c.performance = FatiguePerformance::Better;
    std::snprintf(buf, sizeof(buf),
                  "Excellent fatigue management! %.1f%% less fade than expected",
                  std::fabs(c.difference));
    c.message = buf;
  } else if (c.difference > 1.0) {
    c.performance = FatiguePerformance::Worse;
    std::snprintf(buf, sizeof(buf),
                  "Higher fade than expected. %.1f%% more degradation", c.difference);
    c.message = buf;
  } else {
    c.performance = FatiguePerformance::Similar;
    c.message = "Fatigue matched expectations";
  }
  return c;
}

const char* fatigue_description(double pct) {
  if (pct < 5.0)  return "Fresh";
  if (pct < 10.0) return "Mild fatigue";
  if (pct < 15.0) return "Moderate fatigue";
  if (pct < 20.0) return "Significant fatigue";
  return "Severe fatigue";
}

double estimate_fatigue_factor(const std::vector<ActivityRecord>& activity) {
  if (activity.size() < 50) return kDefaultFatigueFactor;

  constexpr double kChunkMiles = 10.0;
  std::vector<double> chunk_paces;
  double chunk_start = activity.front().distance;
  double sum = 0.0;
  int n = 0, records = 0;

  auto close_chunk = [&] {
    if (records > 5 && n > 0) chunk_paces.push_back(sum / n);
    sum = 0.0; n = 0; records = 0;
  };

  for (const auto& r : activity) {
    if (r.distance >= chunk_start + kChunkMiles) {
      close_chunk();
      chunk_start = r.distance;
    }
    ++records;
    if (r.pace > 0.0 && r.pace < 30.0) { sum += r.pace; ++n; }
  }
  close_chunk();

  if (chunk_paces.size() < 2) return kDefaultFatigueFactor;
  const double first = chunk_paces.front();
  const double last = chunk_paces.back();
  const double per_chunk = (last - first) / first * 100.0
                         / static_cast<double>(chunk_paces.size() - 1);
  if (!std::isfinite(per_chunk)) return kDefaultFatigueFactor;
  return std::clamp(per_chunk, 0.0, 8.0);
}

} // namespace upace
