#include <upace/gap.hpp>
#include <algorithm>
#include <cmath>

namespace upace {

double grade_cost_multiplier(double gradient_percent) {
  const double g = gradient_percent / 100.0;
  if (gradient_percent >= 0.0) {
    return 1.0 + 3.5 * g + 5.0 * g * g;
  }
  const double ag = std::fabs(g);
  if (std::fabs(gradient_percent) <= 10.0) {
    return std::max(0.7, 1.0 - 0.5 * ag + 0.15 * g * g);
  }
  return std::min(1.2, 0.7 + 0.1 * (ag - 0.10) * (ag - 0.10));
}

double grade_adjusted_pace(double pace, double gradient_percent) {
  if (!std::isfinite(pace) || pace <= 0.0) return pace;
  if (!std::isfinite(gradient_percent)) return pace;
  if (std::fabs(gradient_percent) < 0.5) return pace;

  const double speed_mph = 60.0 / pace;
  const double gap_speed = speed_mph * grade_cost_multiplier(gradient_percent);
  const double gap = 60.0 / gap_speed;
  if (!std::isfinite(gap) || gap < 3.0 || gap > 30.0) return pace;
  return gap;
}

std::vector<RecordGap> gap_for_records(const std::vector<ActivityRecord>& records) {
  std::vector<RecordGap> out(records.size());
  const std::size_t n = records.size();
  for (std::size_t i = 0; i < n; ++i) {
    double gradient = 0.0;
    if (i > 0 && i + 1 < n) {
      const std::size_t w = std::min<std::size_t>(5, n - i - 1);
      const auto& prev = records[i >= w ? i - w : 0];
      const auto& next = records[std::min(n - 1, i + w)];
      const double run = next.distance - prev.distance;
      if (run > 0.0) {
        gradient = (next.elevation - prev.elevation) / (run * kMetersPerMile) * 100.0;
      }
    }
    out[i].gradient = gradient;
    if (records[i].pace > 0.0) {
      out[i].gap = grade_adjusted_pace(records[i].pace, gradient);
    }
  }
  return out;
}

std::optional<SegmentGapAnalysis> segment_gap(const std::vector<ActivityRecord>& records,
                                              double start_miles,
                                              double end_miles) {
  std::vector<ActivityRecord> window;
  for (const auto& r : records) {
    if (r.distance >= start_miles && r.distance <= end_miles) window.push_back(r);
  }
  if (window.size() < 5) return std::nullopt;

  const auto gaps = gap_for_records(window);
  double sum_pace = 0.0, sum_gap = 0.0, sum_grad = 0.0;
  int count = 0;
  for (std::size_t i = 0; i < window.size(); ++i) {
    if (window[i].pace <= 0.0 || !gaps[i].gap || *gaps[i].gap <= 0.0) continue;
    sum_pace += window[i].pace;
    sum_gap  += *gaps[i].gap;
    sum_grad += gaps[i].gradient;
    ++count;
  }
  if (count == 0) return std::nullopt;

  SegmentGapAnalysis a;
  a.avg_actual_pace = sum_pace / count;
  a.avg_gap = sum_gap / count;
  a.avg_gradient = sum_grad / count;
  a.gap_variance = (a.avg_gap - a.avg_actual_pace) / a.avg_actual_pace * 100.0;
  if (a.gap_variance < -5.0)     a.effort = GapEffort::Harder;
  else if (a.gap_variance > 5.0) a.effort = GapEffort::Easier;
  else                           a.effort = GapEffort::Similar;
  return a;
}

double total_gap_time(const std::vector<ActivityRecord>& records) {
  const auto gaps = gap_for_records(records);
  double minutes = 0.0;
  for (std::size_t i = 1; i < records.size(); ++i) {
    const double run = records[i].distance - records[i-1].distance;
    const double pace = gaps[i].gap ? *gaps[i].gap : records[i].pace;
    if (pace > 0.0 && run > 0.0) minutes += run * pace;
  }
  return minutes;
}

} // namespace upace
