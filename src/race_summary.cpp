#include <upace/race_summary.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace upace {

RaceTimeSummary calculate_race_time_summary(const std::vector<Segment>& segments) {
  RaceTimeSummary s;
  double clock = 0.0;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const Segment& seg = segments[i];
    const double run = seg.predicted_time_minutes.value_or(0.0);
    const double stop = seg.checkpoint_time_minutes.value_or(0.0);
    s.running_minutes += run;
    s.checkpoint_minutes += stop;
    s.distance_miles += seg.segment_distance;
    if (stop > 0.0) s.stops.push_back({i, seg.checkpoint_name, stop, seg.support_crew});

    clock += run;
    s.arrivals.push_back({seg.checkpoint_name, clock, clock + stop});
    clock += stop;
  }
  s.total_minutes = s.running_minutes + s.checkpoint_minutes;
  return s;
}

double suggest_checkpoint_time(const Segment& s) {
  if (s.checkpoint_time_minutes && *s.checkpoint_time_minutes > 0.0) return *s.checkpoint_time_minutes;
  double m = s.support_crew ? 7.0 : 2.0;
  if (s.nutrition.size() > 3) m += 2.0;
  if (s.segment_distance > 15.0) m += 3.0;
  return std::min(m, 15.0);
}

double running_time_percentage(const RaceTimeSummary& s) {
  if (s.total_minutes <= 0.0) return 100.0;
  return s.running_minutes / s.total_minutes * 100.0;
}

double average_checkpoint_time(const RaceTimeSummary& s) {
  if (s.stops.empty()) return 0.0;
  return s.checkpoint_minutes / static_cast<double>(s.stops.size());
}

double average_pace(const RaceTimeSummary& s) {
  if (s.distance_miles <= 0.0) return 0.0;
  return s.running_minutes / s.distance_miles;
}

std::string format_duration(double minutes) {
  if (!std::isfinite(minutes) || minutes < 0.0) minutes = 0.0;
  const long total_s = static_cast<long>(std::floor(minutes * 60.0));
  const long h = total_s / 3600;
  const long m = (total_s / 60) % 60;
  const long sec = total_s % 60;
  char buf[32];
  if (h > 0) std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", h, m, sec);
  else       std::snprintf(buf, sizeof(buf), "%ld:%02ld", m, sec);
  return buf;
}

std::string format_pace(double pace) {
  if (!std::isfinite(pace) || pace <= 0.0) return "--:--";
  long m = static_cast<long>(std::floor(pace));
  long s = std::lround((pace - static_cast<double>(m)) * 60.0);
  if (s == 60) { ++m; s = 0; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%ld:%02ld", m, s);
  return buf;
}

} // namespace upace
