#include <upace/zones.hpp>
#include <algorithm>
#include <cmath>

namespace upace {

std::optional<HrZones> derive_hr_zones(const std::vector<ActivityRecord>& activity,
                                       const AthleteMetrics* athlete) {
  int n = 0;
  double observed_max = 0.0;
  double observed_min = 0.0;
  for (const auto& r : activity) {
    if (!r.heart_rate || *r.heart_rate <= 0.0) continue;
    const double hr = *r.heart_rate;
    if (n == 0) { observed_max = observed_min = hr; }
    observed_max = std::max(observed_max, hr);
    observed_min = std::min(observed_min, hr);
    ++n;
  }
  if (n < kMinHrSamples) return std::nullopt;

  const double max_hr  = (athlete && athlete->max_hr)     ? *athlete->max_hr     : observed_max;
  const double rest_hr = (athlete && athlete->resting_hr) ? *athlete->resting_hr : observed_min;
  const double reserve = max_hr - rest_hr;
  if (reserve <= 0.0) return std::nullopt;

  auto at = [&](double pct){ return std::round(rest_hr + reserve * pct); };
  HrZones z;
  z.zone[0] = {std::round(rest_hr), at(0.6)};
  z.zone[1] = {at(0.6), at(0.7)};
  z.zone[2] = {at(0.7), at(0.8)};
  z.zone[3] = {at(0.8), at(0.9)};
  z.zone[4] = {at(0.9), std::round(max_hr)};
  return z;
}

std::optional<PowerZones> derive_power_zones(const std::vector<ActivityRecord>& activity,
                                             const AthleteMetrics* athlete) {
  int n = 0;
  double sum = 0.0;
  for (const auto& r : activity) {
    if (r.power && *r.power > 0.0) { sum += *r.power; ++n; }
  }
  if (n < kMinPowerSamples) return std::nullopt;

  // Ultra efforts are typically ridden/run near 69% of FTP.
  const double ftp = (athlete && athlete->ftp) ? *athlete->ftp : std::round(sum / n * 1.45);
  if (!(ftp > 0.0) || !std::isfinite(ftp)) return std::nullopt;

  auto w = [&](double pct){ return std::round(ftp * pct); };
  PowerZones z;
  z.ftp = ftp;
  z.zone[0] = {0.0,     w(0.55), 0,   55};
  z.zone[1] = {w(0.56), w(0.75), 56,  75};
  z.zone[2] = {w(0.76), w(0.90), 76,  90};
  z.zone[3] = {w(0.91), w(1.05), 91,  105};
  z.zone[4] = {w(1.06), w(1.20), 106, 120};
  return z;
}

HrZoneSuggestion suggest_hr_zone(double gradient,
                                 double cumulative_distance,
                                 const HrZones& zones) {
  const double boost = std::min(5.0, std::floor(std::max(0.0, cumulative_distance) / 20.0));

  int zi = 1;
  const char* why = "Flat terrain - steady aerobic pace";
  if (gradient < -5.0)       { zi = 0; why = "Downhill recovery - keep HR low"; }
  else if (gradient < -2.0)  { zi = 1; why = "Gentle downhill - easy aerobic effort"; }
  else if (gradient < 2.0)   { zi = 1; why = "Flat terrain - steady aerobic pace"; }
  else if (gradient < 5.0)   { zi = 2; why = "Moderate climb - tempo effort"; }
  else if (gradient < 10.0)  { zi = 3; why = "Steep climb - threshold effort, hiking OK"; }
  else                       { zi = 3; why = "Very steep climb - power hike recommended"; }

  HrZoneSuggestion s;
  s.min_bpm = zones.zone[zi].min + boost;
  s.max_bpm = zones.zone[zi].max + boost;
  s.zone_name = "Zone " + std::to_string(zi + 1);
  s.reasoning = why;
  return s;
}

PowerZoneSuggestion suggest_power_zone(double gradient,
                                       double cumulative_distance,
                                       const PowerZones& zones) {
  const double reduction = std::min(0.15, std::max(0.0, cumulative_distance) / 200.0);

  PowerZoneId id = PowerZoneId::Moderate;
  const char* name = "Moderate";
  const char* why = "Flat terrain - steady moderate power";
  if (gradient < -5.0)      { id = PowerZoneId::Easy;  name = "Easy";  why = "Downhill - easy recovery watts"; }
  else if (gradient < -2.0) { id = PowerZoneId::Easy;  name = "Easy";  why = "Gentle downhill - maintain easy watts"; }
  else if (gradient < 2.0)  { id = PowerZoneId::Moderate; name = "Moderate"; why = "Flat terrain - steady moderate power"; }
  else if (gradient < 5.0)  { id = PowerZoneId::Tempo; name = "Tempo"; why = "Moderate climb - tempo power"; }
  else if (gradient < 10.0) { id = PowerZoneId::Tempo; name = "Tempo"; why = "Steep climb - sustained tempo, hiking OK"; }
  else                      { id = PowerZoneId::Tempo; name = "Tempo"; why = "Very steep - power hike at tempo"; }

  const auto& z = zones.at(id);
  PowerZoneSuggestion s;
  s.min_watts = std::round(z.min * (1.0 - reduction));
  s.max_watts = std::round(z.max * (1.0 - reduction));
  s.zone_name = name;
  s.pct_ftp_min = std::round(z.pct_min * (1.0 - reduction));
  s.pct_ftp_max = std::round(z.pct_max * (1.0 - reduction));
  s.reasoning = why;
  return s;
}

} // namespace upace
