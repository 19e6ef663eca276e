#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>
#include <upace/athlete.hpp>
#include <upace/types.hpp>

namespace upace {

struct HrRange {
  double min = 0.0;  // bpm
  double max = 0.0;
};

// Karvonen (heart-rate reserve) zones 1..5.
struct HrZones {
  std::array<HrRange, 5> zone{};
};

struct PowerZone {
  double min = 0.0;  // watts
  double max = 0.0;
  int pct_min = 0;   // % FTP
  int pct_max = 0;
};

enum class PowerZoneId : int { Easy = 0, Moderate, Tempo, Threshold, VO2max };

struct PowerZones {
  double ftp = 0.0;
  std::array<PowerZone, 5> zone{};

  const PowerZone& at(PowerZoneId id) const { return zone[static_cast<int>(id)]; }
};

struct HrZoneSuggestion {
  double min_bpm = 0.0;
  double max_bpm = 0.0;
  std::string zone_name;  // "Zone 1".."Zone 5", or "Observed"
  std::string reasoning;
};

struct PowerZoneSuggestion {
  double min_watts = 0.0;
  double max_watts = 0.0;
  std::string zone_name;  // "Easy".."VO2max", or "Observed"
  double pct_ftp_min = 0.0;
  double pct_ftp_max = 0.0;
  std::string reasoning;
};

inline constexpr int kMinHrSamples = 50;
inline constexpr int kMinPowerSamples = 100;

// Zones from athlete overrides or the recording's observed max/min HR.
// nullopt with fewer than kMinHrSamples HR values or a non-positive reserve.
std::optional<HrZones> derive_hr_zones(const std::vector<ActivityRecord>& activity,
                                       const AthleteMetrics* athlete = nullptr);

// Zones from the athlete's FTP, else 1.45x the recording's mean power.
std::optional<PowerZones> derive_power_zones(const std::vector<ActivityRecord>& activity,
                                             const AthleteMetrics* athlete = nullptr);

// Gradient picks the zone; +1 bpm per 20 miles already covered (max +5).
HrZoneSuggestion suggest_hr_zone(double gradient_percent,
                                 double cumulative_distance,
                                 const HrZones& zones);

// Gradient picks the zone; targets drop up to 15% with distance.
PowerZoneSuggestion suggest_power_zone(double gradient_percent,
                                       double cumulative_distance,
                                       const PowerZones& zones);

} // namespace upace
