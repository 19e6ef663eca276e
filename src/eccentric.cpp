#include <upace/eccentric.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace upace {

DescentStrategy descent_strategy(double g) {
  if (g >= kEasyDescent) {
    return {DescentCategory::Easy, g,
            "Let gravity assist. Upright posture, quick turnover.", 0.95};
  }
  if (g >= kModerateDescent) {
    return {DescentCategory::Moderate, g,
            "Controlled speed, lean slightly forward.", 1.0};
  }
  if (g >= kTechnicalDescent) {
    return {DescentCategory::Technical, g,
            "High quad load. Shorten stride and raise cadence.", 1.1};
  }
  return {DescentCategory::Extreme, g,
          "Extreme eccentric load. Walk where needed, use poles if available.", 1.25};
}

double segment_eccentric_score(double gradient_percent, double distance_miles, double loss_m) {
  if (!(gradient_percent < 0.0)) return 0.0;
  if (!std::isfinite(distance_miles) || !std::isfinite(loss_m)) return 0.0;

  const double g = std::fabs(gradient_percent);
  double grade_score;
  if (g <= 6.0)       grade_score = g * 2.0;
  else if (g <= 10.0) grade_score = 12.0 + (g - 6.0) * 4.0;
  else if (g <= 15.0) grade_score = 28.0 + (g - 10.0) * 8.0;
  else                grade_score = 68.0 + (g - 15.0) * 12.0;

  const double dist_mult = std::clamp(distance_miles, 0.0, 5.0) / 2.0;
  const double loss_mult = std::clamp(loss_m * kFeetPerMeter / 1000.0, 0.0, 3.0);
  return std::min(100.0, grade_score * dist_mult * loss_mult);
}

SegmentEccentricAnalysis analyze_segment_eccentric_load(double gradient_percent,
                                                        double distance_miles,
                                                        double loss_m) {
  SegmentEccentricAnalysis a;
  a.gradient = gradient_percent;
  a.distance_miles = distance_miles;
  a.loss_m = loss_m;
  a.score = segment_eccentric_score(gradient_percent, distance_miles, loss_m);
  a.strategy = descent_strategy(gradient_percent);

  char buf[128];
  if (gradient_percent < kTechnicalDescent) {
    std::snprintf(buf, sizeof(buf), "Steep descent (%.1f%%), high eccentric load on quads",
                  std::fabs(gradient_percent));
    a.warnings.emplace_back(buf);
  }
  if (loss_m * kFeetPerMeter > 1500.0) {
    std::snprintf(buf, sizeof(buf), "Significant elevation loss (%.0f m), pace yourself", loss_m);
    a.warnings.emplace_back(buf);
  }
  if (a.score > 50.0) a.warnings.emplace_back("Consider downhill training for this segment");
  if (gradient_percent < kExtremeDescent) {
    a.warnings.emplace_back("Extreme gradient, trekking poles strongly recommended");
  }
  return a;
}

EccentricLoadLevel eccentric_load_level(double total_score) {
  if (total_score < 100.0) return EccentricLoadLevel::Low;
  if (total_score < 250.0) return EccentricLoadLevel::Moderate;
  if (total_score < 500.0) return EccentricLoadLevel::High;
  return EccentricLoadLevel::Extreme;
}

const char* load_message(EccentricLoadLevel l) {
  switch (l) {
    case EccentricLoadLevel::Low:      return "Low eccentric load, standard quad conditioning is enough";
    case EccentricLoadLevel::Moderate: return "Moderate eccentric load, expect quad fatigue in the second half";
    case EccentricLoadLevel::High:     return "High eccentric load, downhill training essential";
    case EccentricLoadLevel::Extreme:  return "Extreme eccentric load, the course demands serious downhill preparation";
  }
  return "";
}

const char* training_advice(EccentricLoadLevel l) {
  switch (l) {
    case EccentricLoadLevel::Low:      return "Normal training should prepare you well.";
    case EccentricLoadLevel::Moderate: return "Include 1-2 weekly downhill sessions.";
    case EccentricLoadLevel::High:     return "Include 2-3 weekly downhill repeats and eccentric strength work.";
    case EccentricLoadLevel::Extreme:  return "Prioritize downhill training and build up gradually.";
  }
  return "";
}

RaceEccentricSummary calculate_race_eccentric_summary(const std::vector<EccentricSegmentInput>& segments) {
  RaceEccentricSummary s;
  for (const auto& seg : segments) {
    if (!(seg.gradient < 0.0)) continue;
    s.total_loss_m += seg.loss_m;
    s.total_score += segment_eccentric_score(seg.gradient, seg.distance_miles, seg.loss_m);
    if (seg.gradient < kModerateDescent)  ++s.steep_descent_segments;
    if (seg.gradient < kTechnicalDescent) ++s.extreme_descent_segments;
  }
  s.level = eccentric_load_level(s.total_score);

  char buf[128];
  if (s.total_loss_m * kFeetPerMeter > 5000.0) {
    std::snprintf(buf, sizeof(buf), "Total descent of %.0f m, significant cumulative quad stress",
                  s.total_loss_m);
    s.recommendations.emplace_back(buf);
  }
  if (s.steep_descent_segments > 0) {
    std::snprintf(buf, sizeof(buf), "%d segment(s) with steep descent (over 10%% grade)",
                  s.steep_descent_segments);
    s.recommendations.emplace_back(buf);
  }
  if (s.extreme_descent_segments > 0) {
    std::snprintf(buf, sizeof(buf), "%d segment(s) with extreme descent, consider poles",
                  s.extreme_descent_segments);
    s.recommendations.emplace_back(buf);
  }
  if (s.level == EccentricLoadLevel::High || s.level == EccentricLoadLevel::Extreme) {
    s.recommendations.emplace_back("Pre-race eccentric training strongly recommended");
    s.recommendations.emplace_back("Start slower to preserve quads for the descents");
  }
  return s;
}

const char* to_string(DescentCategory c) {
  switch (c) {
    case DescentCategory::Easy:      return "easy";
    case DescentCategory::Moderate:  return "moderate";
    case DescentCategory::Technical: return "technical";
    case DescentCategory::Extreme:   return "extreme";
  }
  return "easy";
}

const char* to_string(EccentricLoadLevel l) {
  switch (l) {
    case EccentricLoadLevel::Low:      return "low";
    case EccentricLoadLevel::Moderate: return "moderate";
    case EccentricLoadLevel::High:     return "high";
    case EccentricLoadLevel::Extreme:  return "extreme";
  }
  return "low";
}

} // namespace upace
