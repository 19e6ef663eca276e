#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <upace/athlete.hpp>
#include <upace/elevation.hpp>
#include <upace/gradient_profile.hpp>
#include <upace/types.hpp>
#include <upace/zones.hpp>

namespace upace {

struct PaceModelConfig {
  double fallback_pace = 12.0;        // min/mile, flat-ground default
  double max_extrapolation = 0.5;     // bound on the within-bucket adjustment
  int high_confidence_samples = 10;
  double high_confidence_gap = 2.0;   // percentage points
  GradientProfileConfig profile;
};

struct ElevationDetails {
  double gain_m = 0.0;
  double loss_m = 0.0;
  double avg_gradient = 0.0;          // percent, net rise over segment run
  ClimbType climb = ClimbType::FlatRolling;
  bool has_course_data = false;       // false: no track slice, gradient assumed 0
};

struct PaceDerivation {
  std::size_t segment_index = 0;
  double pace = 0.0;                  // min/mile, always finite
  Confidence confidence = Confidence::Low;
  std::string reasoning;
  ElevationDetails elevation_details;
  std::optional<HrZoneSuggestion> suggested_hr;
  std::optional<PowerZoneSuggestion> suggested_power;
};

// Predicted pace for one segment from the recording's gradient profile.
// Falls back to config.fallback_pace with Confidence::Low on empty
// activity, zero-length segments, an unpopulated profile or any
// non-finite intermediate value. Without course elevation data for the
// segment the flat-ground bucket is used and confidence is Low. A match
// interpolated between buckets is at most Medium.
PaceDerivation derive_segment_pace(const Segment& segment,
                                   std::size_t segment_index,
                                   const GradientProfile& profile,
                                   const std::vector<TrackPoint>& track,
                                   const std::vector<ActivityRecord>& activity,
                                   const PaceModelConfig& cfg = {},
                                   const AthleteMetrics* athlete = nullptr);

} // namespace upace
