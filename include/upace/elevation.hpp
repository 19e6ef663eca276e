#pragma once
#include <optional>
#include <vector>
#include <upace/types.hpp>

namespace upace {

struct ElevationStats {
  double gain_m = 0.0;
  double loss_m = 0.0;
  double min_m = 0.0;
  double max_m = 0.0;
  double net_m = 0.0;  // gain - loss
  double covered_miles = 0.0;  // part of the window the track spans
};

// Gain/loss over [start, end] (miles). Elevation at the window edges is
// interpolated between the neighbouring track points, so a window narrower
// than the sampling interval still gets a slice. The window is clipped to
// the track; nullopt when the track has fewer than two points or does not
// overlap the window.
std::optional<ElevationStats> segment_elevation(const std::vector<TrackPoint>& points,
                                                double start_miles,
                                                double end_miles);

// Rise over run as a percentage. Zero run yields 0.
double gradient_percent(double rise_m, double run_miles);

enum class ClimbType : int {
  FlatRolling = 0,
  Gradual,
  Moderate,
  ModerateSteep,
  Steep,
  VerySteep
};

ClimbType classify_climb(double gradient_percent, double gain_m);
const char* to_string(ClimbType c);

} // namespace upace
