#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <upace/types.hpp>

namespace upace {

inline constexpr double kEarthRadiusMiles = 3959.0;

// Stop scanning once the best match is this close (meters) and the
// current candidate is more than twice as far.
inline constexpr double kEarlyExitMeters = 50.0;

// Great-circle distance in miles. Inputs are not range-checked.
double haversine_miles(double lat1, double lon1, double lat2, double lon2);

// Initial bearing from point 1 to point 2, degrees in [0, 360).
double bearing_deg(double lat1, double lon1, double lat2, double lon2);

// Linear scan from search_start for the point closest to (lat, lon).
// Early exit: once the best distance is under kEarlyExitMeters and a
// candidate is more than twice the best, the scan stops. On winding or
// out-and-back courses this can miss a closer point further along.
// nullopt when points is empty or search_start is past the end.
std::optional<std::size_t> find_closest_track_point(double target_lat, double target_lon,
                                                    const std::vector<TrackPoint>& points,
                                                    std::size_t search_start = 0);

struct RouteSegment {
  std::vector<TrackPoint> points;
  std::size_t segment_index = 0;
  std::optional<std::string> checkpoint_name;
};

// Slice the track at checkpoints that carry GPS coordinates. Adjacent
// sub-segments share their boundary point. A checkpoint matching the same
// index as its predecessor yields no extra sub-segment.
std::vector<RouteSegment> split_track_by_checkpoints(const std::vector<TrackPoint>& points,
                                                     const std::vector<Segment>& segments);

// Decimate by great-circle distance (miles). First and last points are kept.
std::vector<TrackPoint> sample_track_points(const std::vector<TrackPoint>& points,
                                            double interval_miles);

} // namespace upace
