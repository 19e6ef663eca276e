#pragma once
#include <optional>
#include <string>
#include <vector>

namespace upace {

inline constexpr double kMetersPerMile = 1609.34;
inline constexpr double kFeetPerMeter  = 3.28084;
inline constexpr double kKmPerMile     = 1.60934;

// One point of a parsed course track. Ordered by ascending distance.
struct TrackPoint {
  double distance = 0.0;   // course-cumulative, miles
  double elevation = 0.0;  // meters
  double lat = 0.0;
  double lng = 0.0;
};

// One record of a historical device recording.
struct ActivityRecord {
  double distance = 0.0;   // miles
  double elevation = 0.0;  // meters
  double pace = 0.0;       // min/mile
  std::optional<double> heart_rate;
  std::optional<double> power;
  std::optional<double> lat;
  std::optional<double> lng;
};

struct NutritionItem {
  std::string product_name;
  double carbs_per_serving = 0.0;   // g
  double sodium_per_serving = 0.0;  // mg
  double water_per_serving = 0.0;   // ml
  double quantity = 0.0;
};

// Checkpoint boundary. cumulative_distance must be non-decreasing across
// the list once sorted by order.
struct Segment {
  int order = 0;
  std::string checkpoint_name;
  double segment_distance = 0.0;     // miles
  double cumulative_distance = 0.0;  // miles
  std::optional<double> latitude;
  std::optional<double> longitude;
  std::optional<double> custom_pace;             // min/mile
  std::optional<double> terrain_factor;          // 0.8 fast .. 1.5 technical
  std::optional<double> predicted_time_minutes;
  std::optional<double> checkpoint_time_minutes; // aid station stop
  bool support_crew = false;
  std::vector<NutritionItem> nutrition;

  bool has_gps() const { return latitude.has_value() && longitude.has_value(); }
};

enum class Confidence : int { Low = 0, Medium = 1, High = 2 };

enum class BonkRisk : int { None = 0, Low = 1, Moderate = 2, High = 3, Critical = 4 };

const char* to_string(Confidence c);
const char* to_string(BonkRisk r);

} // namespace upace
