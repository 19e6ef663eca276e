#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <upace/athlete.hpp>
#include <upace/types.hpp>

namespace upace {

// All loaders share one dialect: comma separated, no quoting, optional
// header row, '#' comments and blank lines ignored, whitespace around
// fields trimmed. Rows with missing or non-finite required numbers are
// skipped. Optional columns may be empty or absent.

// distance,elevation,lat,lng
std::vector<TrackPoint> track_points_from_csv_stream(std::istream& in);
std::optional<std::vector<TrackPoint>> load_track_points_csv(const std::string& path);

// distance,elevation,pace[,heart_rate,power,lat,lng]
std::vector<ActivityRecord> activity_from_csv_stream(std::istream& in);
std::optional<std::vector<ActivityRecord>> load_activity_csv(const std::string& path);

// order,checkpoint_name,segment_distance,cumulative_distance
//   [,latitude,longitude,custom_pace,terrain_factor,predicted_time,checkpoint_time,support_crew]
std::vector<Segment> segments_from_csv_stream(std::istream& in);
std::optional<std::vector<Segment>> load_segments_csv(const std::string& path);

struct NutritionRow {
  int segment_order = 0;
  NutritionItem item;
};

// segment_order,product_name,carbs,sodium,water,quantity
std::vector<NutritionRow> nutrition_from_csv_stream(std::istream& in);
std::optional<std::vector<NutritionRow>> load_nutrition_csv(const std::string& path);

// Appends each row's item to the segment with the matching order.
// Rows without a matching segment are ignored.
void attach_nutrition(std::vector<Segment>& segments, const std::vector<NutritionRow>& rows);

// key,body_weight_kg,gear_weight_kg,fitness[,max_hr,resting_hr,ftp]
std::vector<AthleteProfile> athlete_catalog_from_csv_stream(std::istream& in);
std::optional<std::vector<AthleteProfile>> load_athlete_catalog_csv(const std::string& path);

struct InputPaths {
  std::string track;                // required
  std::string segments;             // required
  std::string activity;             // optional historical recording
  std::string nutrition;            // optional
  std::string athletes;             // optional catalog; built-in otherwise
  std::string athlete_key = "default";
};

struct PlanInputs {
  std::vector<TrackPoint> track;
  std::vector<Segment> segments;    // nutrition attached
  std::vector<ActivityRecord> activity;
  AthleteProfile athlete;
};

// Loads every file named in paths. On failure returns nullopt and sets
// error to a one-line description.
std::optional<PlanInputs> load_plan_inputs(const InputPaths& paths, std::string& error);

} // namespace upace
