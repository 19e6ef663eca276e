#include <upace/csv_io.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace upace {

namespace {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  // No quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

bool is_header_row(const std::vector<std::string>& cols, const char* first) {
  if (cols.empty()) return false;
  std::string c = cols[0];
  for (auto& ch : c) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return c == first;
}

double to_double_safe(const std::string& s, bool& ok) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    ok = idx == s.size() && std::isfinite(v);
    return v;
  } catch (const std::invalid_argument&) {
    ok = false;
    return 0.0;
  } catch (const std::out_of_range&) {
    ok = false;
    return 0.0;
  }
}

// Whole number within int range; "1.5" or "1e20" fail.
int to_int_safe(const std::string& s, bool& ok) {
  const double v = to_double_safe(s, ok);
  if (!ok) return 0;
  if (std::trunc(v) != v ||
      v < static_cast<double>(std::numeric_limits<int>::min()) ||
      v > static_cast<double>(std::numeric_limits<int>::max())) {
    ok = false;
    return 0;
  }
  return static_cast<int>(v);
}

double to_double_or(const std::string& s, double fallback, bool& ok) {
  if (s.empty()) { ok = true; return fallback; }
  return to_double_safe(s, ok);
}

// Empty or absent column is "no value"; a present but bad one fails the row.
bool optional_col(const std::vector<std::string>& cols, std::size_t i,
                  std::optional<double>& out) {
  out.reset();
  if (i >= cols.size() || cols[i].empty()) return true;
  bool ok = false;
  const double v = to_double_safe(cols[i], ok);
  if (!ok) return false;
  out = v;
  return true;
}

bool parse_bool(const std::string& s) {
  std::string l = s;
  for (auto& ch : l) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return l == "1" || l == "true" || l == "yes" || l == "y";
}

template <typename Row, typename Parse>
std::vector<Row> read_rows(std::istream& in, const char* header, Parse parse) {
  std::vector<Row> out;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);
    if (!header_consumed && is_header_row(cols, header)) {
      header_consumed = true;
      continue;
    }
    if (auto row = parse(cols); row.has_value()) {
      out.push_back(std::move(*row));
    }
  }
  return out;
}

template <typename Row, typename Fn>
std::optional<std::vector<Row>> load_file(const std::string& path, Fn from_stream) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return from_stream(f);
}

std::optional<TrackPoint> parse_track_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;
  bool ok1, ok2, ok3, ok4;
  TrackPoint p;
  p.distance = to_double_safe(cols[0], ok1);
  p.elevation = to_double_or(cols[1], 0.0, ok2);
  p.lat = to_double_safe(cols[2], ok3);
  p.lng = to_double_safe(cols[3], ok4);
  if (!(ok1 && ok2 && ok3 && ok4)) return std::nullopt;
  return p;
}

std::optional<ActivityRecord> parse_activity_row(const std::vector<std::string>& cols) {
  if (cols.size() < 3) return std::nullopt;
  bool ok1, ok2, ok3;
  ActivityRecord r;
  r.distance = to_double_safe(cols[0], ok1);
  r.elevation = to_double_or(cols[1], 0.0, ok2);
  r.pace = to_double_safe(cols[2], ok3);
  if (!(ok1 && ok2 && ok3)) return std::nullopt;
  if (!optional_col(cols, 3, r.heart_rate)) return std::nullopt;
  if (!optional_col(cols, 4, r.power)) return std::nullopt;
  if (!optional_col(cols, 5, r.lat)) return std::nullopt;
  if (!optional_col(cols, 6, r.lng)) return std::nullopt;
  if (r.lat.has_value() != r.lng.has_value()) { r.lat.reset(); r.lng.reset(); }
  return r;
}

std::optional<Segment> parse_segment_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;
  bool ok1, ok3, ok4;
  Segment s;
  s.order = to_int_safe(cols[0], ok1);
  s.checkpoint_name = cols[1];
  s.segment_distance = to_double_safe(cols[2], ok3);
  s.cumulative_distance = to_double_safe(cols[3], ok4);
  if (!(ok1 && ok3 && ok4)) return std::nullopt;
  if (s.segment_distance < 0.0 || s.cumulative_distance < 0.0) return std::nullopt;

  if (!optional_col(cols, 4, s.latitude)) return std::nullopt;
  if (!optional_col(cols, 5, s.longitude)) return std::nullopt;
  if (!optional_col(cols, 6, s.custom_pace)) return std::nullopt;
  if (!optional_col(cols, 7, s.terrain_factor)) return std::nullopt;
  if (!optional_col(cols, 8, s.predicted_time_minutes)) return std::nullopt;
  if (!optional_col(cols, 9, s.checkpoint_time_minutes)) return std::nullopt;
  if (cols.size() > 10) s.support_crew = parse_bool(cols[10]);
  if (s.terrain_factor) s.terrain_factor = std::clamp(*s.terrain_factor, 0.8, 1.5);
  return s;
}

std::optional<NutritionRow> parse_nutrition_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  bool ok1, ok3, ok4, ok5, ok6;
  NutritionRow r;
  r.segment_order = to_int_safe(cols[0], ok1);
  r.item.product_name = cols[1];
  r.item.carbs_per_serving = to_double_safe(cols[2], ok3);
  r.item.sodium_per_serving = to_double_safe(cols[3], ok4);
  r.item.water_per_serving = to_double_safe(cols[4], ok5);
  r.item.quantity = to_double_safe(cols[5], ok6);
  if (!(ok1 && ok3 && ok4 && ok5 && ok6)) return std::nullopt;
  if (r.item.quantity < 0.0 || r.item.carbs_per_serving < 0.0) return std::nullopt;
  return r;
}

std::optional<AthleteProfile> parse_athlete_row(const std::vector<std::string>& cols) {
  if (cols.size() < 4) return std::nullopt;
  if (cols[0].empty()) return std::nullopt;
  bool ok1, ok2;
  AthleteProfile a;
  a.key = cols[0];
  a.metrics.body_weight_kg = to_double_safe(cols[1], ok1);
  a.metrics.gear_weight_kg = to_double_or(cols[2], 0.0, ok2);
  if (!(ok1 && ok2) || a.metrics.body_weight_kg <= 0.0) return std::nullopt;
  a.metrics.gear_weight_kg = std::max(0.0, a.metrics.gear_weight_kg);
  auto fit = parse_fitness_level(cols[3]);
  if (!fit) return std::nullopt;
  a.metrics.fitness = *fit;
  if (!optional_col(cols, 4, a.metrics.max_hr)) return std::nullopt;
  if (!optional_col(cols, 5, a.metrics.resting_hr)) return std::nullopt;
  if (!optional_col(cols, 6, a.metrics.ftp)) return std::nullopt;
  return a;
}

} // namespace

std::vector<TrackPoint> track_points_from_csv_stream(std::istream& in) {
  return read_rows<TrackPoint>(in, "distance", parse_track_row);
}

std::optional<std::vector<TrackPoint>> load_track_points_csv(const std::string& path) {
  return load_file<TrackPoint>(path, track_points_from_csv_stream);
}

std::vector<ActivityRecord> activity_from_csv_stream(std::istream& in) {
  return read_rows<ActivityRecord>(in, "distance", parse_activity_row);
}

std::optional<std::vector<ActivityRecord>> load_activity_csv(const std::string& path) {
  return load_file<ActivityRecord>(path, activity_from_csv_stream);
}

std::vector<Segment> segments_from_csv_stream(std::istream& in) {
  return read_rows<Segment>(in, "order", parse_segment_row);
}

std::optional<std::vector<Segment>> load_segments_csv(const std::string& path) {
  return load_file<Segment>(path, segments_from_csv_stream);
}

std::vector<NutritionRow> nutrition_from_csv_stream(std::istream& in) {
  return read_rows<NutritionRow>(in, "segment_order", parse_nutrition_row);
}

std::optional<std::vector<NutritionRow>> load_nutrition_csv(const std::string& path) {
  return load_file<NutritionRow>(path, nutrition_from_csv_stream);
}

void attach_nutrition(std::vector<Segment>& segments, const std::vector<NutritionRow>& rows) {
  for (const auto& r : rows) {
    auto it = std::find_if(segments.begin(), segments.end(),
                           [&](const Segment& s){ return s.order == r.segment_order; });
    if (it != segments.end()) it->nutrition.push_back(r.item);
  }
}

std::vector<AthleteProfile> athlete_catalog_from_csv_stream(std::istream& in) {
  return read_rows<AthleteProfile>(in, "key", parse_athlete_row);
}

std::optional<std::vector<AthleteProfile>> load_athlete_catalog_csv(const std::string& path) {
  return load_file<AthleteProfile>(path, athlete_catalog_from_csv_stream);
}

std::optional<PlanInputs> load_plan_inputs(const InputPaths& paths, std::string& error) {
  PlanInputs in;
  if (paths.track.empty() || paths.segments.empty()) {
    error = "track and segments files are required";
    return std::nullopt;
  }
  auto track = load_track_points_csv(paths.track);
  if (!track) { error = "cannot open track file: " + paths.track; return std::nullopt; }
  if (track->empty()) { error = "no valid track points in " + paths.track; return std::nullopt; }
  in.track = std::move(*track);

  auto segs = load_segments_csv(paths.segments);
  if (!segs) { error = "cannot open segments file: " + paths.segments; return std::nullopt; }
  in.segments = std::move(*segs);

  if (!paths.activity.empty()) {
    auto act = load_activity_csv(paths.activity);
    if (!act) { error = "cannot open activity file: " + paths.activity; return std::nullopt; }
    in.activity = std::move(*act);
  }
  if (!paths.nutrition.empty()) {
    auto rows = load_nutrition_csv(paths.nutrition);
    if (!rows) { error = "cannot open nutrition file: " + paths.nutrition; return std::nullopt; }
    attach_nutrition(in.segments, *rows);
  }

  std::optional<AthleteProfile> athlete;
  if (!paths.athletes.empty()) {
    auto cat = load_athlete_catalog_csv(paths.athletes);
    if (!cat) { error = "cannot open athlete catalog: " + paths.athletes; return std::nullopt; }
    athlete = athlete_by_key_in(*cat, paths.athlete_key);
  } else {
    athlete = athlete_by_key(paths.athlete_key);
  }
  if (!athlete) { error = "unknown athlete profile: " + paths.athlete_key; return std::nullopt; }
  in.athlete = std::move(*athlete);
  return in;
}

} // namespace upace
