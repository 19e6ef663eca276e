#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <upace/types.hpp>

namespace upace {

enum class EffortLevel : int { Easy, Moderate, Hard, Maximal };

struct CheckpointSplit {
  std::size_t segment_index = 0;
  std::string checkpoint_name;
  double segment_distance = 0.0;
  double cumulative_distance = 0.0;
  std::size_t start_record = 0;        // aligned activity indices
  std::size_t end_record = 0;
  double planned_time = 0.0;           // minutes
  double actual_time = 0.0;
  double time_difference = 0.0;        // actual - planned
  double planned_pace = 0.0;           // min/mile
  double actual_pace = 0.0;
  double pace_variance = 0.0;          // percent vs planned
  std::optional<double> avg_gap;       // grade-adjusted actual pace
  double planned_gap = 0.0;
  std::optional<double> gap_variance;
  std::optional<EffortLevel> effort;   // set when heart rate was recorded
  double fatigue_index = 0.0;          // percent vs planned + 2% per segment
  std::optional<double> avg_heart_rate;
  std::optional<double> max_heart_rate;
  std::optional<double> avg_power;
  double elevation_gain_m = 0.0;
  double elevation_loss_m = 0.0;
  double avg_grade = 0.0;              // percent
};

enum class PacingConsistency : int { Excellent, Good, Fair, Poor };
enum class InsightCategory : int { Pacing, Strategy, Nutrition, Training, Recovery };
enum class InsightPriority : int { High, Medium, Low };

struct Insight {
  InsightCategory category = InsightCategory::Pacing;
  InsightPriority priority = InsightPriority::Low;
  std::string message;
  std::string recommendation;
  std::string details;
};

struct RaceAnalytics {
  double total_planned_time = 0.0;     // minutes
  double total_actual_time = 0.0;
  double time_difference = 0.0;
  double avg_pace = 0.0;
  double avg_planned_pace = 0.0;
  double pace_variance = 0.0;          // percent
  std::optional<double> avg_heart_rate;
  int avg_hr_zone = 0;                 // 1..5, 0 without heart rate
  int efficiency_score = 0;            // 0..100
  char efficiency_grade = 'F';
  bool negative_split = false;
  PacingConsistency pacing_consistency = PacingConsistency::Excellent;
  double fade_rate_per_hour = 0.0;     // percent
  std::vector<CheckpointSplit> splits;
  std::vector<Insight> insights;
};

struct SplitOptions {
  double default_planned_pace = 10.0;  // min/mile
  double max_heart_rate = 190.0;       // for effort level and zone
  double min_segment_distance = 0.01;  // miles; shorter segments are skipped
};

// Index of the activity record at each checkpoint, in segment order.
// Uses GPS when every record and the checkpoint carry coordinates,
// otherwise the record nearest the checkpoint's cumulative distance.
std::vector<std::size_t> align_checkpoints(const std::vector<Segment>& ordered,
                                           const std::vector<ActivityRecord>& activity);

// One split per segment with data. Empty when the activity is empty or
// the segments violate cumulative-distance ordering.
std::vector<CheckpointSplit> calculate_split_analysis(const std::vector<Segment>& segments,
                                                      const std::vector<ActivityRecord>& activity,
                                                      const SplitOptions& opt = {});

// nullopt when no split could be computed.
std::optional<RaceAnalytics> calculate_race_analytics(const std::vector<Segment>& segments,
                                                      const std::vector<ActivityRecord>& activity,
                                                      const SplitOptions& opt = {});

const char* to_string(EffortLevel e);
const char* to_string(PacingConsistency p);
const char* to_string(InsightCategory c);
const char* to_string(InsightPriority p);

} // namespace upace
