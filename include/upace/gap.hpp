#pragma once
#include <optional>
#include <vector>
#include <upace/types.hpp>

namespace upace {

// Relative energy cost of running at a grade (percent) versus flat.
// Uphill grows quadratically; downhill is cheapest around -10% and
// costs more again past it (braking).
double grade_cost_multiplier(double gradient_percent);

// Flat-ground equivalent pace (min/mile). Returns the input pace for
// near-flat grades, invalid inputs, or a result outside 3..30 min/mile.
double grade_adjusted_pace(double pace, double gradient_percent);

struct RecordGap {
  double gradient = 0.0;        // percent, windowed
  std::optional<double> gap;    // min/mile, set when the record has a pace
};

// Per-record GAP using the elevation change over +/- 5 records.
std::vector<RecordGap> gap_for_records(const std::vector<ActivityRecord>& records);

enum class GapEffort : int { Easier, Similar, Harder };

struct SegmentGapAnalysis {
  double avg_actual_pace = 0.0;
  double avg_gap = 0.0;
  double avg_gradient = 0.0;
  double gap_variance = 0.0;    // percent, (gap - actual) / actual
  GapEffort effort = GapEffort::Similar;
};

// Averages over records in [start, end] miles; nullopt with fewer than 5.
std::optional<SegmentGapAnalysis> segment_gap(const std::vector<ActivityRecord>& records,
                                              double start_miles,
                                              double end_miles);

// Flat-equivalent effort time over the whole recording, minutes.
double total_gap_time(const std::vector<ActivityRecord>& records);

} // namespace upace
