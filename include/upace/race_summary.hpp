#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <upace/types.hpp>

namespace upace {

struct CheckpointStop {
  std::size_t segment_index = 0;
  std::string checkpoint_name;
  double stop_minutes = 0.0;
  bool support_crew = false;
};

struct CheckpointArrival {
  std::string checkpoint_name;
  double arrival_minutes = 0.0;   // from the start, including earlier stops
  double departure_minutes = 0.0;
};

struct RaceTimeSummary {
  double running_minutes = 0.0;
  double checkpoint_minutes = 0.0;
  double total_minutes = 0.0;
  double distance_miles = 0.0;
  std::vector<CheckpointStop> stops;     // only checkpoints with a stop
  std::vector<CheckpointArrival> arrivals;
};

// Sums predicted running time and stop time over segments in the given order.
RaceTimeSummary calculate_race_time_summary(const std::vector<Segment>& segments);

// Existing stop time, else 2 min (7 with crew), +2 for more than three
// nutrition items, +3 after a segment over 15 miles, capped at 15.
double suggest_checkpoint_time(const Segment& s);

double running_time_percentage(const RaceTimeSummary& s);   // 100 when empty
double average_checkpoint_time(const RaceTimeSummary& s);
double average_pace(const RaceTimeSummary& s);              // running min/mile

// "H:MM:SS", or "M:SS" under an hour.
std::string format_duration(double minutes);
// "M:SS", or "--:--" for zero / non-finite.
std::string format_pace(double pace);

} // namespace upace
