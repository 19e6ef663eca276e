#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <vector>

#include <upace/split_analysis.hpp>

using Catch::Approx;
using namespace upace;

// 10 flat miles recorded every 0.1 mi at 10:00/mi.
static std::vector<ActivityRecord> steady_ten_miles() {
  std::vector<ActivityRecord> recs;
  for (int i = 0; i <= 100; ++i) {
    ActivityRecord r;
    r.distance = i / 10.0;
    r.elevation = 300.0;
    r.pace = 10.0;
    recs.push_back(r);
  }
  return recs;
}

static Segment planned(int order, const char* name, double dist, double cum, double pace) {
  Segment s;
  s.order = order;
  s.checkpoint_name = name;
  s.segment_distance = dist;
  s.cumulative_distance = cum;
  s.custom_pace = pace;
  return s;
}

static std::vector<Segment> two_legs() {
  return {planned(1, "Halfway", 5.0, 5.0, 9.0), planned(2, "Finish", 5.0, 10.0, 10.0)};
}

TEST_CASE("calculate_split_analysis on a steady run") {
  const auto splits = calculate_split_analysis(two_legs(), steady_ten_miles());
  REQUIRE(splits.size() == 2);

  const auto& a = splits[0];
  REQUIRE(a.checkpoint_name == "Halfway");
  REQUIRE(a.start_record == 0);
  REQUIRE(a.end_record == 50);
  REQUIRE(a.actual_time == Approx(50.0));
  REQUIRE(a.planned_time == Approx(45.0));
  REQUIRE(a.time_difference == Approx(5.0));
  REQUIRE(a.pace_variance == Approx(100.0 / 9.0));
  REQUIRE(a.avg_gap.has_value());
  REQUIRE(*a.avg_gap == Approx(10.0));
  REQUIRE_FALSE(a.effort.has_value());

  const auto& b = splits[1];
  REQUIRE(b.start_record == 50);
  REQUIRE(b.end_record == 100);
  REQUIRE(b.actual_time == Approx(50.0));
  REQUIRE(b.pace_variance == Approx(0.0).margin(1e-6));
  REQUIRE(b.fatigue_index < 0.0);
}

TEST_CASE("planned pace falls back to predicted time, then the default") {
  auto segs = two_legs();
  segs[0].custom_pace.reset();
  segs[0].predicted_time_minutes = 60.0;
  segs[1].custom_pace.reset();
  const auto splits = calculate_split_analysis(segs, steady_ten_miles());
  REQUIRE(splits.size() == 2);
  REQUIRE(splits[0].planned_pace == Approx(12.0));
  REQUIRE(splits[1].planned_pace == Approx(10.0));
}

TEST_CASE("calculate_race_analytics on a steady run") {
  const auto ra = calculate_race_analytics(two_legs(), steady_ten_miles());
  REQUIRE(ra.has_value());
  REQUIRE(ra->total_planned_time == Approx(95.0));
  REQUIRE(ra->total_actual_time == Approx(100.0));
  REQUIRE(ra->time_difference == Approx(5.0));
  REQUIRE(ra->pacing_consistency == PacingConsistency::Excellent);
  REQUIRE(ra->efficiency_score == 97);
  REQUIRE(ra->efficiency_grade == 'A');
  REQUIRE_FALSE(ra->negative_split);
  REQUIRE(ra->fade_rate_per_hour == Approx(0.0).margin(1e-6));
  REQUIRE_FALSE(ra->avg_heart_rate.has_value());

  const bool pacing = std::any_of(ra->insights.begin(), ra->insights.end(),
                                  [](const Insight& i){ return i.category == InsightCategory::Pacing; });
  REQUIRE_FALSE(pacing);
}

TEST_CASE("slowing down in the second half raises a pacing insight") {
  auto recs = steady_ten_miles();
  for (std::size_t i = 51; i < recs.size(); ++i) recs[i].pace = 13.0;

  const auto ra = calculate_race_analytics(two_legs(), recs);
  REQUIRE(ra.has_value());
  REQUIRE(ra->splits[1].actual_pace == Approx(13.0));
  REQUIRE(ra->fade_rate_per_hour > 5.0);

  const auto it = std::find_if(ra->insights.begin(), ra->insights.end(),
                               [](const Insight& i){ return i.category == InsightCategory::Pacing; });
  REQUIRE(it != ra->insights.end());
  REQUIRE(it->priority == InsightPriority::High);
}

TEST_CASE("heart rate sets effort level") {
  auto recs = steady_ten_miles();
  for (auto& r : recs) r.heart_rate = 150.0;
  const auto splits = calculate_split_analysis(two_legs(), recs);
  REQUIRE(splits.size() == 2);
  REQUIRE(splits[0].effort.has_value());
  REQUIRE(*splits[0].effort == EffortLevel::Moderate);
  REQUIRE(*splits[0].avg_heart_rate == Approx(150.0));

  const auto ra = calculate_race_analytics(two_legs(), recs);
  REQUIRE(ra->avg_hr_zone == 4);
}

TEST_CASE("invalid input yields no splits") {
  SECTION("cumulative distance going backwards") {
    std::vector<Segment> bad = {planned(1, "A", 5.0, 10.0, 10.0), planned(2, "B", 5.0, 5.0, 10.0)};
    REQUIRE(calculate_split_analysis(bad, steady_ten_miles()).empty());
    REQUIRE_FALSE(calculate_race_analytics(bad, steady_ten_miles()).has_value());
  }
  SECTION("empty activity") {
    REQUIRE(calculate_split_analysis(two_legs(), {}).empty());
    REQUIRE_FALSE(calculate_race_analytics(two_legs(), {}).has_value());
  }
}

TEST_CASE("align_checkpoints prefers GPS when every record has it") {
  auto recs = steady_ten_miles();
  for (std::size_t i = 0; i < recs.size(); ++i) {
    recs[i].lat = 45.0 + 0.001 * static_cast<double>(i);
    recs[i].lng = -110.0;
  }

  auto gps_cp = planned(1, "Lookout", 2.0, 2.0, 10.0);
  gps_cp.latitude = 45.0 + 0.001 * 30.0;
  gps_cp.longitude = -110.0;
  auto manual_cp = planned(2, "Creek", 3.0, 5.0, 10.0);

  const auto idx = align_checkpoints({gps_cp, manual_cp}, recs);
  REQUIRE(idx.size() == 2);
  REQUIRE(idx[0] == 30);
  REQUIRE(idx[1] == 50);

  recs[10].lat.reset();
  const auto by_distance = align_checkpoints({gps_cp, manual_cp}, recs);
  REQUIRE(by_distance[0] == 20);
}
