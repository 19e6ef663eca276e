#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <upace/gap.hpp>

using Catch::Approx;
using namespace upace;

TEST_CASE("grade_cost_multiplier") {
  REQUIRE(grade_cost_multiplier(0.0) == Approx(1.0));
  REQUIRE(grade_cost_multiplier(10.0) == Approx(1.0 + 0.35 + 0.05));
  REQUIRE(grade_cost_multiplier(5.0) > grade_cost_multiplier(2.0));
  REQUIRE(grade_cost_multiplier(-5.0) < 1.0);
  REQUIRE(grade_cost_multiplier(-5.0) >= 0.7);
  REQUIRE(grade_cost_multiplier(-30.0) <= 1.2);
}

TEST_CASE("grade_adjusted_pace") {
  SECTION("uphill GAP is faster than actual") {
    REQUIRE(grade_adjusted_pace(12.0, 8.0) < 12.0);
    REQUIRE(grade_adjusted_pace(12.0, 8.0) == Approx(60.0 / (5.0 * 1.312)));
  }
  SECTION("gentle downhill GAP is slower than actual") {
    REQUIRE(grade_adjusted_pace(9.0, -5.0) > 9.0);
  }
  SECTION("near-flat is identity") {
    REQUIRE(grade_adjusted_pace(10.0, 0.3) == Approx(10.0));
    REQUIRE(grade_adjusted_pace(10.0, -0.49) == Approx(10.0));
  }
  SECTION("implausible results fall back to actual pace") {
    REQUIRE(grade_adjusted_pace(2.5, 20.0) == Approx(2.5));
    REQUIRE(grade_adjusted_pace(0.0, 5.0) == Approx(0.0));
  }
}

TEST_CASE("segment_gap") {
  std::vector<ActivityRecord> flat;
  for (int i = 0; i <= 10; ++i) {
    ActivityRecord r;
    r.distance = 0.1 * i;
    r.elevation = 200.0;
    r.pace = 10.0;
    flat.push_back(r);
  }

  SECTION("flat running has no GAP variance") {
    auto a = segment_gap(flat, 0.0, 1.0);
    REQUIRE(a.has_value());
    REQUIRE(a->avg_actual_pace == Approx(10.0));
    REQUIRE(a->avg_gap == Approx(10.0));
    REQUIRE(a->gap_variance == Approx(0.0).margin(1e-9));
    REQUIRE(a->effort == GapEffort::Similar);
  }

  SECTION("fewer than five records in range") {
    REQUIRE_FALSE(segment_gap(flat, 0.0, 0.35).has_value());
  }

  SECTION("climbing records read as harder effort") {
    auto climb = flat;
    for (std::size_t i = 0; i < climb.size(); ++i) {
      climb[i].elevation = 200.0 + 16.0934 * static_cast<double>(i); // 10%
      climb[i].pace = 14.0;
    }
    auto a = segment_gap(climb, 0.0, 1.0);
    REQUIRE(a.has_value());
    REQUIRE(a->avg_gap < a->avg_actual_pace);
    REQUIRE(a->effort == GapEffort::Harder);
  }
}

TEST_CASE("total_gap_time on flat ground equals elapsed time") {
  std::vector<ActivityRecord> recs;
  for (int i = 0; i <= 20; ++i) {
    ActivityRecord r;
    r.distance = 0.5 * i;
    r.pace = 9.0;
    recs.push_back(r);
  }
  REQUIRE(total_gap_time(recs) == Approx(90.0));
  REQUIRE(total_gap_time({}) == Approx(0.0));
}
