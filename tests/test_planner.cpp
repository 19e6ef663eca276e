#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <upace/planner.hpp>

using Catch::Approx;
using namespace upace;

static std::vector<TrackPoint> flat_course() {
  std::vector<TrackPoint> pts;
  for (int i = 0; i <= 10; ++i) pts.push_back({static_cast<double>(i), 250.0, 0.0, 0.0});
  return pts;
}

static std::vector<ActivityRecord> six_flat_miles() {
  std::vector<ActivityRecord> recs;
  for (int i = 0; i <= 60; ++i) {
    ActivityRecord r;
    r.distance = i / 10.0;
    r.elevation = 250.0;
    r.pace = 9.0;
    recs.push_back(r);
  }
  return recs;
}

static std::vector<Segment> two_legs() {
  Segment a;
  a.order = 1;
  a.checkpoint_name = "Aid 1";
  a.segment_distance = 5.0;
  a.cumulative_distance = 5.0;
  a.checkpoint_time_minutes = 3.0;
  a.nutrition.push_back(NutritionItem{"gel", 25.0, 100.0, 0.0, 2.0});
  Segment b;
  b.order = 2;
  b.checkpoint_name = "Finish";
  b.segment_distance = 5.0;
  b.cumulative_distance = 10.0;
  return {b, a};  // out of order on purpose
}

static PlanOptions with_fatigue(double f) {
  PlanOptions opt;
  opt.fatigue_factor = f;
  return opt;
}

TEST_CASE("build_race_plan without fatigue") {
  auto plan = build_race_plan(flat_course(), two_legs(), six_flat_miles(), nullptr, with_fatigue(0.0));
  REQUIRE(plan.has_value());
  REQUIRE(plan->segments.size() == 2);
  REQUIRE(plan->segments[0].segment.checkpoint_name == "Aid 1");

  for (const auto& sp : plan->segments) {
    REQUIRE(sp.pace == Approx(9.0));
    REQUIRE(sp.derivation.confidence == Confidence::High);
    REQUIRE(sp.segment.predicted_time_minutes.has_value());
    REQUIRE(*sp.segment.predicted_time_minutes == Approx(45.0));
    REQUIRE_FALSE(sp.energy.has_value());
  }
  REQUIRE(plan->total_minutes_without_fatigue == Approx(90.0));
  REQUIRE(plan->total_minutes_with_fatigue == Approx(90.0));

  REQUIRE(plan->summary.running_minutes == Approx(90.0));
  REQUIRE(plan->summary.checkpoint_minutes == Approx(3.0));
  REQUIRE(plan->summary.total_minutes == Approx(93.0));
}

TEST_CASE("fatigue lengthens the plan") {
  auto plan = build_race_plan(flat_course(), two_legs(), six_flat_miles(), nullptr, with_fatigue(2.0));
  REQUIRE(plan.has_value());
  REQUIRE(plan->fatigue_factor == Approx(2.0));
  REQUIRE(plan->total_minutes_with_fatigue > plan->total_minutes_without_fatigue);
  REQUIRE(plan->segments[1].minutes_with_fatigue > plan->segments[0].minutes_with_fatigue);
}

TEST_CASE("short recordings use the default fatigue factor") {
  auto plan = build_race_plan(flat_course(), two_legs(), six_flat_miles());
  REQUIRE(plan.has_value());
  REQUIRE(plan->fatigue_factor == Approx(kDefaultFatigueFactor));
}

TEST_CASE("energy balance is folded when an athlete is given") {
  const auto athlete = athlete_by_key("default");
  REQUIRE(athlete.has_value());
  auto plan = build_race_plan(flat_course(), two_legs(), six_flat_miles(),
                              &athlete->metrics, with_fatigue(0.0));
  REQUIRE(plan.has_value());
  REQUIRE(plan->segments[0].energy.has_value());
  REQUIRE(plan->segments[1].energy.has_value());
  REQUIRE(plan->segments[0].energy->segment_calories_consumed == Approx(200.0));
  REQUIRE(plan->segments[1].energy->next.distance_miles == Approx(10.0));
}

TEST_CASE("tier and custom pace select the planned pace") {
  auto opt = with_fatigue(0.0);
  opt.tier = StrategyTier::Conservative;
  auto plan = build_race_plan(flat_course(), two_legs(), six_flat_miles(), nullptr, opt);
  REQUIRE(plan.has_value());
  REQUIRE(plan->segments[0].pace == Approx(9.72));

  auto segs = two_legs();
  segs[0].custom_pace = 11.0;  // Finish
  auto custom = build_race_plan(flat_course(), segs, six_flat_miles(), nullptr, with_fatigue(0.0));
  REQUIRE(custom.has_value());
  REQUIRE(custom->segments[1].pace == Approx(11.0));
  REQUIRE(custom->segments[0].pace == Approx(9.0));
}

TEST_CASE("segments out of cumulative order are rejected") {
  auto segs = two_legs();
  segs[0].cumulative_distance = 3.0;  // Finish before Aid 1
  REQUIRE_FALSE(build_race_plan(flat_course(), segs, six_flat_miles()).has_value());
}

TEST_CASE("descent load is scored per segment and for the race") {
  // 100 m of drop per mile, about -6.2%.
  std::vector<TrackPoint> downhill;
  for (int i = 0; i <= 10; ++i) {
    downhill.push_back({static_cast<double>(i), 2000.0 - 100.0 * i, 0.0, 0.0});
  }
  auto plan = build_race_plan(downhill, two_legs(), six_flat_miles(), nullptr, with_fatigue(0.0));
  REQUIRE(plan.has_value());

  double score_sum = 0.0;
  for (const auto& sp : plan->segments) {
    REQUIRE(sp.loss_m == Approx(500.0));
    REQUIRE(sp.eccentric.gradient < -6.0);
    REQUIRE(sp.eccentric.strategy.category == DescentCategory::Moderate);
    REQUIRE(sp.eccentric.score > 0.0);
    score_sum += sp.eccentric.score;
  }
  REQUIRE(plan->eccentric.total_loss_m == Approx(1000.0));
  REQUIRE(plan->eccentric.total_score == Approx(score_sum));
  REQUIRE(plan->eccentric.steep_descent_segments == 0);

  auto flat = build_race_plan(flat_course(), two_legs(), six_flat_miles(), nullptr, with_fatigue(0.0));
  REQUIRE(flat.has_value());
  REQUIRE(flat->eccentric.total_score == 0.0);
  REQUIRE(flat->eccentric.level == EccentricLoadLevel::Low);
}
