#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <upace/eccentric.hpp>

using Catch::Approx;
using namespace upace;

static double feet(double ft) { return ft / kFeetPerMeter; }

TEST_CASE("descent_strategy categories") {
  REQUIRE(descent_strategy(2.0).category == DescentCategory::Easy);
  REQUIRE(descent_strategy(-3.0).pace_multiplier == Approx(0.95));
  REQUIRE(descent_strategy(-6.0).category == DescentCategory::Easy);
  REQUIRE(descent_strategy(-8.0).category == DescentCategory::Moderate);
  REQUIRE(descent_strategy(-8.0).pace_multiplier == Approx(1.0));
  REQUIRE(descent_strategy(-12.0).category == DescentCategory::Technical);
  REQUIRE(descent_strategy(-15.0).category == DescentCategory::Technical);
  REQUIRE(descent_strategy(-16.0).category == DescentCategory::Extreme);
  REQUIRE(descent_strategy(-16.0).pace_multiplier == Approx(1.25));
}

TEST_CASE("segment_eccentric_score") {
  SECTION("climbs and flats carry no eccentric load") {
    REQUIRE(segment_eccentric_score(0.0, 5.0, feet(2000.0)) == 0.0);
    REQUIRE(segment_eccentric_score(8.0, 5.0, feet(2000.0)) == 0.0);
  }

  SECTION("grade severity times distance and loss") {
    // 12 + 2*4 = 20 points, 2 mi -> x1, 1000 ft -> x1
    REQUIRE(segment_eccentric_score(-8.0, 2.0, feet(1000.0)) == Approx(20.0));
    // 68 + 12 = 80 points, x0.5, x0.5
    REQUIRE(segment_eccentric_score(-16.0, 1.0, feet(500.0)) == Approx(20.0));
  }

  SECTION("capped at 100") {
    REQUIRE(segment_eccentric_score(-12.0, 4.0, feet(2000.0)) == Approx(100.0));
    REQUIRE(segment_eccentric_score(-25.0, 20.0, feet(9000.0)) == Approx(100.0));
  }
}

TEST_CASE("analyze_segment_eccentric_load warnings") {
  SECTION("gentle descent has none") {
    auto a = analyze_segment_eccentric_load(-4.0, 2.0, feet(400.0));
    REQUIRE(a.warnings.empty());
    REQUIRE(a.strategy.category == DescentCategory::Easy);
  }

  SECTION("short steep drop") {
    auto a = analyze_segment_eccentric_load(-16.0, 1.0, feet(500.0));
    REQUIRE(a.warnings.size() == 1);
    REQUIRE(a.score == Approx(20.0));
  }

  SECTION("long extreme descent trips every rule") {
    auto a = analyze_segment_eccentric_load(-22.0, 3.0, feet(2000.0));
    REQUIRE(a.score == Approx(100.0));
    REQUIRE(a.warnings.size() == 4);
    REQUIRE(a.strategy.category == DescentCategory::Extreme);
  }
}

TEST_CASE("eccentric_load_level thresholds") {
  REQUIRE(eccentric_load_level(0.0) == EccentricLoadLevel::Low);
  REQUIRE(eccentric_load_level(99.9) == EccentricLoadLevel::Low);
  REQUIRE(eccentric_load_level(100.0) == EccentricLoadLevel::Moderate);
  REQUIRE(eccentric_load_level(250.0) == EccentricLoadLevel::High);
  REQUIRE(eccentric_load_level(500.0) == EccentricLoadLevel::Extreme);
  REQUIRE(std::string(to_string(EccentricLoadLevel::High)) == "high");
}

TEST_CASE("calculate_race_eccentric_summary") {
  SECTION("mixed course") {
    const std::vector<EccentricSegmentInput> segs = {
      {-8.0, 2.0, feet(1000.0)},   // 20
      {-12.0, 4.0, feet(2000.0)},  // 100
      {5.0, 3.0, 100.0},           // climb, ignored
      {-16.0, 1.0, feet(500.0)},   // 20
    };
    const auto s = calculate_race_eccentric_summary(segs);
    REQUIRE(s.total_score == Approx(140.0));
    REQUIRE(s.total_loss_m == Approx(feet(3500.0)));
    REQUIRE(s.level == EccentricLoadLevel::Moderate);
    REQUIRE(s.steep_descent_segments == 2);
    REQUIRE(s.extreme_descent_segments == 1);
    REQUIRE(s.recommendations.size() == 2);
  }

  SECTION("heavy downhill course asks for eccentric training") {
    std::vector<EccentricSegmentInput> segs(6, {-12.0, 4.0, feet(2000.0)});
    const auto s = calculate_race_eccentric_summary(segs);
    REQUIRE(s.total_score == Approx(600.0));
    REQUIRE(s.level == EccentricLoadLevel::Extreme);
    // total loss, steep count, two training lines
    REQUIRE(s.recommendations.size() == 4);
  }

  SECTION("empty course") {
    const auto s = calculate_race_eccentric_summary({});
    REQUIRE(s.total_score == 0.0);
    REQUIRE(s.level == EccentricLoadLevel::Low);
    REQUIRE(s.recommendations.empty());
  }
}
