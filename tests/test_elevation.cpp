#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <upace/elevation.hpp>

using Catch::Approx;
using namespace upace;

static std::vector<TrackPoint> bumpy() {
  return {
    {0.0, 100.0, 0, 0},
    {1.0, 110.0, 0, 0},
    {2.0, 105.0, 0, 0},
    {3.0, 120.0, 0, 0},
    {4.0, 120.0, 0, 0},
  };
}

TEST_CASE("segment_elevation sums gain and loss inside the window") {
  const auto pts = bumpy();

  SECTION("whole track") {
    auto st = segment_elevation(pts, 0.0, 4.0);
    REQUIRE(st.has_value());
    REQUIRE(st->gain_m == Approx(25.0));
    REQUIRE(st->loss_m == Approx(5.0));
    REQUIRE(st->net_m == Approx(20.0));
    REQUIRE(st->min_m == Approx(100.0));
    REQUIRE(st->max_m == Approx(120.0));
  }

  SECTION("inner window") {
    auto st = segment_elevation(pts, 1.0, 3.0);
    REQUIRE(st.has_value());
    REQUIRE(st->gain_m == Approx(15.0));
    REQUIRE(st->loss_m == Approx(5.0));
  }

  SECTION("window between two samples is interpolated") {
    auto st = segment_elevation(pts, 1.2, 1.8);
    REQUIRE(st.has_value());
    REQUIRE(st->gain_m == Approx(0.0));
    REQUIRE(st->loss_m == Approx(3.0));
    REQUIRE(st->max_m == Approx(109.0));
    REQUIRE(st->min_m == Approx(106.0));
    REQUIRE(st->covered_miles == Approx(0.6));
  }

  SECTION("window edges are interpolated around interior points") {
    auto st = segment_elevation(pts, 0.5, 2.5);
    REQUIRE(st.has_value());
    // 105 -> 110 -> 105 -> 112.5
    REQUIRE(st->gain_m == Approx(12.5));
    REQUIRE(st->loss_m == Approx(5.0));
  }

  SECTION("window running past the end is clipped") {
    auto st = segment_elevation(pts, 3.0, 6.0);
    REQUIRE(st.has_value());
    REQUIRE(st->covered_miles == Approx(1.0));
    REQUIRE(st->gain_m == Approx(0.0));
  }

  SECTION("no overlap with the track") {
    REQUIRE_FALSE(segment_elevation(pts, 4.5, 6.0).has_value());
    REQUIRE_FALSE(segment_elevation(pts, 4.0, 6.0).has_value());
    REQUIRE_FALSE(segment_elevation({}, 0.0, 10.0).has_value());
    REQUIRE_FALSE(segment_elevation({pts[0]}, 0.0, 10.0).has_value());
  }
}

TEST_CASE("gradient_percent") {
  REQUIRE(gradient_percent(16.0934, 0.1) == Approx(10.0));
  REQUIRE(gradient_percent(-16.0934, 0.1) == Approx(-10.0));
  REQUIRE(gradient_percent(50.0, 0.0) == Approx(0.0));
}

TEST_CASE("classify_climb") {
  REQUIRE(classify_climb(12.0, 100.0) == ClimbType::Steep);
  REQUIRE(classify_climb(16.0, 100.0) == ClimbType::VerySteep);
  REQUIRE(classify_climb(4.0, 100.0) == ClimbType::Moderate);
  REQUIRE(classify_climb(12.0, 10.0) == ClimbType::FlatRolling); // under 50 ft of gain
  REQUIRE(std::string(to_string(ClimbType::ModerateSteep)) == "Moderate-Steep");
}
