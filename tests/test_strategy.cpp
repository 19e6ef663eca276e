#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <upace/strategy.hpp>

using Catch::Approx;
using namespace upace;

TEST_CASE("generate_pace_options returns the three tiers in order") {
  auto opts = generate_pace_options(10.0, Confidence::Medium, "base");

  REQUIRE(opts[0].tier == StrategyTier::Aggressive);
  REQUIRE(opts[1].tier == StrategyTier::Balanced);
  REQUIRE(opts[2].tier == StrategyTier::Conservative);

  REQUIRE(opts[0].pace == Approx(9.3));
  REQUIRE(opts[1].pace == Approx(10.0));
  REQUIRE(opts[2].pace == Approx(10.8));
  REQUIRE(opts[0].adjustment_percent == Approx(-7.0));
  REQUIRE(opts[2].adjustment_percent == Approx(8.0));

  for (const auto& o : opts) {
    REQUIRE(o.reasoning == "base");
    REQUIRE_FALSE(o.suggested_hr.has_value());
    REQUIRE_FALSE(o.suggested_power.has_value());
  }
}

TEST_CASE("confidence shifts per tier and clamps") {
  auto high = generate_pace_options(10.0, Confidence::High, "");
  REQUIRE(high[0].confidence == Confidence::Medium);
  REQUIRE(high[1].confidence == Confidence::High);
  REQUIRE(high[2].confidence == Confidence::High);

  auto low = generate_pace_options(10.0, Confidence::Low, "");
  REQUIRE(low[0].confidence == Confidence::Low);
  REQUIRE(low[1].confidence == Confidence::Low);
  REQUIRE(low[2].confidence == Confidence::Medium);
}

TEST_CASE("HR and power targets scale with tier speed") {
  HrZoneSuggestion hr{140.0, 150.0, "Zone 2", "flat"};
  PowerZoneSuggestion pw;
  pw.min_watts = 200.0;
  pw.max_watts = 220.0;
  pw.zone_name = "Moderate";

  auto opts = generate_pace_options(10.0, Confidence::Medium, "", hr, pw);

  REQUIRE(opts[0].suggested_hr->min_bpm == Approx(145.0));
  REQUIRE(opts[0].suggested_hr->max_bpm == Approx(156.0));
  REQUIRE(opts[1].suggested_hr->min_bpm == Approx(140.0));
  REQUIRE(opts[1].suggested_hr->max_bpm == Approx(150.0));
  REQUIRE(opts[2].suggested_hr->min_bpm == Approx(135.0));
  REQUIRE(opts[2].suggested_hr->max_bpm == Approx(144.0));

  REQUIRE(opts[0].suggested_power->min_watts == Approx(215.0));
  REQUIRE(opts[0].suggested_power->max_watts == Approx(237.0));
  REQUIRE(opts[1].suggested_power->min_watts == Approx(200.0));

  REQUIRE(opts[0].suggested_hr->reasoning == "flat (pushed effort)");
  REQUIRE(opts[1].suggested_hr->reasoning == "flat");
}

TEST_CASE("HR targets stay within physiological bounds") {
  HrZoneSuggestion hr{215.0, 225.0, "Zone 5", ""};
  auto opts = generate_pace_options(10.0, Confidence::Medium, "", hr);
  REQUIRE(opts[0].suggested_hr->max_bpm <= 220.0);
  REQUIRE(opts[1].suggested_hr->max_bpm == Approx(220.0));
}

TEST_CASE("to_string(StrategyTier)") {
  REQUIRE(std::string(to_string(StrategyTier::Conservative)) == "conservative");
}
