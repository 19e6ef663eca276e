#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <upace/fatigue.hpp>

using Catch::Approx;
using namespace upace;

TEST_CASE("fatigue_multiplier is linear in distance") {
  REQUIRE(fatigue_multiplier(0.0, 3.0) == Approx(1.0));
  REQUIRE(fatigue_multiplier(10.0, 3.0) == Approx(1.03));
  REQUIRE(fatigue_multiplier(100.0, 2.0) == Approx(1.2));
  REQUIRE(expected_pace_at(10.0, 50.0, 0.0) == Approx(10.0));
  REQUIRE(expected_pace_at(10.0, 20.0, 5.0) == Approx(11.0));
}

TEST_CASE("FatigueCurve") {
  SECTION("default spacing is one point per mile plus the origin") {
    auto curve = generate_fatigue_curve(10.0, 50.0, 2.0);
    REQUIRE(curve.size() == 51);
    const auto last = curve.at(curve.size() - 1);
    REQUIRE(last.distance == Approx(50.0));
    REQUIRE(last.fatigue_multiplier == Approx(1.1));
    REQUIRE(last.expected_pace == Approx(11.0));
    REQUIRE(last.percent_degradation == Approx(10.0));
    REQUIRE(curve.at(0).distance == Approx(0.0));
  }

  SECTION("iteration can be repeated with identical results") {
    auto curve = generate_fatigue_curve(10.0, 30.0, 3.0, 6);
    const auto a = curve.to_vector();
    const auto b = curve.to_vector();
    REQUIRE(a.size() == 7);
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
      REQUIRE(a[i].distance == b[i].distance);
      REQUIRE(a[i].expected_pace == b[i].expected_pace);
    }
    std::size_t n = 0;
    for (const auto p : curve) { (void)p; ++n; }
    REQUIRE(n == 7);
  }

  SECTION("explicit point count sets the spacing") {
    auto curve = generate_fatigue_curve(10.0, 50.0, 2.0, 4);
    REQUIRE(curve.size() == 5);
    REQUIRE(curve.at(1).distance == Approx(12.5));
    REQUIRE(curve.at(4).distance == Approx(50.0));
  }

  SECTION("zero distance gives a single fresh point") {
    auto curve = generate_fatigue_curve(10.0, 0.0, 2.0);
    REQUIRE(curve.size() == 1);
    REQUIRE(curve.at(0).distance == Approx(0.0));
    REQUIRE(curve.at(0).expected_pace == Approx(10.0));
    REQUIRE(curve.at(0).fatigue_multiplier == Approx(1.0));
  }

  SECTION("zero fatigue factor keeps every point at the base pace") {
    auto curve = generate_fatigue_curve(9.5, 100.0, 0.0);
    REQUIRE(curve.size() == 101);
    std::size_t n = 0;
    for (const auto p : curve) {
      REQUIRE(p.expected_pace == Approx(9.5));
      REQUIRE(p.fatigue_multiplier == Approx(1.0));
      REQUIRE(p.percent_degradation == Approx(0.0).margin(1e-12));
      ++n;
    }
    REQUIRE(n == curve.size());
  }
}

TEST_CASE("calculate_total_time_with_fatigue") {
  const double t = calculate_total_time_with_fatigue(10.0, 100.0, 3.0);
  REQUIRE(t == Approx(1150.0));
  REQUIRE(t > 1000.0);
  REQUIRE(t < 1300.0);

  REQUIRE(calculate_total_time_with_fatigue(10.0, 100.0, 0.0) == Approx(1000.0));
  REQUIRE(calculate_total_time_with_fatigue(10.0, 0.0, 3.0) == Approx(0.0));

  SECTION("monotonic in distance and factor") {
    REQUIRE(calculate_total_time_with_fatigue(10.0, 60.0, 3.0) >
            calculate_total_time_with_fatigue(10.0, 50.0, 3.0));
    REQUIRE(calculate_total_time_with_fatigue(10.0, 50.0, 4.0) >
            calculate_total_time_with_fatigue(10.0, 50.0, 3.0));
  }

  SECTION("segment times add up to the total") {
    const double sum = segment_time_with_fatigue(10.0, 0.0, 30.0, 3.0)
                     + segment_time_with_fatigue(10.0, 30.0, 60.0, 3.0)
                     + segment_time_with_fatigue(10.0, 60.0, 100.0, 3.0);
    REQUIRE(sum == Approx(t));
    REQUIRE(segment_time_with_fatigue(10.0, 60.0, 30.0, 3.0) == Approx(0.0));
  }
}

TEST_CASE("calculate_actual_fade_rate") {
  SECTION("recovers the factor used to generate the paces") {
    std::vector<double> paces, dists;
    for (int i = 0; i <= 100; ++i) {
      const double d = i / 2.0;
      dists.push_back(d);
      paces.push_back(expected_pace_at(10.0, d, 3.0));
    }
    REQUIRE(calculate_actual_fade_rate(paces, dists) == Approx(3.0).epsilon(0.05));
  }

  SECTION("degenerate input") {
    REQUIRE(calculate_actual_fade_rate({10.0}, {0.0}) == Approx(0.0));
    REQUIRE(calculate_actual_fade_rate({10.0, 11.0}, {0.0}) == Approx(0.0));
    REQUIRE(calculate_actual_fade_rate({}, {}) == Approx(0.0));
  }
}

TEST_CASE("compare_fatigue") {
  REQUIRE(compare_fatigue(3.0, 1.5).performance == FatiguePerformance::Better);
  REQUIRE(compare_fatigue(3.0, 3.5).performance == FatiguePerformance::Similar);
  auto worse = compare_fatigue(3.0, 5.0);
  REQUIRE(worse.performance == FatiguePerformance::Worse);
  REQUIRE(worse.difference == Approx(2.0));
  REQUIRE(worse.message.find("2.0%") != std::string::npos);
}

TEST_CASE("fatigue_description") {
  REQUIRE(std::string(fatigue_description(2.0)) == "Fresh");
  REQUIRE(std::string(fatigue_description(7.0)) == "Mild fatigue");
  REQUIRE(std::string(fatigue_description(12.0)) == "Moderate fatigue");
  REQUIRE(std::string(fatigue_description(17.0)) == "Significant fatigue");
  REQUIRE(std::string(fatigue_description(25.0)) == "Severe fatigue");
}

TEST_CASE("estimate_fatigue_factor") {
  auto recording = [](double factor, int n) {
    std::vector<ActivityRecord> recs;
    for (int i = 0; i < n; ++i) {
      ActivityRecord r;
      r.distance = i / 10.0;
      r.pace = expected_pace_at(10.0, r.distance, factor);
      recs.push_back(r);
    }
    return recs;
  };

  SECTION("short recordings use the default") {
    REQUIRE(estimate_fatigue_factor(recording(3.0, 49)) == Approx(kDefaultFatigueFactor));
  }

  SECTION("30 miles of steady fade") {
    const double f = estimate_fatigue_factor(recording(3.0, 301));
    REQUIRE(f > 2.5);
    REQUIRE(f < 3.5);
  }

  SECTION("negative splits clamp to zero") {
    REQUIRE(estimate_fatigue_factor(recording(-3.0, 301)) == Approx(0.0));
  }
}
