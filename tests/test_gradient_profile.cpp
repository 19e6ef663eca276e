#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <upace/gradient_profile.hpp>

using Catch::Approx;
using namespace upace;

// 2 flat miles at 9:00 then 2 miles of 5% climbing at 12:00.
static std::vector<ActivityRecord> flat_then_climb() {
  std::vector<ActivityRecord> recs;
  for (int i = 0; i <= 20; ++i) {
    ActivityRecord r;
    r.distance = 0.1 * i;
    r.elevation = 100.0;
    r.pace = 9.0;
    r.heart_rate = 140.0;
    recs.push_back(r);
  }
  for (int k = 1; k <= 20; ++k) {
    ActivityRecord r;
    r.distance = 0.1 * (20 + k);
    r.elevation = 100.0 + 8.0467 * k;
    r.pace = 12.0;
    r.heart_rate = 160.0;
    recs.push_back(r);
  }
  return recs;
}

TEST_CASE("gradient_bucket_index follows the edge table") {
  REQUIRE(gradient_bucket_index(0.0) == 3);
  REQUIRE(gradient_bucket_index(5.0) == 5);
  REQUIRE(gradient_bucket_index(-20.0) == 0);
  REQUIRE(gradient_bucket_index(20.0) == 8);
  REQUIRE(gradient_bucket_index(15.0) == 8);
  REQUIRE(gradient_bucket_index(-15.0) == 1);
}

TEST_CASE("build_gradient_profile") {
  const auto prof = build_gradient_profile(flat_then_climb());

  REQUIRE_FALSE(prof.empty());
  REQUIRE(prof.interval_count == 40);

  const auto& flat = prof.buckets[3];
  REQUIRE(flat.sample_count == 20);
  REQUIRE(flat.avg_pace == Approx(9.0));
  REQUIRE(flat.avg_heart_rate.has_value());
  REQUIRE(*flat.avg_heart_rate == Approx(140.0));
  REQUIRE_FALSE(flat.low_confidence);

  const auto& climb = prof.buckets[5];
  REQUIRE(climb.sample_count == 20);
  REQUIRE(climb.avg_pace == Approx(12.0));
  REQUIRE(climb.representative_gradient == Approx(5.0).epsilon(0.001));

  REQUIRE_FALSE(prof.buckets[4].populated());
  REQUIRE(prof.buckets[4].low_confidence);
}

TEST_CASE("short recordings build an empty profile") {
  REQUIRE(build_gradient_profile({}).empty());
  ActivityRecord one;
  one.pace = 10.0;
  REQUIRE(build_gradient_profile({one}).empty());
}

TEST_CASE("match_gradient") {
  const auto prof = build_gradient_profile(flat_then_climb());

  SECTION("populated bucket is used directly") {
    auto m = match_gradient(prof, 0.2);
    REQUIRE(m.has_value());
    REQUIRE(m->pace == Approx(9.0));
    REQUIRE_FALSE(m->interpolated);
    REQUIRE(m->samples == 20);
  }

  SECTION("empty bucket interpolates between neighbours") {
    auto m = match_gradient(prof, 2.0);
    REQUIRE(m.has_value());
    REQUIRE(m->interpolated);
    REQUIRE(m->pace == Approx(10.2).epsilon(0.001));
    REQUIRE(m->heart_rate.has_value());
    REQUIRE(*m->heart_rate == Approx(148.0).epsilon(0.001));
    REQUIRE(m->reference_gradient == Approx(2.0).epsilon(0.001));
  }

  SECTION("one-sided lookup takes the nearest populated bucket") {
    auto m = match_gradient(prof, 12.0);
    REQUIRE(m.has_value());
    REQUIRE(m->pace == Approx(12.0));
    REQUIRE_FALSE(m->interpolated);
  }

  SECTION("empty profile has no match") {
    REQUIRE_FALSE(match_gradient(GradientProfile{}, 0.0).has_value());
  }
}
