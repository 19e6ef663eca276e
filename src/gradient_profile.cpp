#include <upace/gradient_profile.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace upace {

namespace {

struct Accum {
  double pace_sum = 0.0;
  double grad_sum = 0.0;
  double hr_sum = 0.0;
  double power_sum = 0.0;
  int n = 0;
  int hr_n = 0;
  int power_n = 0;
};

double bucket_midpoint(std::size_t i) {
  if (i == 0) return kGradientEdges.front() - 5.0;
  if (i + 1 == kGradientBucketCount) return kGradientEdges.back() + 5.0;
  return 0.5 * (kGradientEdges[i - 1] + kGradientEdges[i]);
}

std::optional<double> lerp_opt(const std::optional<double>& a,
                               const std::optional<double>& b, double t) {
  if (a && b) return *a + (*b - *a) * t;
  if (a) return a;
  return b;
}

} // namespace

std::size_t gradient_bucket_index(double gradient_percent) {
  auto it = std::upper_bound(kGradientEdges.begin(), kGradientEdges.end(), gradient_percent);
  return static_cast<std::size_t>(std::distance(kGradientEdges.begin(), it));
}

GradientProfile build_gradient_profile(const std::vector<ActivityRecord>& activity,
                                       const GradientProfileConfig& cfg) {
  GradientProfile prof;
  for (std::size_t i = 0; i < kGradientBucketCount; ++i) {
    auto& b = prof.buckets[i];
    b.lower = (i == 0) ? -std::numeric_limits<double>::infinity() : kGradientEdges[i - 1];
    b.upper = (i + 1 == kGradientBucketCount) ? std::numeric_limits<double>::infinity()
                                              : kGradientEdges[i];
    b.representative_gradient = bucket_midpoint(i);
  }
  if (activity.size() < 2) return prof;

  std::array<Accum, kGradientBucketCount> acc{};
  const double min_run = std::max(cfg.min_interval_miles, 1e-9);

  std::size_t anchor = 0;
  for (std::size_t j = 1; j < activity.size(); ++j) {
    const double run = activity[j].distance - activity[anchor].distance;
    if (run < 0.0) { anchor = j; continue; }
    if (run < min_run) continue;

    double pace_sum = 0.0, hr_sum = 0.0, pw_sum = 0.0;
    int pace_n = 0, hr_n = 0, pw_n = 0;
    for (std::size_t k = anchor + 1; k <= j; ++k) {
      const auto& r = activity[k];
      if (r.pace > 0.0 && r.pace < cfg.max_valid_pace) { pace_sum += r.pace; ++pace_n; }
      if (r.heart_rate && *r.heart_rate > 0.0)         { hr_sum += *r.heart_rate; ++hr_n; }
      if (r.power && *r.power > 0.0)                   { pw_sum += *r.power; ++pw_n; }
    }
    const double rise = activity[j].elevation - activity[anchor].elevation;
    anchor = j;
    if (pace_n == 0) continue;

    const double gradient = rise / (run * kMetersPerMile) * 100.0;
    if (!std::isfinite(gradient)) continue;

    auto& a = acc[gradient_bucket_index(gradient)];
    a.pace_sum += pace_sum / pace_n;
    a.grad_sum += gradient;
    ++a.n;
    if (hr_n > 0) { a.hr_sum += hr_sum / hr_n; ++a.hr_n; }
    if (pw_n > 0) { a.power_sum += pw_sum / pw_n; ++a.power_n; }
    ++prof.interval_count;
  }

  for (std::size_t i = 0; i < kGradientBucketCount; ++i) {
    const auto& a = acc[i];
    auto& b = prof.buckets[i];
    b.sample_count = a.n;
    b.low_confidence = a.n < cfg.min_samples;
    if (a.n == 0) continue;
    b.avg_pace = a.pace_sum / a.n;
    b.representative_gradient = a.grad_sum / a.n;
    if (a.hr_n > 0) b.avg_heart_rate = a.hr_sum / a.hr_n;
    if (a.power_n > 0) b.avg_power = a.power_sum / a.power_n;
  }
  return prof;
}

std::optional<GradientMatch> match_gradient(const GradientProfile& profile,
                                            double gradient_percent) {
  if (profile.empty() || !std::isfinite(gradient_percent)) return std::nullopt;

  const std::size_t idx = gradient_bucket_index(gradient_percent);
  const auto& own = profile.buckets[idx];

  auto from_bucket = [&](const GradientBucket& b) {
    GradientMatch m;
    m.pace = b.avg_pace;
    m.reference_gradient = b.representative_gradient;
    m.gradient_gap = std::fabs(gradient_percent - b.representative_gradient);
    m.samples = b.sample_count;
    m.heart_rate = b.avg_heart_rate;
    m.power = b.avg_power;
    m.low_confidence = b.low_confidence;
    m.bucket = idx;
    return m;
  };

  if (own.populated()) return from_bucket(own);

  const GradientBucket* lo = nullptr;
  for (std::size_t i = idx; i-- > 0;) {
    if (profile.buckets[i].populated()) { lo = &profile.buckets[i]; break; }
  }
  const GradientBucket* hi = nullptr;
  for (std::size_t i = idx + 1; i < kGradientBucketCount; ++i) {
    if (profile.buckets[i].populated()) { hi = &profile.buckets[i]; break; }
  }

  if (lo && hi) {
    const double span = hi->representative_gradient - lo->representative_gradient;
    double t = span > 0.0 ? (gradient_percent - lo->representative_gradient) / span : 0.5;
    t = std::clamp(t, 0.0, 1.0);

    GradientMatch m;
    m.pace = lo->avg_pace + (hi->avg_pace - lo->avg_pace) * t;
    m.reference_gradient = lo->representative_gradient + span * t;
    m.gradient_gap = std::min(std::fabs(gradient_percent - lo->representative_gradient),
                              std::fabs(gradient_percent - hi->representative_gradient));
    m.samples = std::min(lo->sample_count, hi->sample_count);
    m.heart_rate = lerp_opt(lo->avg_heart_rate, hi->avg_heart_rate, t);
    m.power = lerp_opt(lo->avg_power, hi->avg_power, t);
    m.interpolated = true;
    m.low_confidence = lo->low_confidence || hi->low_confidence;
    m.bucket = idx;
    return m;
  }
  if (lo) return from_bucket(*lo);
  if (hi) return from_bucket(*hi);
  return std::nullopt;
}

} // namespace upace
