#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <vector>
#include <upace/types.hpp>

namespace upace {

// Upper edges (percent grade) of the first eight buckets; the ninth is
// open-ended. Bucket i covers [edge[i-1], edge[i]).
inline constexpr std::array<double, 8> kGradientEdges{
  -15.0, -6.0, -1.0, 1.0, 3.0, 6.0, 10.0, 15.0
};
inline constexpr std::size_t kGradientBucketCount = kGradientEdges.size() + 1;

struct GradientProfileConfig {
  double min_interval_miles = 0.05;  // merge records until the run reaches this
  int    min_samples = 3;            // below this a bucket is low-confidence
  double max_valid_pace = 30.0;      // min/mile; paces outside (0, max) are ignored
};

struct GradientBucket {
  double lower = 0.0;                  // percent, -inf for the first bucket
  double upper = 0.0;                  // percent, +inf for the last bucket
  double representative_gradient = 0.0;
  double avg_pace = 0.0;               // min/mile
  std::optional<double> avg_heart_rate;
  std::optional<double> avg_power;
  int sample_count = 0;
  bool low_confidence = true;

  bool populated() const { return sample_count > 0; }
};

struct GradientProfile {
  std::array<GradientBucket, kGradientBucketCount> buckets{};
  int interval_count = 0;

  bool empty() const { return interval_count == 0; }
};

// Bucket index for a grade, by binary search over kGradientEdges.
std::size_t gradient_bucket_index(double gradient_percent);

GradientProfile build_gradient_profile(const std::vector<ActivityRecord>& activity,
                                       const GradientProfileConfig& cfg = {});

struct GradientMatch {
  double pace = 0.0;
  double reference_gradient = 0.0;  // gradient the pace was observed at
  double gradient_gap = 0.0;        // |target - nearest contributing bucket|
  int samples = 0;                  // weakest contributing bucket
  std::optional<double> heart_rate;
  std::optional<double> power;
  bool interpolated = false;
  bool low_confidence = true;
  std::size_t bucket = 0;           // containing bucket of the target grade
};

// Containing bucket if populated, else linear interpolation between the
// nearest populated neighbours, else the single populated side.
std::optional<GradientMatch> match_gradient(const GradientProfile& profile,
                                            double gradient_percent);

} // namespace upace
