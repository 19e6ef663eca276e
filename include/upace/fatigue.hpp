#pragma once
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include <upace/types.hpp>

namespace upace {

struct FatigueCurvePoint {
  double distance = 0.0;           // miles
  double fatigue_multiplier = 1.0; // 1.0 = fresh
  double expected_pace = 0.0;      // min/mile
  double percent_degradation = 0.0;
};

// 1 + (distance / 10) * (factor / 100). factor is percent per 10 miles.
double fatigue_multiplier(double distance, double fatigue_factor);
double expected_pace_at(double base_pace, double distance, double fatigue_factor);

// Evenly spaced samples 0..total_distance (num_points + 1 of them),
// computed on demand. Holds only the four parameters, so it can be
// iterated any number of times with identical results.
class FatigueCurve {
public:
  class const_iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = FatigueCurvePoint;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = FatigueCurvePoint;

    const_iterator() = default;
    FatigueCurvePoint operator*() const { return curve_->at(i_); }
    const_iterator& operator++() { ++i_; return *this; }
    const_iterator operator++(int) { auto t = *this; ++i_; return t; }
    bool operator==(const const_iterator& o) const { return i_ == o.i_; }
    bool operator!=(const const_iterator& o) const { return i_ != o.i_; }

  private:
    friend class FatigueCurve;
    const_iterator(const FatigueCurve* c, std::size_t i) : curve_(c), i_(i) {}
    const FatigueCurve* curve_ = nullptr;
    std::size_t i_ = 0;
  };

  FatigueCurve(double base_pace, double total_distance, double fatigue_factor,
               std::size_t num_points);

  std::size_t size() const { return degenerate_() ? 1 : num_points_ + 1; }
  FatigueCurvePoint at(std::size_t i) const;

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, size()); }

  std::vector<FatigueCurvePoint> to_vector() const;

private:
  bool degenerate_() const;

  double base_pace_;
  double total_distance_;
  double fatigue_factor_;
  std::size_t num_points_;
};

// num_points defaults to ceil(total_distance). Zero or non-finite
// distance yields a single fresh point at distance 0.
FatigueCurve generate_fatigue_curve(double base_pace, double total_distance,
                                    double fatigue_factor,
                                    std::optional<std::size_t> num_points = std::nullopt);

// Trapezoid over 100 fixed steps; minutes. Zero for degenerate input.
double calculate_total_time_with_fatigue(double base_pace, double total_distance,
                                         double fatigue_factor);

// Same integration over [start, end] miles of course distance.
double segment_time_with_fatigue(double base_pace, double start_miles, double end_miles,
                                 double fatigue_factor);

// Observed fade in percent per 10 miles from a first-half / second-half
// split. 0 for fewer than two samples, mismatched sizes or an empty half.
double calculate_actual_fade_rate(const std::vector<double>& paces,
                                  const std::vector<double>& distances);

enum class FatiguePerformance : int { Better, Similar, Worse };

struct FatigueComparison {
  double difference = 0.0;         // actual - expected, percentage points
  FatiguePerformance performance = FatiguePerformance::Similar;
  std::string message;
};

FatigueComparison compare_fatigue(double expected_factor, double actual_fade_rate);

// "Fresh", "Mild fatigue", ... "Severe fatigue".
const char* fatigue_description(double percent_degradation);

// Percent per 10 miles from 10-mile chunks of a recording, clamped to
// 0..8. 2.0 when the recording is too short to tell.
double estimate_fatigue_factor(const std::vector<ActivityRecord>& activity);

inline constexpr double kDefaultFatigueFactor = 2.0;

} // namespace upace
