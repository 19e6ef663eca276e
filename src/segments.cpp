#include <upace/segments.hpp>
#include <algorithm>

namespace upace {

std::vector<Segment> sort_by_order(const std::vector<Segment>& segments) {
  std::vector<Segment> out = segments;
  std::stable_sort(out.begin(), out.end(),
                   [](const Segment& a, const Segment& b){ return a.order < b.order; });
  return out;
}

std::optional<std::size_t> check_segment_order(const std::vector<Segment>& segments) {
  for (std::size_t i = 1; i < segments.size(); ++i) {
    if (segments[i].cumulative_distance < segments[i-1].cumulative_distance) return i;
  }
  return std::nullopt;
}

std::optional<std::vector<Segment>> ordered_segments(const std::vector<Segment>& segments) {
  auto sorted = sort_by_order(segments);
  if (check_segment_order(sorted).has_value()) return std::nullopt;
  return sorted;
}

double segment_start_distance(const Segment& s) {
  return std::max(0.0, s.cumulative_distance - s.segment_distance);
}

} // namespace upace
