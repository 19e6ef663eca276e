#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <upace/types.hpp>

namespace upace {

// Copy sorted by Segment::order (stable for equal orders).
std::vector<Segment> sort_by_order(const std::vector<Segment>& segments);

// Index of the first segment whose cumulative distance is below its
// predecessor's, or nullopt when the list is well ordered.
std::optional<std::size_t> check_segment_order(const std::vector<Segment>& segments);

// Sort by order and verify cumulative distances. nullopt on violation.
std::optional<std::vector<Segment>> ordered_segments(const std::vector<Segment>& segments);

// Distance at which the segment starts (never below zero).
double segment_start_distance(const Segment& s);

} // namespace upace
