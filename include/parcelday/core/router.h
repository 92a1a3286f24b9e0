#pragma once

#include <vector>

#include "parcelday/core/entities.h"
#include "parcelday/core/location_graph.h"

namespace parcelday {

// Nearest-neighbour visiting order over `locations`, starting from `start`.
//
// Each step picks the unvisited location closest to the previously visited
// one; ties go to the location that appears first in `locations`. The order is
// never revisited, so this is a heuristic tour, not a shortest path.
// `locations` must not contain duplicates. O(n^2).
std::vector<Id> greedy_route(const LocationGraph& graph, const std::vector<Id>& locations, Id start);

// Distinct delivery locations of `items`, in first-encountered order.
std::vector<Id> distinct_locations(const std::vector<Item*>& items);

// Reorders items to follow greedy_route over their locations. Items sharing a
// location keep their relative order.
std::vector<Item*> sort_by_route(const LocationGraph& graph, const std::vector<Item*>& items, Id start);

} // namespace parcelday
