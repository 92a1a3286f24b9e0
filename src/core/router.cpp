#include "parcelday/core/router.h"

#include <limits>

namespace parcelday {

std::vector<Id> greedy_route(const LocationGraph& graph, const std::vector<Id>& locations, Id start) {
  std::vector<Id> remaining = locations;
  std::vector<Id> route;
  route.reserve(remaining.size());

  Id last = start;
  while (!remaining.empty()) {
    std::size_t best = 0;
    DistanceTenths best_dist = std::numeric_limits<DistanceTenths>::max();
    for (std::size_t i = 0; i < remaining.size(); ++i) {
      const DistanceTenths d = graph.distance_tenths(last, remaining[i]);
      if (d < best_dist) {
        best_dist = d;
        best = i;
      }
    }
    last = remaining[best];
    route.push_back(last);
    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
  }
  return route;
}

std::vector<Id> distinct_locations(const std::vector<Item*>& items) {
  HashTable<Id, bool> seen;
  std::vector<Id> out;
  for (const Item* item : items) {
    if (seen.contains(item->location_id)) continue;
    seen.put(item->location_id, true);
    out.push_back(item->location_id);
  }
  return out;
}

std::vector<Item*> sort_by_route(const LocationGraph& graph, const std::vector<Item*>& items, Id start) {
  std::vector<Item*> out;
  out.reserve(items.size());
  for (Id loc : greedy_route(graph, distinct_locations(items), start)) {
    for (Item* item : items) {
      if (item->location_id == loc) out.push_back(item);
    }
  }
  return out;
}

} // namespace parcelday
