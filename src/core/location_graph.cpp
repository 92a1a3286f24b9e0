#include "parcelday/core/location_graph.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace parcelday {

DistanceTenths to_tenths(double distance) {
  return static_cast<DistanceTenths>(std::llround(distance * kTenthsPerUnit));
}

Id LocationGraph::add_location(std::string address, std::string city, std::string zip,
                               std::vector<DistanceTenths> row) {
  const Id id = static_cast<Id>(locations_.size());
  const std::size_t needed = locations_.size() + 1;
  if (row.size() < needed) {
    throw std::invalid_argument("Distance row for location " + std::to_string(id) + " has " +
                                std::to_string(row.size()) + " entries, expected " + std::to_string(needed));
  }
  row.resize(needed);
  if (std::any_of(row.begin(), row.end(), [](DistanceTenths d) { return d < 0; })) {
    throw std::invalid_argument("Negative distance for location " + std::to_string(id));
  }

  locations_.push_back(Location{id, std::move(address), std::move(city), std::move(zip)});
  rows_.push_back(std::move(row));
  return id;
}

const Location& LocationGraph::location(Id id) const {
  if (!contains(id)) throw std::out_of_range("Unknown location id: " + std::to_string(id));
  return locations_[static_cast<std::size_t>(id)];
}

DistanceTenths LocationGraph::distance_tenths(Id a, Id b) const {
  if (!contains(a) || !contains(b)) {
    throw std::out_of_range("Unknown location id in distance lookup: " + std::to_string(a) + ", " +
                            std::to_string(b));
  }
  const auto row = static_cast<std::size_t>(std::max(a, b));
  const auto col = static_cast<std::size_t>(std::min(a, b));
  return rows_[row][col];
}

std::optional<Id> LocationGraph::find_location(const std::string& address, const std::string& city,
                                               const std::string& zip) const {
  for (const auto& loc : locations_) {
    if (loc.address == address && loc.city == city && loc.zip == zip) return loc.id;
  }
  return std::nullopt;
}

std::optional<Id> LocationGraph::find_by_address(const std::string& address) const {
  for (const auto& loc : locations_) {
    if (loc.address == address) return loc.id;
  }
  return std::nullopt;
}

} // namespace parcelday
