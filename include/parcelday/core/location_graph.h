#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "parcelday/core/ids.h"

namespace parcelday {

// Distances are kept as integer tenths of a mile so mileage never drifts.
using DistanceTenths = std::int64_t;

constexpr int kTenthsPerUnit = 10;

// Converts a display distance (miles) to the nearest whole tenth.
DistanceTenths to_tenths(double distance);

struct Location {
  Id id{kInvalidId};
  // Display-only fields; routing never looks at them.
  std::string address;
  std::string city;
  std::string zip;
};

// Locations plus a symmetric distance table.
//
// Location ids are their insertion index, and id 0 is the hub. Distances are
// stored once per unordered pair as a lower-triangular table: row i holds the
// distances from location i to locations 0..i.
class LocationGraph {
 public:
  static constexpr Id kHubId = 0;

  // Appends a location and returns its id.
  //
  // `row` must hold at least id+1 entries (distances to 0..id, the last being
  // the zero self-distance); extra trailing entries are ignored. Throws
  // std::invalid_argument otherwise, or if any distance is negative.
  Id add_location(std::string address, std::string city, std::string zip, std::vector<DistanceTenths> row);

  std::size_t size() const { return locations_.size(); }
  bool empty() const { return locations_.empty(); }
  bool contains(Id id) const { return id >= 0 && static_cast<std::size_t>(id) < locations_.size(); }

  // Throws std::out_of_range on an unknown id.
  const Location& location(Id id) const;
  const std::vector<Location>& locations() const { return locations_; }

  DistanceTenths distance_tenths(Id a, Id b) const;
  double distance(Id a, Id b) const { return static_cast<double>(distance_tenths(a, b)) / kTenthsPerUnit; }

  std::optional<Id> find_location(const std::string& address, const std::string& city,
                                  const std::string& zip) const;
  // First location with this street address.
  std::optional<Id> find_by_address(const std::string& address) const;

 private:
  std::vector<Location> locations_;
  std::vector<std::vector<DistanceTenths>> rows_;
};

} // namespace parcelday
