#pragma once

#include <string>

#include "parcelday/core/entities.h"
#include "parcelday/core/location_graph.h"
#include "parcelday/core/sim_config.h"

namespace parcelday {

// Location rows: address,city,zip,d0,d1,...,di. Row i (0-based, row 0 is the
// hub) lists its distances in miles to locations 0..i; the distance list ends
// at the first empty cell.
//
// Throws std::runtime_error with the offending row number.
LocationGraph parse_locations_csv(const std::string& text);

// Item rows: id,address,city,zip,deadline,weight,status,restriction,with...
//
// - address/city/zip must match a location exactly;
// - deadline is "H:MM AM|PM" or "EOD" (normalized to cfg.end_of_day);
// - status is empty, "At Hub", "At Package Hub", "Delayed" or "Undeliverable";
// - restriction is empty, "Truck N Only" or "Vehicle N Only";
// - trailing cells list co-delivery item ids, up to the first empty cell.
//
// Throws std::runtime_error with the offending row number.
ItemTable parse_items_csv(const std::string& text, const LocationGraph& graph, const SimConfig& cfg);

// Reads a SimConfig from JSON. Every key is optional:
//
//   {
//     "start_time": "08:00", "tick_seconds": 20, "end_of_day": "17:00",
//     "latest_stop": "23:59", "vehicles": 3, "capacity": 16, "initial_dispatch": 2,
//     "events": [
//       {"type": "delayed_arrival", "time": "9:05 AM"},
//       {"type": "address_correction", "time": "10:20 AM", "item": 9,
//        "address": "410 S State St", "city": "Salt Lake City", "zip": "84111"}
//     ]
//   }
//
// Event times take "H:MM AM|PM" or 24-hour "HH:MM". An address correction
// names its location either by "location" id or by "address" (plus optional
// "city" and "zip"). Throws std::runtime_error on malformed input.
SimConfig parse_sim_config_json(const std::string& text, const LocationGraph& graph);

struct Scenario {
  LocationGraph graph;
  ItemTable items;
  SimConfig cfg;
};

// Reads and parses the three scenario files. An empty config path keeps the defaults.
Scenario load_scenario(const std::string& locations_path, const std::string& items_path,
                       const std::string& config_path);

// Parses a user-entered stop time ("HH:MM", 24-hour) that must fall within
// [cfg.start_time, cfg.latest_stop]. On failure returns false and, if `error`
// is non-null, fills it with a message suitable for re-prompting.
bool parse_stop_time(const std::string& text, const SimConfig& cfg, TimeOfDay& out, std::string* error = nullptr);

} // namespace parcelday
