#include "parcelday/core/scenario.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "parcelday/util/file_io.h"
#include "parcelday/util/json.h"
#include "parcelday/util/strings.h"

namespace parcelday {
namespace {

std::runtime_error row_error(const char* file, std::size_t row, const std::string& msg) {
  return std::runtime_error(std::string(file) + " row " + std::to_string(row + 1) + ": " + msg);
}

const std::string& cell(const std::vector<std::string>& row, std::size_t i) {
  static const std::string kEmpty;
  return i < row.size() ? row[i] : kEmpty;
}

int parse_int_cell(const std::string& raw, const char* what) {
  const std::string s = trim_copy(raw);
  if (!is_digits(s) || s.size() > 9) throw std::runtime_error(std::string("invalid ") + what + " '" + raw + "'");
  return std::stoi(s);
}

DistanceTenths parse_distance_cell(const std::string& raw) {
  const std::string s = trim_copy(raw);
  std::size_t used = 0;
  double d = 0.0;
  try {
    d = std::stod(s, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (s.empty() || used != s.size()) throw std::runtime_error("invalid distance '" + raw + "'");
  return to_tenths(d);
}

ItemStatus parse_status(const std::string& raw) {
  const std::string s = to_lower(trim_copy(raw));
  if (s.empty() || s == "at hub" || s == "at package hub") return ItemStatus::at_hub();
  if (s == "delayed") return ItemStatus::delayed();
  if (s == "undeliverable") return ItemStatus::undeliverable();
  throw std::runtime_error("unknown status '" + raw + "'");
}

// "Truck 2 Only" / "Vehicle 2 Only" -> 2; empty -> kInvalidId.
Id parse_restriction(const std::string& raw) {
  const std::string s = to_lower(trim_copy(raw));
  if (s.empty()) return kInvalidId;

  const auto words = split(s, ' ');
  if (words.size() == 3 && (words[0] == "truck" || words[0] == "vehicle") && words[2] == "only" &&
      is_digits(words[1]) && words[1].size() <= 9) {
    return static_cast<Id>(std::stoi(words[1]));
  }
  throw std::runtime_error("unknown restriction '" + raw + "'");
}

// "9:05 AM" or "09:05".
TimeOfDay parse_event_time(const std::string& text) {
  const std::string lower = to_lower(text);
  if (lower.find("am") != std::string::npos || lower.find("pm") != std::string::npos) {
    return parse_deadline(text, TimeOfDay()).time;
  }
  return TimeOfDay::parse_clock(text);
}

Id event_location(const json::Value& ev, const LocationGraph& graph) {
  if (const auto* loc = ev.find("location")) return static_cast<Id>(loc->int_value(kInvalidId));

  const auto* addr = ev.find("address");
  if (!addr) throw std::runtime_error("address_correction needs 'location' or 'address'");
  const std::string address = addr->string_value();

  std::optional<Id> found;
  const auto* city = ev.find("city");
  const auto* zip = ev.find("zip");
  if (city && zip) {
    found = graph.find_location(address, city->string_value(), zip->string_value());
  } else {
    found = graph.find_by_address(address);
  }
  if (!found) throw std::runtime_error("address_correction names unknown address '" + address + "'");
  return *found;
}

ScheduledEvent parse_event(const json::Value& ev, const LocationGraph& graph) {
  if (!ev.is_object()) throw std::runtime_error("each event must be an object");

  const auto* time = ev.find("time");
  if (!time || !time->is_string()) throw std::runtime_error("event is missing 'time'");
  const std::string type = ev.find("type") ? ev.at("type").string_value() : std::string();

  ScheduledEvent out;
  out.at = parse_event_time(time->string_value());
  if (type == "delayed_arrival") {
    out.action = DelayedArrival{};
  } else if (type == "address_correction") {
    const auto* item = ev.find("item");
    if (!item || !item->is_number()) throw std::runtime_error("address_correction is missing 'item'");
    out.action = AddressCorrection{static_cast<Id>(item->int_value()), event_location(ev, graph)};
  } else {
    throw std::runtime_error("unknown event type '" + type + "'");
  }
  return out;
}

} // namespace

LocationGraph parse_locations_csv(const std::string& text) {
  LocationGraph graph;
  const auto rows = parse_csv(text);
  for (std::size_t r = 0; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (row.size() < 4) throw row_error("locations", r, "expected address,city,zip and distances");

    std::vector<DistanceTenths> distances;
    try {
      for (std::size_t i = 3; i < row.size() && !trim_copy(row[i]).empty(); ++i) {
        distances.push_back(parse_distance_cell(row[i]));
      }
      graph.add_location(trim_copy(row[0]), trim_copy(row[1]), trim_copy(row[2]), std::move(distances));
    } catch (const std::exception& e) {
      throw row_error("locations", r, e.what());
    }
  }
  return graph;
}

ItemTable parse_items_csv(const std::string& text, const LocationGraph& graph, const SimConfig& cfg) {
  ItemTable items;
  const auto rows = parse_csv(text);
  for (std::size_t r = 0; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (row.size() < 6) throw row_error("items", r, "expected id,address,city,zip,deadline,weight");

    Item item;
    try {
      item.id = static_cast<Id>(parse_int_cell(row[0], "item id"));

      const auto loc = graph.find_location(trim_copy(row[1]), trim_copy(row[2]), trim_copy(row[3]));
      if (!loc) throw std::runtime_error("no location matches '" + trim_copy(row[1]) + "'");
      item.location_id = *loc;

      item.deadline_text = trim_copy(row[4]);
      const Deadline dl = parse_deadline(item.deadline_text, cfg.end_of_day);
      item.deadline = dl.time;
      item.end_of_day = dl.end_of_day;

      item.weight_kg = parse_int_cell(row[5], "weight");
      item.status = parse_status(cell(row, 6));
      item.required_vehicle_id = parse_restriction(cell(row, 7));

      for (std::size_t i = 8; i < row.size() && !trim_copy(row[i]).empty(); ++i) {
        item.deliver_with.push_back(static_cast<Id>(parse_int_cell(row[i], "co-delivery id")));
      }
    } catch (const std::exception& e) {
      throw row_error("items", r, e.what());
    }

    if (items.contains(item.id)) throw row_error("items", r, "duplicate item id " + std::to_string(item.id));
    items.put(item.id, std::move(item));
  }
  return items;
}

SimConfig parse_sim_config_json(const std::string& text, const LocationGraph& graph) {
  const json::Value root = json::parse(text);
  if (!root.is_object()) throw std::runtime_error("config: top-level value must be an object");

  SimConfig cfg;
  if (const auto* v = root.find("start_time")) cfg.start_time = TimeOfDay::parse_clock(v->string_value());
  if (const auto* v = root.find("tick_seconds")) cfg.tick_seconds = v->int_value(cfg.tick_seconds);
  if (const auto* v = root.find("end_of_day")) cfg.end_of_day = TimeOfDay::parse_clock(v->string_value());
  if (const auto* v = root.find("latest_stop")) cfg.latest_stop = TimeOfDay::parse_clock(v->string_value());
  if (const auto* v = root.find("vehicles")) cfg.vehicle_count = static_cast<int>(v->int_value(cfg.vehicle_count));
  if (const auto* v = root.find("capacity")) {
    cfg.vehicle_capacity = static_cast<int>(v->int_value(cfg.vehicle_capacity));
  }
  if (const auto* v = root.find("initial_dispatch")) {
    cfg.initial_dispatch = static_cast<int>(v->int_value(cfg.initial_dispatch));
  }

  if (const auto* evs = root.find("events")) {
    if (!evs->is_array()) throw std::runtime_error("config: 'events' must be an array");
    for (std::size_t i = 0; i < evs->array().size(); ++i) {
      try {
        cfg.events.push_back(parse_event(evs->at(i), graph));
      } catch (const std::exception& e) {
        throw std::runtime_error("config: events[" + std::to_string(i) + "]: " + e.what());
      }
    }
  }
  return cfg;
}

Scenario load_scenario(const std::string& locations_path, const std::string& items_path,
                       const std::string& config_path) {
  Scenario s;
  s.graph = parse_locations_csv(read_text_file(locations_path));
  if (!config_path.empty()) s.cfg = parse_sim_config_json(read_text_file(config_path), s.graph);
  s.items = parse_items_csv(read_text_file(items_path), s.graph, s.cfg);
  return s;
}

bool parse_stop_time(const std::string& text, const SimConfig& cfg, TimeOfDay& out, std::string* error) {
  TimeOfDay t;
  try {
    t = TimeOfDay::parse_clock(text);
  } catch (const std::runtime_error& e) {
    if (error) *error = e.what();
    return false;
  }
  if (t < cfg.start_time || t > cfg.latest_stop) {
    if (error) {
      *error = "Stop time must be between " + cfg.start_time.to_string().substr(0, 5) + " and " +
               cfg.latest_stop.to_string().substr(0, 5);
    }
    return false;
  }
  out = t;
  return true;
}

} // namespace parcelday
