#include "parcelday/core/report.h"

#include <algorithm>
#include <sstream>
#include <vector>

#include "parcelday/util/json.h"
#include "parcelday/util/strings.h"

namespace parcelday {
namespace {

const char* status_json_label(ItemStatusKind k) {
  switch (k) {
    case ItemStatusKind::AtHub: return "at_hub";
    case ItemStatusKind::Delayed: return "delayed";
    case ItemStatusKind::Undeliverable: return "undeliverable";
    case ItemStatusKind::OnVehicle: return "on_vehicle";
    case ItemStatusKind::Delivered: return "delivered";
  }
  return "at_hub";
}

std::vector<const Item*> items_by_id(const ItemTable& items) {
  std::vector<const Item*> out;
  out.reserve(items.length());
  for (const auto& kv : items) out.push_back(&kv.second);
  std::sort(out.begin(), out.end(), [](const Item* a, const Item* b) { return a->id < b->id; });
  return out;
}

std::string location_label(const LocationGraph& graph, Id id) {
  if (!graph.contains(id)) return "?";
  const Location& loc = graph.location(id);
  return loc.address + ", " + loc.city + ", " + loc.zip;
}

} // namespace

std::string item_status_label(const Item& item) {
  const ItemStatus& s = item.status;
  switch (s.kind) {
    case ItemStatusKind::AtHub: return "At Hub";
    case ItemStatusKind::Delayed: return "Delayed";
    case ItemStatusKind::Undeliverable: return "Undeliverable";
    case ItemStatusKind::OnVehicle: return "On Vehicle " + std::to_string(s.vehicle_id);
    case ItemStatusKind::Delivered:
      return "Delivered at " + s.delivered_at.to_string() + " by vehicle " + std::to_string(s.vehicle_id) +
             (s.on_time ? " (On time)" : " (Late)");
  }
  return "At Hub";
}

std::string format_miles(DistanceTenths tenths) {
  const char* sign = tenths < 0 ? "-" : "";
  if (tenths < 0) tenths = -tenths;
  return sign + std::to_string(tenths / kTenthsPerUnit) + "." + std::to_string(tenths % kTenthsPerUnit);
}

std::string format_status_report(const Simulation& sim) {
  constexpr std::size_t kLocationWidth = 60;

  std::ostringstream out;
  out << "Current time: " << sim.clock().now().to_string() << "\n";
  out << "Item ID | " << pad_right("Delivery Location", kLocationWidth) << " | Weight | Deadline | Status\n";
  for (const Item* item : items_by_id(sim.items())) {
    out << pad_left(std::to_string(item->id), 7) << " | "
        << pad_right(location_label(sim.graph(), item->location_id), kLocationWidth) << " | "
        << pad_left(std::to_string(item->weight_kg) + " kg", 6) << " | " << pad_right(item->deadline_text, 8)
        << " | " << item_status_label(*item) << "\n";
  }
  out << "\n";
  for (const auto& v : sim.vehicles()) {
    out << "Vehicle " << v.id() << " has driven " << format_miles(v.tenths_driven()) << " miles\n";
  }
  out << "Total miles driven: " << format_miles(sim.total_tenths_driven()) << "\n";
  return out.str();
}

std::string status_to_json(const Simulation& sim) {
  json::Array items;
  for (const Item* item : items_by_id(sim.items())) {
    json::Object obj;
    obj["id"] = static_cast<double>(item->id);
    obj["location_id"] = static_cast<double>(item->location_id);
    obj["location"] = location_label(sim.graph(), item->location_id);
    obj["deadline"] = item->deadline_text;
    obj["weight_kg"] = static_cast<double>(item->weight_kg);
    obj["status"] = std::string(status_json_label(item->status.kind));
    obj["vehicle_id"] = static_cast<double>(item->status.vehicle_id);
    if (item->delivered()) {
      obj["delivered_at"] = item->status.delivered_at.to_string();
      obj["on_time"] = item->status.on_time;
    }
    items.emplace_back(std::move(obj));
  }

  json::Array vehicles;
  for (const auto& v : sim.vehicles()) {
    json::Object obj;
    obj["id"] = static_cast<double>(v.id());
    obj["location_id"] = static_cast<double>(v.location_id());
    obj["state"] = std::string(vehicle_state_label(v.state()));
    obj["tenths_driven"] = static_cast<double>(v.tenths_driven());
    obj["miles_driven"] = v.miles_driven();
    obj["items_aboard"] = static_cast<double>(v.items().size());
    vehicles.emplace_back(std::move(obj));
  }

  json::Object root;
  root["time"] = sim.clock().now().to_string();
  root["finished"] = sim.is_finished();
  root["total_tenths_driven"] = static_cast<double>(sim.total_tenths_driven());
  root["items"] = std::move(items);
  root["vehicles"] = std::move(vehicles);

  std::string text = json::stringify(json::Value(std::move(root)), 2);
  text += "\n";
  return text;
}

std::string events_to_csv(const EventLog& log) {
  std::string csv = "seq,time,level,category,vehicle_id,item_id,message\n";
  csv.reserve(csv.size() + log.size() * 80);

  for (const auto& ev : log.events()) {
    csv += std::to_string(static_cast<unsigned long long>(ev.seq));
    csv += ",";
    csv += ev.time.to_string();
    csv += ",";
    csv += event_level_label(ev.level);
    csv += ",";
    csv += event_category_label(ev.category);
    csv += ",";
    if (ev.vehicle_id != kInvalidId) csv += std::to_string(ev.vehicle_id);
    csv += ",";
    if (ev.item_id != kInvalidId) csv += std::to_string(ev.item_id);
    csv += ",";
    csv += csv_escape(ev.message);
    csv += "\n";
  }
  return csv;
}

} // namespace parcelday
