#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "parcelday/core/ids.h"
#include "parcelday/core/time_of_day.h"
#include "parcelday/util/hash_table.h"

namespace parcelday {

enum class ItemStatusKind : std::uint8_t {
  AtHub = 0,
  // Not yet at the hub; becomes AtHub when the delayed-arrival event fires.
  Delayed = 1,
  // Wrong address on file; becomes AtHub when the address correction fires.
  Undeliverable = 2,
  OnVehicle = 3,
  Delivered = 4,
};

struct ItemStatus {
  ItemStatusKind kind{ItemStatusKind::AtHub};

  // OnVehicle / Delivered: the carrying vehicle.
  Id vehicle_id{kInvalidId};

  // Delivered only.
  TimeOfDay delivered_at;
  bool on_time{false};

  static ItemStatus at_hub() { return ItemStatus{}; }
  static ItemStatus delayed() { return of_kind(ItemStatusKind::Delayed); }
  static ItemStatus undeliverable() { return of_kind(ItemStatusKind::Undeliverable); }
  static ItemStatus on_vehicle(Id vehicle_id) {
    ItemStatus s = of_kind(ItemStatusKind::OnVehicle);
    s.vehicle_id = vehicle_id;
    return s;
  }
  static ItemStatus delivered(Id vehicle_id, TimeOfDay at, bool on_time) {
    ItemStatus s = of_kind(ItemStatusKind::Delivered);
    s.vehicle_id = vehicle_id;
    s.delivered_at = at;
    s.on_time = on_time;
    return s;
  }

 private:
  static ItemStatus of_kind(ItemStatusKind kind) {
    ItemStatus s;
    s.kind = kind;
    return s;
  }
};

struct Item {
  Id id{kInvalidId};
  Id location_id{kInvalidId};
  int weight_kg{0};

  // As given in the input ("10:30 AM", "EOD"); kept for reporting.
  std::string deadline_text;
  TimeOfDay deadline;
  bool end_of_day{false};

  ItemStatus status;

  // kInvalidId: any vehicle may carry it.
  Id required_vehicle_id{kInvalidId};

  // Items that must ship on the same vehicle in the same batch. Need not be
  // symmetric in the input; the hub indexes the relation both ways.
  std::vector<Id> deliver_with;

  bool has_priority_deadline() const { return !end_of_day; }
  bool delivered() const { return status.kind == ItemStatusKind::Delivered; }
};

// Master list of items, keyed by item id.
using ItemTable = HashTable<Id, Item>;

} // namespace parcelday
