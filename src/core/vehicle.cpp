#include "parcelday/core/vehicle.h"

#include <string>
#include <type_traits>
#include <utility>

#include "parcelday/util/log.h"

namespace parcelday {

Id destination_location(const Destination& d) {
  return std::visit([](const auto& v) { return v.location_id; }, d);
}

const char* vehicle_state_label(VehicleState s) {
  switch (s) {
    case VehicleState::Loading: return "Loading";
    case VehicleState::EnRoute: return "En route";
    case VehicleState::AtStop: return "At stop";
    case VehicleState::Waiting: return "Waiting";
  }
  return "Loading";
}

Vehicle::Vehicle(Id id, std::size_t capacity, Id hub_location_id)
    : id_(id), capacity_(capacity), hub_location_id_(hub_location_id), location_id_(hub_location_id) {}

VehicleState Vehicle::state() const {
  if (waiting_) return VehicleState::Waiting;
  if (tenths_to_destination_ > 0) return VehicleState::EnRoute;
  if (!destination_ || (location_id_ == hub_location_id_ && items_.empty())) return VehicleState::Loading;
  return VehicleState::AtStop;
}

bool Vehicle::add_item(Item& item, const SimContext& ctx) {
  if (items_.size() >= capacity_) return false;
  items_.push_back(&item);
  item.status = ItemStatus::on_vehicle(id_);
  if (items_.size() == 1) {
    set_destination(ctx);
    waiting_ = false;
  }
  return true;
}

void Vehicle::request_batch(SimContext& ctx) {
  const std::vector<Item*> batch = ctx.hub.next_batch(id_, capacity_ - items_.size());
  if (batch.empty()) {
    if (!waiting_) {
      ctx.events.push(ctx.clock.now(), EventLevel::Info, EventCategory::Dispatch,
                      "Vehicle " + std::to_string(id_) + " waiting at hub", id_);
    }
    waiting_ = true;
    return;
  }

  for (Item* item : batch) add_item(*item, ctx);
  ctx.events.push(ctx.clock.now(), EventLevel::Info, EventCategory::Dispatch,
                  "Vehicle " + std::to_string(id_) + " loaded " + std::to_string(batch.size()) + " items", id_);
}

void Vehicle::drive(SimContext& ctx) {
  if (waiting_) {
    request_batch(ctx);
    return;
  }
  if (tenths_to_destination_ > 0) {
    ++tenths_driven_;
    --tenths_to_destination_;
    if (tenths_to_destination_ == 0) arrive(ctx);
    return;
  }
  // Zero-length leg: the destination shares a spot with the current location.
  if (destination_ && destination_location(*destination_) != location_id_) arrive(ctx);
}

void Vehicle::arrive(SimContext& ctx) {
  // Copy: handling the arrival sets the next destination.
  const Destination reached = *destination_;
  location_id_ = destination_location(reached);
  std::visit(
      [&](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, StopVisit>) {
          deliver(ctx);
        } else if constexpr (std::is_same_v<T, HubVisit>) {
          request_batch(ctx);
        }
      },
      reached);
}

void Vehicle::deliver(SimContext& ctx) {
  const TimeOfDay now = ctx.clock.now();
  std::vector<Item*> still_aboard;
  still_aboard.reserve(items_.size());
  for (Item* item : items_) {
    if (item->location_id != location_id_) {
      still_aboard.push_back(item);
      continue;
    }
    const bool on_time = now <= item->deadline;
    item->status = ItemStatus::delivered(id_, now, on_time);
    ctx.events.push(now, on_time ? EventLevel::Info : EventLevel::Warn, EventCategory::Delivery,
                    "Item " + std::to_string(item->id) + " delivered by vehicle " + std::to_string(id_) +
                        (on_time ? " (on time)" : " (late)"),
                    id_, item->id);
    if (!on_time) {
      log::warn("Item " + std::to_string(item->id) + " delivered late at " + now.to_string() + " (deadline " +
                item->deadline.to_string() + ")");
    }
  }
  items_ = std::move(still_aboard);
  set_destination(ctx);
}

void Vehicle::set_destination(const SimContext& ctx) {
  if (items_.empty()) {
    destination_ = HubVisit{hub_location_id_};
  } else {
    destination_ = StopVisit{items_.front()->location_id};
  }
  tenths_to_destination_ = ctx.graph.distance_tenths(location_id_, destination_location(*destination_));
}

} // namespace parcelday
