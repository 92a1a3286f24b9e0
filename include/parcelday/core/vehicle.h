#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

#include "parcelday/core/clock.h"
#include "parcelday/core/entities.h"
#include "parcelday/core/hub.h"
#include "parcelday/core/location_graph.h"
#include "parcelday/core/sim_event.h"

namespace parcelday {

// Everything a vehicle touches while driving. Built by the Simulation and
// passed down explicitly each tick.
struct SimContext {
  const LocationGraph& graph;
  const Clock& clock;
  Hub& hub;
  EventLog& events;
};

// Arrival targets. A delivery stop unloads matching items; the hub reloads.
struct StopVisit {
  Id location_id{kInvalidId};
};

struct HubVisit {
  Id location_id{kInvalidId};
};

using Destination = std::variant<StopVisit, HubVisit>;

Id destination_location(const Destination& d);

enum class VehicleState {
  Loading,  // at the hub with no destination yet
  EnRoute,  // distance left to the destination
  AtStop,   // arrived; delivery/reload happens in the same tick
  Waiting,  // parked at the hub, re-polling for a batch each tick
};

const char* vehicle_state_label(VehicleState s);

class Vehicle {
 public:
  Vehicle(Id id, std::size_t capacity, Id hub_location_id);

  Id id() const { return id_; }
  std::size_t capacity() const { return capacity_; }
  Id location_id() const { return location_id_; }
  const std::optional<Destination>& destination() const { return destination_; }
  const std::vector<Item*>& items() const { return items_; }
  bool waiting() const { return waiting_; }
  VehicleState state() const;

  // Mileage in tenths of a mile; exact.
  DistanceTenths tenths_driven() const { return tenths_driven_; }
  DistanceTenths tenths_to_destination() const { return tenths_to_destination_; }
  double miles_driven() const { return static_cast<double>(tenths_driven_) / kTenthsPerUnit; }

  // Loads an item if there is room and marks it OnVehicle. The first item
  // loaded into an empty vehicle sets the next destination. Returns false
  // when full.
  bool add_item(Item& item, const SimContext& ctx);

  // Asks the hub for the next batch and loads it. An empty batch parks the vehicle (Waiting).
  void request_batch(SimContext& ctx);

  // One tick: a waiting vehicle re-polls the hub; otherwise drive one tenth
  // toward the destination and handle the arrival when it is reached.
  void drive(SimContext& ctx);

 private:
  void arrive(SimContext& ctx);
  void deliver(SimContext& ctx);
  void set_destination(const SimContext& ctx);

  Id id_{kInvalidId};
  std::size_t capacity_{0};
  Id hub_location_id_{kInvalidId};
  Id location_id_{kInvalidId};

  std::optional<Destination> destination_;
  DistanceTenths tenths_to_destination_{0};
  DistanceTenths tenths_driven_{0};

  // Delivery order: front is the next stop.
  std::vector<Item*> items_;
  bool waiting_{false};
};

} // namespace parcelday
