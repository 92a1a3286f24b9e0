#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "parcelday/core/clock.h"
#include "parcelday/core/entities.h"
#include "parcelday/core/hub.h"
#include "parcelday/core/location_graph.h"
#include "parcelday/core/sim_config.h"
#include "parcelday/core/sim_event.h"
#include "parcelday/core/vehicle.h"

namespace parcelday {

struct RunResult {
  // True if every item was delivered and every vehicle is back at the hub.
  bool finished{false};
  TimeOfDay ended_at;
  std::int64_t ticks{0};
};

// One delivery day. Owns the map, the items, the clock, the hub and the fleet.
//
// The hub keeps pointers into items(), so a Simulation can be neither copied
// nor moved; hold it by value in place or through a unique_ptr.
class Simulation {
 public:
  // Validates the scenario and indexes the items.
  //
  // Throws std::runtime_error listing every validation error; warnings are
  // only logged.
  Simulation(LocationGraph graph, ItemTable items, SimConfig cfg);

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;
  Simulation(Simulation&&) = delete;
  Simulation& operator=(Simulation&&) = delete;

  const SimConfig& cfg() const { return cfg_; }
  const LocationGraph& graph() const { return graph_; }
  const ItemTable& items() const { return items_; }
  const Clock& clock() const { return clock_; }
  const Hub& hub() const { return hub_; }
  const std::vector<Vehicle>& vehicles() const { return vehicles_; }
  const EventLog& events() const { return events_; }

  // nullptr if no such vehicle.
  const Vehicle* find_vehicle(Id vehicle_id) const;

  // Hands the first cfg().initial_dispatch vehicles their first batch. Only
  // the first call does anything.
  void start();
  bool started() const { return started_; }

  // Advances the clock one increment, fires due events, then drives every vehicle.
  void tick();

  // start(), then tick() until finished or the clock reaches `stop`.
  RunResult run_until(TimeOfDay stop);

  // Nothing left at the hub, nothing aboard any vehicle, and every vehicle parked at the hub.
  bool is_finished() const;

  DistanceTenths total_tenths_driven() const;
  double total_miles_driven() const { return static_cast<double>(total_tenths_driven()) / kTenthsPerUnit; }

 private:
  SimContext context();
  void fire_due_events();

  LocationGraph graph_;
  ItemTable items_;
  SimConfig cfg_;
  Clock clock_;
  EventLog events_;
  Hub hub_;
  std::vector<Vehicle> vehicles_;
  bool started_{false};
};

} // namespace parcelday
