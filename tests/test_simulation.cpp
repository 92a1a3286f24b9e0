#include <iostream>
#include <stdexcept>
#include <string>

#include "parcelday/core/simulation.h"

#define PD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using parcelday::Id;
using parcelday::Item;
using parcelday::ItemStatus;
using parcelday::ItemTable;
using parcelday::LocationGraph;
using parcelday::SimConfig;
using parcelday::TimeOfDay;

Item make_item(Id id, Id location_id, const std::string& deadline = "EOD") {
  Item it;
  it.id = id;
  it.location_id = location_id;
  it.deadline_text = deadline;
  const auto d = parcelday::parse_deadline(deadline, TimeOfDay::from_hms(17, 0));
  it.deadline = d.time;
  it.end_of_day = d.end_of_day;
  return it;
}

// hub --1.0-- near, hub --8.0-- far, near --8.5-- far.
LocationGraph make_graph() {
  LocationGraph g;
  g.add_location("Hub", "Town", "0", {0});
  g.add_location("Near", "Town", "1", {10, 0});
  g.add_location("Far", "Town", "2", {80, 85, 0});
  return g;
}

std::size_t count_category(const parcelday::EventLog& log, parcelday::EventCategory c) {
  std::size_t n = 0;
  for (const auto& ev : log.events()) {
    if (ev.category == c) ++n;
  }
  return n;
}

bool construction_fails(const LocationGraph& g, const ItemTable& items, const SimConfig& cfg) {
  try {
    parcelday::Simulation sim(g, items, cfg);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_simulation() {
  const TimeOfDay five_pm = TimeOfDay::from_hms(17, 0);

  // Two locations, one EOD item: deliver and come back with exact mileage.
  {
    LocationGraph g;
    g.add_location("Hub", "Town", "0", {0});
    g.add_location("Stop", "Town", "1", {25, 0});
    ItemTable items;
    items.put(1, make_item(1, 1));

    parcelday::Simulation sim(g, items, SimConfig{});
    PD_ASSERT(sim.vehicles().size() == 3);
    PD_ASSERT(!sim.is_finished());

    const auto res = sim.run_until(five_pm);
    PD_ASSERT(res.finished);
    PD_ASSERT(res.ticks == 50);
    PD_ASSERT(res.ended_at == TimeOfDay::from_hms(8, 16, 40));

    const Item& it = sim.items().get(1);
    PD_ASSERT(it.delivered());
    PD_ASSERT(it.status.on_time);
    PD_ASSERT(it.status.vehicle_id == 1);
    PD_ASSERT(it.status.delivered_at == TimeOfDay::from_hms(8, 8, 20));

    PD_ASSERT(sim.total_tenths_driven() == 50);
    PD_ASSERT(sim.total_miles_driven() == 5.0);
    PD_ASSERT(sim.find_vehicle(1)->tenths_driven() == 50);
    PD_ASSERT(sim.find_vehicle(2)->tenths_driven() == 0);
    PD_ASSERT(sim.find_vehicle(4) == nullptr);
    PD_ASSERT(count_category(sim.events(), parcelday::EventCategory::Delivery) == 1);

    // Finished runs do not tick further.
    const auto again = sim.run_until(five_pm);
    PD_ASSERT(again.ticks == 0);
  }

  // Stopping early leaves the clock at the stop time.
  {
    const LocationGraph g = make_graph();
    ItemTable items;
    items.put(1, make_item(1, 2));
    parcelday::Simulation sim(g, items, SimConfig{});
    const auto res = sim.run_until(TimeOfDay::from_hms(8, 10));
    PD_ASSERT(!res.finished);
    PD_ASSERT(res.ended_at == TimeOfDay::from_hms(8, 10));
    PD_ASSERT(res.ticks == 30);
    PD_ASSERT(sim.items().get(1).status.kind == parcelday::ItemStatusKind::OnVehicle);
    PD_ASSERT(sim.total_tenths_driven() == 30);
  }

  // Delayed items stay put until the delayed-arrival event fires.
  {
    const LocationGraph g = make_graph();
    ItemTable items;
    Item late = make_item(1, 1);
    late.status = ItemStatus::delayed();
    items.put(1, late);

    SimConfig cfg;
    cfg.events.push_back(parcelday::ScheduledEvent{TimeOfDay::from_hms(9, 5), parcelday::DelayedArrival{}});

    parcelday::Simulation sim(g, items, cfg);
    const auto before = sim.run_until(TimeOfDay::from_hms(9, 4, 40));
    PD_ASSERT(!before.finished);
    PD_ASSERT(sim.items().get(1).status.kind == parcelday::ItemStatusKind::Delayed);
    PD_ASSERT(sim.hub().is_delayed(1));
    PD_ASSERT(sim.total_tenths_driven() == 0);
    PD_ASSERT(!sim.cfg().events[0].fired);

    const auto after = sim.run_until(five_pm);
    PD_ASSERT(after.finished);
    PD_ASSERT(sim.cfg().events[0].fired);
    const Item& it = sim.items().get(1);
    PD_ASSERT(it.delivered());
    PD_ASSERT(it.status.delivered_at == TimeOfDay::from_hms(9, 8, 20));
    PD_ASSERT(count_category(sim.events(), parcelday::EventCategory::Schedule) == 1);
  }

  // Address correction fires once and re-routes the item.
  {
    LocationGraph g;
    g.add_location("Hub", "Town", "0", {0});
    g.add_location("Wrong", "Town", "1", {10, 0});
    g.add_location("Right", "Town", "2", {20, 10, 0});
    ItemTable items;
    Item misaddressed = make_item(1, 1);
    misaddressed.status = ItemStatus::undeliverable();
    items.put(1, misaddressed);

    SimConfig cfg;
    cfg.events.push_back(
        parcelday::ScheduledEvent{TimeOfDay::from_hms(8, 20), parcelday::AddressCorrection{1, 2}});

    parcelday::Simulation sim(g, items, cfg);
    const auto res = sim.run_until(five_pm);
    PD_ASSERT(res.finished);
    const Item& it = sim.items().get(1);
    PD_ASSERT(it.location_id == 2);
    PD_ASSERT(it.status.delivered_at == TimeOfDay::from_hms(8, 26, 40));
    PD_ASSERT(sim.total_tenths_driven() == 40);
    PD_ASSERT(count_category(sim.events(), parcelday::EventCategory::Schedule) == 1);
  }

  // The late-delivery repair gets the 8:30 item there on time.
  {
    const LocationGraph g = make_graph();
    ItemTable items;
    items.put(1, make_item(1, 2, "8:30 AM"));
    items.put(2, make_item(2, 1));

    SimConfig cfg;
    cfg.vehicle_count = 1;
    cfg.initial_dispatch = 1;
    parcelday::Simulation sim(g, items, cfg);
    const auto res = sim.run_until(five_pm);
    PD_ASSERT(res.finished);

    const Item& urgent = sim.items().get(1);
    PD_ASSERT(urgent.status.on_time);
    PD_ASSERT(urgent.status.delivered_at == TimeOfDay::from_hms(8, 26, 40));
    PD_ASSERT(sim.items().get(2).status.delivered_at == TimeOfDay::from_hms(8, 55));
    PD_ASSERT(sim.total_tenths_driven() == 175);
  }

  // Restricted items only ride on their vehicle.
  {
    const LocationGraph g = make_graph();
    ItemTable items;
    Item only_two = make_item(1, 1);
    only_two.required_vehicle_id = 2;
    items.put(1, only_two);
    items.put(2, make_item(2, 2));

    parcelday::Simulation sim(g, items, SimConfig{});
    const auto res = sim.run_until(five_pm);
    PD_ASSERT(res.finished);
    PD_ASSERT(sim.items().get(1).status.vehicle_id == 2);
    PD_ASSERT(sim.items().get(2).status.vehicle_id == 1);

    parcelday::DistanceTenths sum = 0;
    for (const auto& v : sim.vehicles()) sum += v.tenths_driven();
    PD_ASSERT(sum == sim.total_tenths_driven());
    PD_ASSERT(sim.find_vehicle(1)->tenths_driven() == 160);
    PD_ASSERT(sim.find_vehicle(2)->tenths_driven() == 20);
    PD_ASSERT(sim.find_vehicle(3)->tenths_driven() == 0);
  }

  // Correcting a delayed item's address does not release it early.
  {
    const LocationGraph g = make_graph();
    ItemTable items;
    Item late = make_item(1, 1);
    late.status = ItemStatus::delayed();
    items.put(1, late);

    SimConfig cfg;
    cfg.vehicle_count = 1;
    cfg.initial_dispatch = 1;
    cfg.events.push_back(
        parcelday::ScheduledEvent{TimeOfDay::from_hms(8, 20), parcelday::AddressCorrection{1, 2}});
    cfg.events.push_back(parcelday::ScheduledEvent{TimeOfDay::from_hms(9, 0), parcelday::DelayedArrival{}});

    parcelday::Simulation sim(g, items, cfg);
    const auto before = sim.run_until(TimeOfDay::from_hms(8, 30));
    PD_ASSERT(!before.finished);
    PD_ASSERT(sim.cfg().events[0].fired);
    PD_ASSERT(sim.items().get(1).location_id == 2);
    PD_ASSERT(sim.items().get(1).status.kind == parcelday::ItemStatusKind::Delayed);
    PD_ASSERT(sim.hub().is_delayed(1));
    PD_ASSERT(sim.total_tenths_driven() == 0);

    const auto after = sim.run_until(five_pm);
    PD_ASSERT(after.finished);
    const Item& it = sim.items().get(1);
    PD_ASSERT(it.delivered());
    PD_ASSERT(it.status.delivered_at == TimeOfDay::from_hms(9, 26, 40));
    PD_ASSERT(sim.total_tenths_driven() == 160);
  }

  // Invalid scenarios are rejected up front.
  {
    const LocationGraph g = make_graph();
    ItemTable at_hub;
    at_hub.put(1, make_item(1, LocationGraph::kHubId));
    PD_ASSERT(construction_fails(g, at_hub, SimConfig{}));

    ItemTable ok;
    ok.put(1, make_item(1, 1));
    SimConfig misaligned;
    misaligned.events.push_back(
        parcelday::ScheduledEvent{TimeOfDay::from_hms(8, 0, 30), parcelday::DelayedArrival{}});
    PD_ASSERT(construction_fails(g, ok, misaligned));

    SimConfig no_room;
    no_room.vehicle_capacity = 0;
    PD_ASSERT(construction_fails(g, ok, no_room));

    // Vehicle 3 is never dispatched under the default config.
    ItemTable stranded;
    Item only_three = make_item(1, 1);
    only_three.required_vehicle_id = 3;
    stranded.put(1, only_three);
    PD_ASSERT(construction_fails(g, stranded, SimConfig{}));
    SimConfig all_out;
    all_out.initial_dispatch = 3;
    PD_ASSERT(!construction_fails(g, stranded, all_out));

    PD_ASSERT(!construction_fails(g, ok, SimConfig{}));
  }

  return 0;
}
