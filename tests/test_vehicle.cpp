#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

#include "parcelday/core/clock.h"
#include "parcelday/core/hub.h"
#include "parcelday/core/location_graph.h"
#include "parcelday/core/sim_event.h"
#include "parcelday/core/vehicle.h"

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
using parcelday::ItemStatusKind;
using parcelday::LocationGraph;
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

} // namespace

int test_vehicle() {
  LocationGraph g;
  g.add_location("Hub", "Town", "0", {0});
  g.add_location("Near", "Town", "1", {10, 0});
  g.add_location("Far", "Town", "2", {80, 85, 0});

  // Loading respects capacity and sets the first destination.
  {
    parcelday::Clock clock(TimeOfDay::from_hms(8, 0), 20);
    parcelday::ItemTable items;
    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    parcelday::EventLog events;
    parcelday::SimContext ctx{g, clock, hub, events};

    Item a = make_item(1, 2);
    Item b = make_item(2, 1);
    Item c = make_item(3, 1);

    parcelday::Vehicle v(7, 2, LocationGraph::kHubId);
    PD_ASSERT(v.state() == parcelday::VehicleState::Loading);
    PD_ASSERT(!v.destination().has_value());

    PD_ASSERT(v.add_item(a, ctx));
    PD_ASSERT(v.add_item(b, ctx));
    PD_ASSERT(!v.add_item(c, ctx));
    PD_ASSERT(v.items().size() == 2);
    PD_ASSERT(a.status.kind == ItemStatusKind::OnVehicle && a.status.vehicle_id == 7);
    PD_ASSERT(c.status.kind == ItemStatusKind::AtHub);

    PD_ASSERT(v.destination().has_value());
    PD_ASSERT(std::holds_alternative<parcelday::StopVisit>(*v.destination()));
    PD_ASSERT(parcelday::destination_location(*v.destination()) == 2);
    PD_ASSERT(v.tenths_to_destination() == 80);
    PD_ASSERT(v.state() == parcelday::VehicleState::EnRoute);
  }

  // Full trip: out to a stop, deliver, back to the hub, wait, then reload.
  {
    parcelday::Clock clock(TimeOfDay::from_hms(8, 0), 20);
    parcelday::ItemTable items;
    items.put(1, make_item(1, 1, "8:01 AM"));
    Item later = make_item(2, 2);
    later.status = ItemStatus::delayed();
    items.put(2, later);

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    parcelday::EventLog events;
    parcelday::SimContext ctx{g, clock, hub, events};

    parcelday::Vehicle v(1, 16, LocationGraph::kHubId);
    v.request_batch(ctx);
    PD_ASSERT(v.items().size() == 1);
    PD_ASSERT(v.tenths_to_destination() == 10);
    PD_ASSERT(events.size() == 1);
    PD_ASSERT(events.events()[0].category == parcelday::EventCategory::Dispatch);

    for (int i = 0; i < 9; ++i) {
      clock.advance();
      v.drive(ctx);
    }
    PD_ASSERT(v.tenths_driven() == 9);
    PD_ASSERT(v.location_id() == LocationGraph::kHubId);
    PD_ASSERT(!items.get(1).delivered());

    clock.advance();
    v.drive(ctx);
    PD_ASSERT(v.location_id() == 1);
    PD_ASSERT(v.items().empty());
    const Item& done = items.get(1);
    PD_ASSERT(done.delivered());
    PD_ASSERT(done.status.vehicle_id == 1);
    PD_ASSERT(done.status.delivered_at == TimeOfDay::from_hms(8, 3, 20));
    PD_ASSERT(!done.status.on_time);
    PD_ASSERT(events.events().back().level == parcelday::EventLevel::Warn);
    PD_ASSERT(events.events().back().item_id == 1);

    PD_ASSERT(std::holds_alternative<parcelday::HubVisit>(*v.destination()));
    PD_ASSERT(v.tenths_to_destination() == 10);

    for (int i = 0; i < 10; ++i) {
      clock.advance();
      v.drive(ctx);
    }
    PD_ASSERT(v.location_id() == LocationGraph::kHubId);
    PD_ASSERT(v.tenths_driven() == 20);
    PD_ASSERT(v.waiting());
    PD_ASSERT(v.state() == parcelday::VehicleState::Waiting);
    const std::size_t logged = events.size();

    // Re-polling while nothing is eligible does not log again.
    clock.advance();
    v.drive(ctx);
    PD_ASSERT(v.waiting());
    PD_ASSERT(events.size() == logged);
    PD_ASSERT(v.tenths_driven() == 20);

    hub.release_delayed();
    clock.advance();
    v.drive(ctx);
    PD_ASSERT(!v.waiting());
    PD_ASSERT(v.items().size() == 1);
    PD_ASSERT(v.items()[0]->id == 2);
    PD_ASSERT(v.tenths_to_destination() == 80);
    PD_ASSERT(v.tenths_driven() == 20);
    PD_ASSERT(v.miles_driven() == 2.0);
  }

  // Two locations at distance 0: the second stop takes one extra tick and no mileage.
  {
    LocationGraph twin;
    twin.add_location("Hub", "Town", "0", {0});
    twin.add_location("North", "Town", "1", {10, 0});
    twin.add_location("North Annex", "Town", "1", {10, 0, 0});

    parcelday::Clock clock(TimeOfDay::from_hms(8, 0), 20);
    parcelday::ItemTable items;
    items.put(1, make_item(1, 1));
    items.put(2, make_item(2, 2));

    parcelday::Hub hub(LocationGraph::kHubId, twin, clock);
    hub.index_items(items);
    parcelday::EventLog events;
    parcelday::SimContext ctx{twin, clock, hub, events};

    parcelday::Vehicle v(1, 16, LocationGraph::kHubId);
    v.request_batch(ctx);
    PD_ASSERT(v.items().size() == 2);
    PD_ASSERT(v.items()[0]->id == 1 && v.items()[1]->id == 2);

    for (int i = 0; i < 10; ++i) {
      clock.advance();
      v.drive(ctx);
    }
    PD_ASSERT(items.get(1).delivered());
    PD_ASSERT(items.get(1).status.delivered_at == TimeOfDay::from_hms(8, 3, 20));
    PD_ASSERT(!items.get(2).delivered());
    PD_ASSERT(parcelday::destination_location(*v.destination()) == 2);
    PD_ASSERT(v.tenths_to_destination() == 0);
    PD_ASSERT(v.state() == parcelday::VehicleState::AtStop);

    clock.advance();
    v.drive(ctx);
    PD_ASSERT(v.location_id() == 2);
    PD_ASSERT(items.get(2).delivered());
    PD_ASSERT(items.get(2).status.delivered_at == TimeOfDay::from_hms(8, 3, 40));
    PD_ASSERT(v.tenths_driven() == 10);
    PD_ASSERT(std::holds_alternative<parcelday::HubVisit>(*v.destination()));
    PD_ASSERT(v.tenths_to_destination() == 10);

    for (int i = 0; i < 10; ++i) {
      clock.advance();
      v.drive(ctx);
    }
    PD_ASSERT(v.location_id() == LocationGraph::kHubId);
    PD_ASSERT(v.tenths_driven() == 20);
    PD_ASSERT(v.waiting());
  }

  return 0;
}
