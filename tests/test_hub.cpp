#include <iostream>
#include <stdexcept>
#include <vector>

#include "parcelday/core/clock.h"
#include "parcelday/core/hub.h"
#include "parcelday/core/location_graph.h"

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
using parcelday::TimeOfDay;

// hub --1.0-- near, hub --8.0-- far, near --8.5-- far.
LocationGraph make_graph() {
  LocationGraph g;
  g.add_location("Hub", "Town", "0", {0});
  g.add_location("Near", "Town", "1", {10, 0});
  g.add_location("Far", "Town", "2", {80, 85, 0});
  return g;
}

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

bool has_id(const std::vector<Item*>& v, Id id) {
  for (const Item* it : v) {
    if (it->id == id) return true;
  }
  return false;
}

} // namespace

int test_hub() {
  const LocationGraph g = make_graph();
  const parcelday::Clock clock(TimeOfDay::from_hms(8, 0), 20);

  // Eligibility: delayed, undeliverable and other-vehicle items are held back.
  {
    ItemTable items;
    items.put(1, make_item(1, 1));
    Item delayed = make_item(2, 1);
    delayed.status = ItemStatus::delayed();
    items.put(2, delayed);
    Item wrong_address = make_item(3, 2);
    wrong_address.status = ItemStatus::undeliverable();
    items.put(3, wrong_address);
    Item only_two = make_item(4, 2);
    only_two.required_vehicle_id = 2;
    items.put(4, only_two);

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    PD_ASSERT(hub.remaining_count() == 4);
    PD_ASSERT(hub.is_eligible(items.get(1), 1));
    PD_ASSERT(!hub.is_eligible(items.get(2), 1));
    PD_ASSERT(!hub.is_eligible(items.get(3), 1));
    PD_ASSERT(!hub.is_eligible(items.get(4), 1));
    PD_ASSERT(hub.is_eligible(items.get(4), 2));

    const auto first = hub.next_batch(1, 16);
    PD_ASSERT(first.size() == 1);
    PD_ASSERT(first[0]->id == 1);
    PD_ASSERT(!hub.is_remaining(1));
    PD_ASSERT(hub.remaining_count() == 3);

    const auto second = hub.next_batch(2, 16);
    PD_ASSERT(second.size() == 1);
    PD_ASSERT(second[0]->id == 4);

    PD_ASSERT(hub.next_batch(1, 16).empty());

    // Releasing the delayed shipment makes item 2 eligible.
    const auto released = hub.release_delayed();
    PD_ASSERT(released.size() == 1 && released[0]->id == 2);
    PD_ASSERT(items.get(2).status.kind == parcelday::ItemStatusKind::AtHub);
    PD_ASSERT(hub.delayed_count() == 0);
    PD_ASSERT(hub.release_delayed().empty());

    // Correcting the address moves item 3 to its new location and frees it.
    hub.correct_address(items.get(3), 1);
    PD_ASSERT(items.get(3).location_id == 1);
    PD_ASSERT(!hub.is_undeliverable(3));

    const auto third = hub.next_batch(1, 16);
    PD_ASSERT(third.size() == 2);
    PD_ASSERT(third[0]->id == 2 && third[1]->id == 3);
    PD_ASSERT(hub.remaining_count() == 0);

    bool threw = false;
    try {
      hub.correct_address(items.get(3), 42);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    PD_ASSERT(threw);
  }

  // Co-delivery groups are all-or-nothing and respect capacity.
  {
    ItemTable items;
    Item lead = make_item(1, 1);
    lead.deliver_with = {2, 3};
    items.put(1, lead);
    items.put(2, make_item(2, 1));
    items.put(3, make_item(3, 2));
    items.put(4, make_item(4, 1));
    items.put(5, make_item(5, 2));

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);

    std::vector<Item*> closure;
    PD_ASSERT(hub.collect_group(items.get(3), 1, closure));
    PD_ASSERT(closure.size() == 3);
    PD_ASSERT(closure[0]->id == 3 && closure[1]->id == 1 && closure[2]->id == 2);

    const auto small = hub.next_batch(1, 2);
    PD_ASSERT(small.size() == 2);
    PD_ASSERT(small[0]->id == 4 && small[1]->id == 5);
    PD_ASSERT(hub.is_remaining(1) && hub.is_remaining(2) && hub.is_remaining(3));

    const auto group = hub.next_batch(1, 3);
    PD_ASSERT(group.size() == 3);
    PD_ASSERT(has_id(group, 1) && has_id(group, 2) && has_id(group, 3));
    PD_ASSERT(hub.remaining_count() == 0);
  }

  // A group with a member reserved for another vehicle is skipped whole.
  {
    ItemTable items;
    Item a = make_item(1, 1, "10:30 AM");
    a.deliver_with = {2};
    items.put(1, a);
    Item b = make_item(2, 2);
    b.required_vehicle_id = 2;
    items.put(2, b);
    items.put(3, make_item(3, 2));

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);

    const auto v1 = hub.next_batch(1, 16);
    PD_ASSERT(v1.size() == 1 && v1[0]->id == 3);
    PD_ASSERT(hub.is_priority(1));

    const auto v2 = hub.next_batch(2, 16);
    PD_ASSERT(v2.size() == 2);
    PD_ASSERT(has_id(v2, 1) && has_id(v2, 2));
    PD_ASSERT(!hub.is_priority(1));
  }

  // Capacity is a hard bound; more items stay at the hub.
  {
    ItemTable items;
    for (Id id = 1; id <= 10; ++id) items.put(id, make_item(id, (id % 2) + 1));
    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    PD_ASSERT(hub.next_batch(1, 4).size() == 4);
    PD_ASSERT(hub.next_batch(2, 4).size() == 4);
    PD_ASSERT(hub.next_batch(1, 4).size() == 2);
    PD_ASSERT(hub.remaining_count() == 0);
  }

  // Late-delivery repair: the greedy order would reach the 8:30 item at 8:31:40.
  {
    ItemTable items;
    items.put(1, make_item(1, 2, "8:30 AM"));
    items.put(2, make_item(2, 1));

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    PD_ASSERT(hub.deadlines().size() == 2);

    Item* far = &items.get(1);
    Item* near = &items.get(2);
    PD_ASSERT(hub.has_late_delivery({near, far}));
    PD_ASSERT(!hub.has_late_delivery({far, near}));

    const auto batch = hub.next_batch(1, 16);
    PD_ASSERT(batch.size() == 2);
    PD_ASSERT(batch[0]->id == 1);
    PD_ASSERT(batch[1]->id == 2);
  }

  // Without deadline pressure the greedy order stands.
  {
    ItemTable items;
    items.put(1, make_item(1, 2, "9:00 AM"));
    items.put(2, make_item(2, 1));

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    const auto batch = hub.next_batch(1, 16);
    PD_ASSERT(batch.size() == 2);
    PD_ASSERT(batch[0]->id == 2);
    PD_ASSERT(batch[1]->id == 1);
  }

  // A tighter deadline further down the list does not displace a stop-mate.
  {
    ItemTable items;
    items.put(1, make_item(1, 1, "9:00 AM"));
    items.put(2, make_item(2, 2, "10:00 AM"));
    items.put(3, make_item(3, 1));

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    const auto batch = hub.next_batch(1, 2);
    PD_ASSERT(batch.size() == 2);
    PD_ASSERT(batch[0]->id == 1 && batch[1]->id == 3);
    PD_ASSERT(hub.is_remaining(2));
    PD_ASSERT(hub.remaining_count() == 1);
  }

  // Re-addressing a delayed item moves it but keeps it held for its shipment.
  {
    ItemTable items;
    Item late = make_item(1, 1);
    late.status = ItemStatus::delayed();
    items.put(1, late);
    items.put(2, make_item(2, 1));

    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    hub.index_items(items);
    hub.correct_address(items.get(1), 2);
    PD_ASSERT(items.get(1).location_id == 2);
    PD_ASSERT(items.get(1).status.kind == parcelday::ItemStatusKind::Delayed);
    PD_ASSERT(hub.is_delayed(1));
    PD_ASSERT(!hub.is_eligible(items.get(1), 1));

    const auto first = hub.next_batch(1, 16);
    PD_ASSERT(first.size() == 1 && first[0]->id == 2);

    hub.release_delayed();
    const auto second = hub.next_batch(1, 16);
    PD_ASSERT(second.size() == 1 && second[0]->id == 1);
    PD_ASSERT(second[0]->location_id == 2);
  }

  // A co-delivery id naming no item is a setup error.
  {
    ItemTable items;
    Item a = make_item(1, 1);
    a.deliver_with = {99};
    items.put(1, a);
    parcelday::Hub hub(LocationGraph::kHubId, g, clock);
    bool threw = false;
    try {
      hub.index_items(items);
    } catch (const parcelday::KeyNotFoundError&) {
      threw = true;
    }
    PD_ASSERT(threw);
  }

  return 0;
}
