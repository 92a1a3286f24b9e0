#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "parcelday/core/clock.h"
#include "parcelday/core/entities.h"
#include "parcelday/core/location_graph.h"

namespace parcelday {

// The depot. Owns the item indices used to pick each vehicle's next batch.
//
// Indices hold pointers into the simulation's ItemTable, which must not be
// structurally modified (no inserts/removes) after index_items().
//
// Invariants:
// - an item is in `remaining` until it is accepted into a batch;
// - a remaining item is in at most one of {delayed, undeliverable};
// - accepted items are removed from `remaining` and `priority` exactly once.
class Hub {
 public:
  Hub(Id location_id, const LocationGraph& graph, const Clock& clock);

  Id location_id() const { return location_id_; }

  // Builds every index from the master item list. Call once, before the first batch.
  //
  // Items are indexed in ascending id order so batch selection is reproducible.
  // Throws KeyNotFoundError if an item's co-delivery list names an unknown item.
  void index_items(ItemTable& items);

  // Remaining, not delayed, not undeliverable, and not restricted to another vehicle.
  bool is_eligible(const Item& item, Id vehicle_id) const;

  // Picks, removes from the remaining index, and orders the next load for a
  // vehicle. An empty result means nothing is eligible right now.
  std::vector<Item*> next_batch(Id vehicle_id, std::size_t capacity);

  // Every item eligible for `vehicle_id`, ordered by deadline and, inside each
  // deadline, by greedy route from the last location of the previous deadline
  // (starting at the hub).
  std::vector<Item*> eligible_by_priority(Id vehicle_id) const;

  // Route order for a selected batch. If the greedy route would deliver any
  // item after its deadline, the batch's own order is kept up to its last item
  // with a real deadline and only the rest is re-routed from there.
  std::vector<Item*> repair_late_deliveries(const std::vector<Item*>& batch) const;

  // True if driving `route` from the hub, starting now, reaches some item after its deadline.
  bool has_late_delivery(const std::vector<Item*>& route) const;

  // Co-delivery closure of `first` (first included) in traversal order. Returns
  // false, leaving `group` partially filled, as soon as any member is not
  // eligible for `vehicle_id`.
  bool collect_group(Item& first, Id vehicle_id, std::vector<Item*>& group) const;

  // Marks every delayed item AtHub and clears the delayed index. Returns the released items.
  std::vector<Item*> release_delayed();

  // Re-addresses an item. An undeliverable item is marked AtHub and dropped from the
  // undeliverable index; any other status is left alone.
  // Throws std::out_of_range for an unknown location.
  void correct_address(Item& item, Id location_id);

  std::size_t remaining_count() const { return remaining_.length(); }
  bool is_remaining(Id item_id) const { return remaining_.contains(item_id); }
  bool is_priority(Id item_id) const { return priority_.contains(item_id); }
  bool is_delayed(Id item_id) const { return delayed_.contains(item_id); }
  bool is_undeliverable(Id item_id) const { return undeliverable_.contains(item_id); }
  std::size_t delayed_count() const { return delayed_.length(); }
  std::size_t undeliverable_count() const { return undeliverable_.length(); }

  // Distinct deadlines, ascending.
  const std::vector<TimeOfDay>& deadlines() const { return deadlines_; }

 private:
  using ItemIndex = HashTable<Id, Item*>;

  void add_grouped(Item& first, std::vector<Item*>& batch, Id vehicle_id, std::size_t capacity);
  void add_by_locations(const std::vector<Id>& locations, std::vector<Item*>& batch, Id vehicle_id,
                        std::size_t capacity);
  bool add_to_batch(Item& item, std::vector<Item*>& batch, Id vehicle_id, std::size_t capacity);

  Id location_id_{kInvalidId};
  const LocationGraph& graph_;
  const Clock& clock_;

  ItemIndex remaining_;
  ItemIndex priority_;
  ItemIndex delayed_;
  ItemIndex undeliverable_;
  ItemIndex restricted_;

  // Co-delivery partners, indexed in both directions.
  HashTable<Id, std::vector<Item*>> deliver_with_;
  HashTable<Id, std::vector<Item*>> by_location_;
  // Keyed by deadline seconds since midnight.
  HashTable<std::int64_t, std::vector<Item*>> by_deadline_;
  std::vector<TimeOfDay> deadlines_;
};

} // namespace parcelday
