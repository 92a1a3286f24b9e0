#include "parcelday/core/hub.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "parcelday/core/router.h"
#include "parcelday/util/log.h"

namespace parcelday {
namespace {

void push_unique(std::vector<Item*>& list, Item* item) {
  if (std::find(list.begin(), list.end(), item) == list.end()) list.push_back(item);
}

std::string describe_ids(const std::vector<Item*>& items) {
  std::ostringstream ss;
  ss << "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) ss << ",";
    ss << items[i]->id;
  }
  ss << "]";
  return ss.str();
}

} // namespace

Hub::Hub(Id location_id, const LocationGraph& graph, const Clock& clock)
    : location_id_(location_id), graph_(graph), clock_(clock) {}

void Hub::index_items(ItemTable& items) {
  std::vector<Id> ids = items.keys();
  std::sort(ids.begin(), ids.end());

  for (Id id : ids) {
    Item* item = &items.get(id);

    remaining_.put(id, item);
    if (item->has_priority_deadline()) priority_.put(id, item);
    if (item->status.kind == ItemStatusKind::Delayed) delayed_.put(id, item);
    if (item->status.kind == ItemStatusKind::Undeliverable) undeliverable_.put(id, item);
    if (item->required_vehicle_id != kInvalidId) restricted_.put(id, item);

    if (!deliver_with_.contains(id)) deliver_with_.put(id, {});
    for (Id other_id : item->deliver_with) {
      if (other_id == id) continue;
      Item* other = items.find(other_id);
      if (!other) {
        throw KeyNotFoundError("Item " + std::to_string(id) + " must ship with unknown item " +
                               std::to_string(other_id));
      }
      if (auto* back = deliver_with_.find(other_id)) {
        push_unique(*back, item);
      } else {
        deliver_with_.put(other_id, {item});
      }
      push_unique(deliver_with_.get(id), other);
    }

    if (auto* here = by_location_.find(item->location_id)) {
      here->push_back(item);
    } else {
      by_location_.put(item->location_id, {item});
    }

    const std::int64_t key = item->deadline.seconds();
    if (auto* same = by_deadline_.find(key)) {
      same->push_back(item);
    } else {
      by_deadline_.put(key, {item});
      deadlines_.push_back(item->deadline);
    }
  }
  std::sort(deadlines_.begin(), deadlines_.end());

  log::debug("Hub indexed " + std::to_string(remaining_.length()) + " items, " +
             std::to_string(deadlines_.size()) + " deadlines, " + std::to_string(delayed_.length()) +
             " delayed, " + std::to_string(undeliverable_.length()) + " undeliverable");
}

bool Hub::is_eligible(const Item& item, Id vehicle_id) const {
  if (!remaining_.contains(item.id)) return false;
  if (undeliverable_.contains(item.id) || delayed_.contains(item.id)) return false;
  if (Item* const* restricted = restricted_.find(item.id)) {
    if ((*restricted)->required_vehicle_id != vehicle_id) return false;
  }
  return true;
}

std::vector<Item*> Hub::next_batch(Id vehicle_id, std::size_t capacity) {
  std::vector<Item*> batch;
  for (Item* item : eligible_by_priority(vehicle_id)) {
    if (batch.size() >= capacity) break;
    add_grouped(*item, batch, vehicle_id, capacity);
  }

  std::vector<Item*> ordered = repair_late_deliveries(batch);
  if (!ordered.empty()) {
    log::debug("Vehicle " + std::to_string(vehicle_id) + " batch at " + clock_.now().to_string() + ": " +
               describe_ids(ordered) + " (" + std::to_string(remaining_.length()) + " left at hub)");
  }
  return ordered;
}

std::vector<Item*> Hub::eligible_by_priority(Id vehicle_id) const {
  std::vector<Item*> out;
  Id last = location_id_;
  for (const TimeOfDay& deadline : deadlines_) {
    std::vector<Item*> due;
    for (Item* item : by_deadline_.get(deadline.seconds())) {
      if (is_eligible(*item, vehicle_id)) due.push_back(item);
    }
    for (Item* item : sort_by_route(graph_, due, last)) {
      out.push_back(item);
      last = item->location_id;
    }
  }
  return out;
}

std::vector<Item*> Hub::repair_late_deliveries(const std::vector<Item*>& batch) const {
  std::vector<Item*> routed = sort_by_route(graph_, batch, location_id_);
  if (!has_late_delivery(routed)) return routed;

  std::size_t last_priority = 0;
  for (std::size_t i = 0; i < batch.size(); ++i) {
    if (batch[i]->has_priority_deadline()) last_priority = i;
  }

  std::vector<Item*> out(batch.begin(), batch.begin() + static_cast<std::ptrdiff_t>(last_priority + 1));
  const std::vector<Item*> rest(batch.begin() + static_cast<std::ptrdiff_t>(last_priority + 1), batch.end());
  for (Item* item : sort_by_route(graph_, rest, batch[last_priority]->location_id)) out.push_back(item);

  log::debug("Greedy route for " + describe_ids(batch) + " would be late; kept deadline prefix of " +
             std::to_string(last_priority + 1));
  return out;
}

bool Hub::has_late_delivery(const std::vector<Item*>& route) const {
  DistanceTenths total = 0;
  Id last = location_id_;
  for (const Item* item : route) {
    total += graph_.distance_tenths(last, item->location_id);
    last = item->location_id;
    // One tenth of a mile per tick.
    if (clock_.project(total) > item->deadline) return true;
  }
  return false;
}

bool Hub::collect_group(Item& first, Id vehicle_id, std::vector<Item*>& group) const {
  HashTable<Id, bool> visited;
  std::vector<Item*> stack{&first};
  while (!stack.empty()) {
    Item* item = stack.back();
    stack.pop_back();
    if (visited.contains(item->id)) continue;
    if (!is_eligible(*item, vehicle_id)) return false;

    visited.put(item->id, true);
    group.push_back(item);

    // Reverse push so partners are visited in list order.
    const std::vector<Item*>& partners = deliver_with_.get(item->id);
    for (auto it = partners.rbegin(); it != partners.rend(); ++it) {
      if (!visited.contains((*it)->id)) stack.push_back(*it);
    }
  }
  return true;
}

void Hub::add_grouped(Item& first, std::vector<Item*>& batch, Id vehicle_id, std::size_t capacity) {
  std::vector<Item*> group;
  if (!collect_group(first, vehicle_id, group)) return;
  if (group.size() + batch.size() > capacity) return;

  for (Item* item : group) add_to_batch(*item, batch, vehicle_id, capacity);
  add_by_locations(distinct_locations(group), batch, vehicle_id, capacity);
}

void Hub::add_by_locations(const std::vector<Id>& locations, std::vector<Item*>& batch, Id vehicle_id,
                           std::size_t capacity) {
  for (Id loc : locations) {
    if (batch.size() >= capacity) break;
    for (Item* item : by_location_.get(loc)) {
      if (batch.size() >= capacity) break;
      add_grouped(*item, batch, vehicle_id, capacity);
    }
  }
}

bool Hub::add_to_batch(Item& item, std::vector<Item*>& batch, Id vehicle_id, std::size_t capacity) {
  if (batch.size() >= capacity || !is_eligible(item, vehicle_id)) return false;
  batch.push_back(&item);
  remaining_.remove(item.id);
  priority_.remove(item.id);
  return true;
}

std::vector<Item*> Hub::release_delayed() {
  std::vector<Item*> released;
  released.reserve(delayed_.length());
  for (const auto& kv : delayed_) released.push_back(kv.second);
  std::sort(released.begin(), released.end(), [](const Item* a, const Item* b) { return a->id < b->id; });

  for (Item* item : released) item->status = ItemStatus::at_hub();
  delayed_.clear();
  return released;
}

void Hub::correct_address(Item& item, Id location_id) {
  if (!graph_.contains(location_id)) {
    throw std::out_of_range("Address correction to unknown location " + std::to_string(location_id));
  }

  if (auto* old_list = by_location_.find(item.location_id)) {
    old_list->erase(std::remove(old_list->begin(), old_list->end(), &item), old_list->end());
  }
  item.location_id = location_id;
  if (auto* new_list = by_location_.find(location_id)) {
    new_list->push_back(&item);
  } else {
    by_location_.put(location_id, {&item});
  }

  // A delayed item keeps waiting for its shipment.
  if (undeliverable_.contains(item.id)) {
    item.status = ItemStatus::at_hub();
    undeliverable_.remove(item.id);
  }
}

} // namespace parcelday
