#include "parcelday/core/scenario_validation.h"

#include <algorithm>
#include <sstream>
#include <type_traits>
#include <utility>

namespace parcelday {

namespace {

void push_issue(std::vector<ScenarioIssue>& out, ScenarioIssueSeverity sev, std::string code, std::string msg) {
  ScenarioIssue is;
  is.severity = sev;
  is.code = std::move(code);
  is.message = std::move(msg);
  out.push_back(std::move(is));
}

void push_error(std::vector<ScenarioIssue>& out, std::string code, std::string msg) {
  push_issue(out, ScenarioIssueSeverity::Error, std::move(code), std::move(msg));
}

void push_warning(std::vector<ScenarioIssue>& out, std::string code, std::string msg) {
  push_issue(out, ScenarioIssueSeverity::Warning, std::move(code), std::move(msg));
}

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

void validate_config(const SimConfig& cfg, std::vector<ScenarioIssue>& issues) {
  if (cfg.tick_seconds <= 0) {
    push_error(issues, "config.tick", join("tick_seconds must be positive, got ", cfg.tick_seconds));
  }
  if (cfg.vehicle_count <= 0) {
    push_error(issues, "config.vehicles", join("vehicle count must be positive, got ", cfg.vehicle_count));
  }
  if (cfg.vehicle_capacity <= 0) {
    push_error(issues, "config.capacity", join("vehicle capacity must be positive, got ", cfg.vehicle_capacity));
  }
  if (cfg.initial_dispatch < 0 || cfg.initial_dispatch > cfg.vehicle_count) {
    push_error(issues, "config.initial_dispatch",
               join("initial dispatch must be within 0..", cfg.vehicle_count, ", got ", cfg.initial_dispatch));
  }
  if (cfg.latest_stop < cfg.start_time) {
    push_error(issues, "config.latest_stop",
               join("latest stop ", cfg.latest_stop.to_string(), " is before start ", cfg.start_time.to_string()));
  }
}

void validate_items(const LocationGraph& graph, const ItemTable& items, const SimConfig& cfg,
                    const std::vector<Id>& ids, std::vector<ScenarioIssue>& issues) {
  for (Id id : ids) {
    const Item& item = items.get(id);
    const std::string who = join("item ", id);

    if (item.id != id) push_error(issues, "item.id_mismatch", join(who, " is stored with id ", item.id));
    if (!graph.contains(item.location_id)) {
      push_error(issues, "item.unknown_location", join(who, " targets unknown location ", item.location_id));
    } else if (item.location_id == LocationGraph::kHubId) {
      push_error(issues, "item.hub_location", join(who, " is addressed to the hub itself"));
    }
    if (item.weight_kg < 0) push_error(issues, "item.weight", join(who, " has negative weight"));
    if (item.required_vehicle_id != kInvalidId &&
        (item.required_vehicle_id < 1 || item.required_vehicle_id > cfg.vehicle_count)) {
      push_error(issues, "item.unknown_vehicle",
                 join(who, " requires vehicle ", item.required_vehicle_id, " but the fleet has ", cfg.vehicle_count));
    } else if (item.required_vehicle_id != kInvalidId && item.required_vehicle_id > cfg.initial_dispatch) {
      // Vehicles past initial_dispatch never leave the hub or ask for a batch.
      push_error(issues, "config.restricted_undispatched",
                 join(who, " requires vehicle ", item.required_vehicle_id, " but only ", cfg.initial_dispatch,
                      " vehicles are dispatched"));
    }
    if (item.status.kind == ItemStatusKind::OnVehicle || item.status.kind == ItemStatusKind::Delivered) {
      push_error(issues, "item.initial_status", join(who, " must start at the hub, delayed, or undeliverable"));
    }
    for (Id other : item.deliver_with) {
      if (!items.contains(other)) {
        push_error(issues, "item.unknown_group_member", join(who, " must ship with unknown item ", other));
      }
    }
  }
}

// Co-delivery groups that can never fit on one vehicle.
void validate_groups(const ItemTable& items, const SimConfig& cfg, const std::vector<Id>& ids,
                     std::vector<ScenarioIssue>& issues) {
  HashTable<Id, std::vector<Id>> links;
  for (Id id : ids) {
    if (!links.contains(id)) links.put(id, {});
    for (Id other : items.get(id).deliver_with) {
      if (!items.contains(other) || other == id) continue;
      links.get(id).push_back(other);
      if (auto* back = links.find(other)) {
        back->push_back(id);
      } else {
        links.put(other, {id});
      }
    }
  }

  HashTable<Id, bool> seen;
  for (Id id : ids) {
    if (seen.contains(id)) continue;
    std::vector<Id> stack{id};
    std::size_t size = 0;
    while (!stack.empty()) {
      const Id cur = stack.back();
      stack.pop_back();
      if (seen.contains(cur)) continue;
      seen.put(cur, true);
      ++size;
      for (Id next : links.get(cur)) {
        if (!seen.contains(next)) stack.push_back(next);
      }
    }
    if (cfg.vehicle_capacity > 0 && size > static_cast<std::size_t>(cfg.vehicle_capacity)) {
      push_warning(issues, "group.too_large",
                   join("co-delivery group of item ", id, " has ", size, " items, more than vehicle capacity ",
                        cfg.vehicle_capacity));
    }
  }
}

void validate_events(const LocationGraph& graph, const ItemTable& items, const SimConfig& cfg,
                     const std::vector<Id>& ids, std::vector<ScenarioIssue>& issues) {
  bool has_delayed_items = false;
  bool has_delayed_event = false;
  HashTable<Id, bool> corrected;
  for (Id id : ids) {
    if (items.get(id).status.kind == ItemStatusKind::Delayed) has_delayed_items = true;
  }

  for (const auto& ev : cfg.events) {
    const std::string what = join(scheduled_action_to_string(ev.action), " at ", ev.at.to_string());
    if (ev.at <= cfg.start_time || ev.at > cfg.latest_stop) {
      push_error(issues, "event.window", join(what, " is outside the operating window"));
    } else if (cfg.tick_seconds > 0 && (ev.at.seconds() - cfg.start_time.seconds()) % cfg.tick_seconds != 0) {
      push_error(issues, "event.misaligned", join(what, " does not fall on a ", cfg.tick_seconds, "s tick"));
    }

    std::visit(
        [&](const auto& a) {
          using T = std::decay_t<decltype(a)>;
          if constexpr (std::is_same_v<T, DelayedArrival>) {
            if (has_delayed_event) push_error(issues, "event.duplicate", join(what, " is scheduled twice"));
            has_delayed_event = true;
            if (!has_delayed_items) {
              push_warning(issues, "event.no_delayed_items", join(what, " has nothing to release"));
            }
          } else if constexpr (std::is_same_v<T, AddressCorrection>) {
            const Item* item = items.find(a.item_id);
            if (!item) {
              push_error(issues, "event.unknown_item", join(what, " names an unknown item"));
            } else if (item->status.kind != ItemStatusKind::Undeliverable) {
              push_warning(issues, "event.not_undeliverable",
                           join(what, " targets an item that is not undeliverable"));
            }
            if (!graph.contains(a.location_id)) {
              push_error(issues, "event.unknown_location", join(what, " names an unknown location"));
            } else if (a.location_id == LocationGraph::kHubId) {
              push_error(issues, "event.hub_location", join(what, " re-addresses an item to the hub"));
            }
            if (corrected.contains(a.item_id)) {
              push_error(issues, "event.duplicate", join(what, " is scheduled twice"));
            }
            corrected.put(a.item_id, true);
          }
        },
        ev.action);
  }

  if (has_delayed_items && !has_delayed_event) {
    push_warning(issues, "item.never_released", "delayed items exist but no delayed-arrival event is scheduled");
  }
  for (Id id : ids) {
    if (items.get(id).status.kind == ItemStatusKind::Undeliverable && !corrected.contains(id)) {
      push_warning(issues, "item.never_corrected", join("item ", id, " is undeliverable and never corrected"));
    }
  }
}

} // namespace

std::vector<ScenarioIssue> validate_scenario_detailed(const LocationGraph& graph, const ItemTable& items,
                                                      const SimConfig& cfg) {
  std::vector<ScenarioIssue> issues;
  if (graph.empty()) {
    push_error(issues, "graph.empty", "scenario has no locations (location 0 must be the hub)");
    return issues;
  }

  std::vector<Id> ids = items.keys();
  std::sort(ids.begin(), ids.end());

  validate_config(cfg, issues);
  validate_items(graph, items, cfg, ids, issues);
  validate_groups(items, cfg, ids, issues);
  validate_events(graph, items, cfg, ids, issues);
  return issues;
}

std::vector<std::string> validate_scenario(const LocationGraph& graph, const ItemTable& items, const SimConfig& cfg) {
  std::vector<std::string> errors;
  for (const auto& is : validate_scenario_detailed(graph, items, cfg)) {
    if (is.severity == ScenarioIssueSeverity::Error) errors.push_back(is.message);
  }
  return errors;
}

} // namespace parcelday
