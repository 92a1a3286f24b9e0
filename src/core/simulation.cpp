#include "parcelday/core/simulation.h"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "parcelday/core/scenario_validation.h"
#include "parcelday/util/log.h"

namespace parcelday {
namespace {

SimConfig checked_config(const LocationGraph& graph, const ItemTable& items, SimConfig cfg) {
  std::string errors;
  std::size_t error_count = 0;
  for (const auto& is : validate_scenario_detailed(graph, items, cfg)) {
    if (is.severity == ScenarioIssueSeverity::Warning) {
      log::warn("Scenario: " + is.message);
      continue;
    }
    errors += "\n  - " + is.message;
    ++error_count;
  }
  if (error_count > 0) {
    throw std::runtime_error("Invalid scenario (" + std::to_string(error_count) + " errors):" + errors);
  }
  return cfg;
}

} // namespace

Simulation::Simulation(LocationGraph graph, ItemTable items, SimConfig cfg)
    : graph_(std::move(graph)),
      items_(std::move(items)),
      cfg_(checked_config(graph_, items_, std::move(cfg))),
      clock_(cfg_.start_time, cfg_.tick_seconds),
      hub_(LocationGraph::kHubId, graph_, clock_) {
  hub_.index_items(items_);

  vehicles_.reserve(static_cast<std::size_t>(cfg_.vehicle_count));
  for (int i = 1; i <= cfg_.vehicle_count; ++i) {
    vehicles_.emplace_back(static_cast<Id>(i), static_cast<std::size_t>(cfg_.vehicle_capacity), hub_.location_id());
  }

  log::info("Simulation ready: " + std::to_string(items_.length()) + " items, " + std::to_string(graph_.size()) +
            " locations, " + std::to_string(vehicles_.size()) + " vehicles");
}

const Vehicle* Simulation::find_vehicle(Id vehicle_id) const {
  for (const auto& v : vehicles_) {
    if (v.id() == vehicle_id) return &v;
  }
  return nullptr;
}

SimContext Simulation::context() { return SimContext{graph_, clock_, hub_, events_}; }

void Simulation::start() {
  if (started_) return;
  started_ = true;

  SimContext ctx = context();
  for (int i = 0; i < cfg_.initial_dispatch; ++i) vehicles_[static_cast<std::size_t>(i)].request_batch(ctx);
}

void Simulation::tick() {
  clock_.advance();
  fire_due_events();

  SimContext ctx = context();
  for (auto& v : vehicles_) v.drive(ctx);
}

void Simulation::fire_due_events() {
  const TimeOfDay now = clock_.now();
  for (auto& ev : cfg_.events) {
    if (ev.fired || ev.at != now) continue;
    ev.fired = true;

    std::visit(
        [&](const auto& a) {
          using T = std::decay_t<decltype(a)>;
          if constexpr (std::is_same_v<T, DelayedArrival>) {
            const std::vector<Item*> released = hub_.release_delayed();
            const std::string msg = "Delayed shipment arrived: " + std::to_string(released.size()) + " items released";
            log::info(now.to_string() + " " + msg);
            events_.push(now, EventLevel::Info, EventCategory::Schedule, msg);
          } else if constexpr (std::is_same_v<T, AddressCorrection>) {
            Item& item = items_.get(a.item_id);
            if (!hub_.is_remaining(item.id)) {
              const std::string msg = "Address correction for item " + std::to_string(item.id) +
                                      " ignored: already left the hub";
              log::warn(now.to_string() + " " + msg);
              events_.push(now, EventLevel::Warn, EventCategory::Schedule, msg, kInvalidId, item.id);
              return;
            }
            hub_.correct_address(item, a.location_id);
            const std::string msg = "Item " + std::to_string(item.id) + " re-addressed to " +
                                    graph_.location(a.location_id).address;
            log::info(now.to_string() + " " + msg);
            events_.push(now, EventLevel::Info, EventCategory::Schedule, msg, kInvalidId, item.id);
          }
        },
        ev.action);
  }
}

RunResult Simulation::run_until(TimeOfDay stop) {
  start();
  RunResult out;
  while (!is_finished() && clock_.now() < stop) {
    tick();
    ++out.ticks;
  }
  out.finished = is_finished();
  out.ended_at = clock_.now();
  return out;
}

bool Simulation::is_finished() const {
  if (hub_.remaining_count() > 0) return false;
  for (const auto& v : vehicles_) {
    if (!v.items().empty()) return false;
    if (v.location_id() != hub_.location_id() || v.tenths_to_destination() > 0) return false;
  }
  return true;
}

DistanceTenths Simulation::total_tenths_driven() const {
  DistanceTenths total = 0;
  for (const auto& v : vehicles_) total += v.tenths_driven();
  return total;
}

} // namespace parcelday
