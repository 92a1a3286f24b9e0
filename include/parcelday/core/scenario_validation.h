#pragma once

#include <string>
#include <vector>

#include "parcelday/core/entities.h"
#include "parcelday/core/location_graph.h"
#include "parcelday/core/sim_config.h"

namespace parcelday {

enum class ScenarioIssueSeverity { Error, Warning };

struct ScenarioIssue {
  ScenarioIssueSeverity severity{ScenarioIssueSeverity::Error};
  // Stable machine-readable code, e.g. "item.unknown_location".
  std::string code;
  std::string message;
};

// Checks a scenario for internal consistency before a simulation is built.
//
// Errors make the scenario unusable (unknown ids, misaligned event times, ...).
// Warnings flag scenarios that run but cannot finish cleanly, such as a
// co-delivery group larger than any vehicle.
std::vector<ScenarioIssue> validate_scenario_detailed(const LocationGraph& graph, const ItemTable& items,
                                                      const SimConfig& cfg);

// Error messages only. An empty list means "valid".
std::vector<std::string> validate_scenario(const LocationGraph& graph, const ItemTable& items,
                                           const SimConfig& cfg);

} // namespace parcelday
