#pragma once

#include <string>
#include <variant>
#include <vector>

#include "parcelday/core/ids.h"
#include "parcelday/core/time_of_day.h"

namespace parcelday {

// Late shipment reaches the hub: every Delayed item becomes AtHub.
struct DelayedArrival {};

// The correct address for an Undeliverable item becomes known.
struct AddressCorrection {
  Id item_id{kInvalidId};
  Id location_id{kInvalidId};
};

using ScheduledAction = std::variant<DelayedArrival, AddressCorrection>;

// One-shot world event. Fires on the tick whose time equals `at`, never again.
struct ScheduledEvent {
  TimeOfDay at;
  ScheduledAction action;
  bool fired{false};
};

std::string scheduled_action_to_string(const ScheduledAction& action);

} // namespace parcelday
