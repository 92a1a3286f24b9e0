#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "parcelday/core/ids.h"
#include "parcelday/core/time_of_day.h"

namespace parcelday {

enum class EventLevel { Info, Warn };

// Coarse grouping for filtering and export.
enum class EventCategory {
  Dispatch,  // batches loaded, vehicles parked at the hub
  Delivery,  // items delivered
  Schedule,  // scheduled world events
};

struct SimEvent {
  // Monotonic within a run.
  std::uint64_t seq{0};
  TimeOfDay time;

  EventLevel level{EventLevel::Info};
  EventCategory category{EventCategory::Dispatch};

  // kInvalidId means "not set".
  Id vehicle_id{kInvalidId};
  Id item_id{kInvalidId};

  std::string message;
};

// Append-only record of what happened during a run.
class EventLog {
 public:
  const SimEvent& push(TimeOfDay time, EventLevel level, EventCategory category, std::string message,
                       Id vehicle_id = kInvalidId, Id item_id = kInvalidId);

  const std::vector<SimEvent>& events() const { return events_; }
  std::size_t size() const { return events_.size(); }

 private:
  std::vector<SimEvent> events_;
  std::uint64_t next_seq_{1};
};

const char* event_level_label(EventLevel l);
const char* event_category_label(EventCategory c);

} // namespace parcelday
