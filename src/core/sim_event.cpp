#include "parcelday/core/sim_event.h"

#include <utility>

namespace parcelday {

const SimEvent& EventLog::push(TimeOfDay time, EventLevel level, EventCategory category, std::string message,
                               Id vehicle_id, Id item_id) {
  SimEvent ev;
  ev.seq = next_seq_++;
  ev.time = time;
  ev.level = level;
  ev.category = category;
  ev.vehicle_id = vehicle_id;
  ev.item_id = item_id;
  ev.message = std::move(message);
  events_.push_back(std::move(ev));
  return events_.back();
}

const char* event_level_label(EventLevel l) {
  switch (l) {
    case EventLevel::Info: return "INFO";
    case EventLevel::Warn: return "WARN";
  }
  return "INFO";
}

const char* event_category_label(EventCategory c) {
  switch (c) {
    case EventCategory::Dispatch: return "DISPATCH";
    case EventCategory::Delivery: return "DELIVERY";
    case EventCategory::Schedule: return "SCHEDULE";
  }
  return "DISPATCH";
}

} // namespace parcelday
