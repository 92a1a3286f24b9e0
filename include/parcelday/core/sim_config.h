#pragma once

#include <cstdint>
#include <vector>

#include "parcelday/core/ids.h"
#include "parcelday/core/schedule.h"
#include "parcelday/core/time_of_day.h"

namespace parcelday {

struct SimConfig {
  // The working day starts here; every vehicle is at the hub.
  TimeOfDay start_time{TimeOfDay::from_hms(8, 0)};

  // Simulated seconds per tick. Vehicles cover one tenth of a mile per tick,
  // so 20 s corresponds to 18 mph.
  std::int64_t tick_seconds{20};

  // Time an "EOD" deadline normalizes to.
  TimeOfDay end_of_day{TimeOfDay::from_hms(17, 0)};

  // Latest stop time a caller may ask for.
  TimeOfDay latest_stop{TimeOfDay::from_hms(23, 59)};

  // Vehicles are numbered 1..vehicle_count.
  int vehicle_count{3};
  int vehicle_capacity{16};

  // How many vehicles get a batch at start_time (one driver each); the rest stay parked.
  int initial_dispatch{2};

  // One-shot world events, fired in list order when their time comes up.
  std::vector<ScheduledEvent> events;
};

} // namespace parcelday
