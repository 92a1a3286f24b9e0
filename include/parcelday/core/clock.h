#pragma once
#include <cstdint>

#include "parcelday/core/time_of_day.h"

namespace parcelday {

// Discrete simulated time source. Every tick adds the same fixed increment.
class Clock {
 public:
  // Throws std::invalid_argument if increment_seconds is not positive.
  Clock(TimeOfDay start, std::int64_t increment_seconds);

  void advance();

  TimeOfDay now() const { return now_; }
  TimeOfDay start() const { return start_; }
  std::int64_t increment_seconds() const { return increment_seconds_; }
  std::int64_t ticks_elapsed() const { return ticks_; }

  // What now() would return after `ticks` more calls to advance(). Does not mutate.
  TimeOfDay project(std::int64_t ticks) const { return now_.add_seconds(ticks * increment_seconds_); }

 private:
  TimeOfDay start_;
  TimeOfDay now_;
  std::int64_t increment_seconds_{20};
  std::int64_t ticks_{0};
};

} // namespace parcelday
