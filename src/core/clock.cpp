#include "parcelday/core/clock.h"

#include <stdexcept>

namespace parcelday {

Clock::Clock(TimeOfDay start, std::int64_t increment_seconds)
    : start_(start), now_(start), increment_seconds_(increment_seconds) {
  if (increment_seconds <= 0) throw std::invalid_argument("Clock increment must be positive");
}

void Clock::advance() {
  now_ = now_.add_seconds(increment_seconds_);
  ++ticks_;
}

} // namespace parcelday
