#pragma once
#include <cstdint>
#include <string>

namespace parcelday {

// Whole seconds since midnight of the simulated day.
//
// Values past 24:00:00 are allowed (a clock left running overnight keeps counting).
class TimeOfDay {
 public:
  static TimeOfDay from_hms(int hour, int minute, int second = 0);

  // "HH:MM" or "HH:MM:SS", 24-hour. Throws std::runtime_error on malformed text.
  static TimeOfDay parse_clock(const std::string& text);

  TimeOfDay() = default;
  explicit TimeOfDay(std::int64_t seconds) : seconds_(seconds) {}

  std::int64_t seconds() const { return seconds_; }
  int hour() const { return static_cast<int>(seconds_ / 3600); }
  int minute() const { return static_cast<int>((seconds_ / 60) % 60); }
  int second() const { return static_cast<int>(seconds_ % 60); }

  TimeOfDay add_seconds(std::int64_t delta) const { return TimeOfDay(seconds_ + delta); }

  // "HH:MM:SS"
  std::string to_string() const;

  bool operator==(const TimeOfDay& o) const { return seconds_ == o.seconds_; }
  bool operator!=(const TimeOfDay& o) const { return seconds_ != o.seconds_; }
  bool operator<(const TimeOfDay& o) const { return seconds_ < o.seconds_; }
  bool operator<=(const TimeOfDay& o) const { return seconds_ <= o.seconds_; }
  bool operator>(const TimeOfDay& o) const { return seconds_ > o.seconds_; }
  bool operator>=(const TimeOfDay& o) const { return seconds_ >= o.seconds_; }

 private:
  std::int64_t seconds_{0};
};

struct Deadline {
  TimeOfDay time;
  // True for "EOD": the item has no real deadline, only the end of the working day.
  bool end_of_day{false};
};

// Parses an item deadline: "H:MM AM", "H:MM PM" (hour 1-12) or "EOD".
//
// EOD normalizes to `end_of_day`. Throws std::runtime_error on anything else.
Deadline parse_deadline(const std::string& text, TimeOfDay end_of_day);

} // namespace parcelday
