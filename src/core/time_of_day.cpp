#include "parcelday/core/time_of_day.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "parcelday/util/strings.h"

namespace parcelday {
namespace {

int parse_field(const std::string& raw, int lo, int hi, const std::string& what, const std::string& full) {
  const std::string s = trim_copy(raw);
  if (!is_digits(s) || s.size() > 2) throw std::runtime_error("Invalid " + what + " in time: '" + full + "'");
  const int v = std::stoi(s);
  if (v < lo || v > hi) throw std::runtime_error(what + " out of range in time: '" + full + "'");
  return v;
}

} // namespace

TimeOfDay TimeOfDay::from_hms(int hour, int minute, int second) {
  if (hour < 0) throw std::runtime_error("hour out of range");
  if (minute < 0 || minute > 59) throw std::runtime_error("minute out of range");
  if (second < 0 || second > 59) throw std::runtime_error("second out of range");
  return TimeOfDay(static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second);
}

TimeOfDay TimeOfDay::parse_clock(const std::string& text) {
  const auto parts = split(trim_copy(text), ':');
  if (parts.size() != 2 && parts.size() != 3) {
    throw std::runtime_error("Invalid time format, expected HH:MM: '" + text + "'");
  }
  const int h = parse_field(parts[0], 0, 23, "hour", text);
  const int m = parse_field(parts[1], 0, 59, "minute", text);
  const int s = (parts.size() == 3) ? parse_field(parts[2], 0, 59, "second", text) : 0;
  return from_hms(h, m, s);
}

std::string TimeOfDay::to_string() const {
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(2) << hour() << ':' << std::setw(2) << minute() << ':' << std::setw(2)
     << second();
  return ss.str();
}

Deadline parse_deadline(const std::string& text, TimeOfDay end_of_day) {
  const std::string s = trim_copy(text);
  if (to_lower(s) == "eod") return Deadline{end_of_day, true};

  const std::size_t colon = s.find(':');
  const std::size_t space = s.find(' ', colon == std::string::npos ? 0 : colon);
  if (colon == std::string::npos || space == std::string::npos) {
    throw std::runtime_error("Invalid deadline, expected 'H:MM AM|PM' or 'EOD': '" + text + "'");
  }

  int hour = parse_field(s.substr(0, colon), 1, 12, "hour", text);
  const int minute = parse_field(s.substr(colon + 1, space - colon - 1), 0, 59, "minute", text);
  const std::string meridiem = to_lower(trim_copy(s.substr(space + 1)));
  if (meridiem == "pm") {
    if (hour != 12) hour += 12;
  } else if (meridiem == "am") {
    if (hour == 12) hour = 0;
  } else {
    throw std::runtime_error("Invalid deadline, expected AM or PM: '" + text + "'");
  }
  return Deadline{TimeOfDay::from_hms(hour, minute), false};
}

} // namespace parcelday
