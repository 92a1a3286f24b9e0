#pragma once

#include <string>

#include "parcelday/core/entities.h"
#include "parcelday/core/sim_event.h"
#include "parcelday/core/simulation.h"

namespace parcelday {

// "At Hub", "Delayed", "Undeliverable", "On Vehicle N",
// "Delivered at HH:MM:SS by vehicle N (On time|Late)".
std::string item_status_label(const Item& item);

// Tenths of a mile as "12.3".
std::string format_miles(DistanceTenths tenths);

// Human-readable snapshot: current time, one row per item (ascending id),
// then per-vehicle and total mileage.
std::string format_status_report(const Simulation& sim);

// Machine-readable snapshot with the same content as format_status_report.
// Output ends with a trailing newline.
std::string status_to_json(const Simulation& sim);

// Event log as CSV, one row per event in log order.
std::string events_to_csv(const EventLog& log);

} // namespace parcelday
