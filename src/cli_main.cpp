#include <iostream>
#include <memory>
#include <string>

#include "parcelday/core/report.h"
#include "parcelday/core/scenario.h"
#include "parcelday/core/scenario_validation.h"
#include "parcelday/core/simulation.h"
#include "parcelday/util/file_io.h"
#include "parcelday/util/log.h"
#include "parcelday/util/strings.h"

namespace {

#ifndef PARCELDAY_VERSION
#define PARCELDAY_VERSION "unknown"
#endif

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "parcelday CLI v" << PARCELDAY_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "parcelday_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --locations PATH  Locations + distance table CSV (default: data/locations.csv)\n";
  std::cout << "  --items PATH      Items CSV (default: data/items.csv)\n";
  std::cout << "  --config PATH     Simulation config JSON (default: data/config.json, '' for built-in defaults)\n";
  std::cout << "  --until HH:MM     Stop time (default: end of day from the config)\n";
  std::cout << "  --menu            Interactive menu (run to end of day / run until a time / exit)\n";
  std::cout << "  --validate        Check the scenario, print issues, and exit\n";
  std::cout << "  --export-json PATH        Write the final status snapshot as JSON\n";
  std::cout << "  --export-events-csv PATH  Write the simulation event log as CSV\n";
  std::cout << "  --log-level LEVEL Log verbosity (debug|info|warn|error|off, default: warn)\n";
  std::cout << "  --quiet           Suppress the status report (useful for scripts)\n";
  std::cout << "  --version         Print version and exit\n";
  std::cout << "  -h, --help        Show this help\n";
}

std::unique_ptr<parcelday::Simulation> make_simulation(const parcelday::Scenario& sc) {
  return std::make_unique<parcelday::Simulation>(sc.graph, sc.items, sc.cfg);
}

// Runs a fresh simulation from the start of the day up to `stop` and prints the report.
void run_and_report(const parcelday::Scenario& sc, parcelday::TimeOfDay stop) {
  auto sim = make_simulation(sc);
  const auto res = sim->run_until(stop);
  std::cout << "\n" << parcelday::format_status_report(*sim);
  if (res.finished) std::cout << "Finished at " << res.ended_at.to_string() << "\n";
  std::cout << "\n";
}

void prompt_and_run_until(const parcelday::Scenario& sc) {
  std::string line;
  for (;;) {
    std::cout << "What time should the simulation stop?\n";
    std::cout << "Use the format HH:MM (" << sc.cfg.start_time.to_string().substr(0, 5) << " to "
              << sc.cfg.latest_stop.to_string().substr(0, 5) << ")\n";
    std::cout << "Time: " << std::flush;
    if (!std::getline(std::cin, line)) return;

    parcelday::TimeOfDay stop;
    std::string err;
    if (parcelday::parse_stop_time(line, sc.cfg, stop, &err)) {
      run_and_report(sc, stop);
      return;
    }
    std::cout << "Sorry, that selection is invalid. " << err << "\n";
  }
}

int run_menu(const parcelday::Scenario& sc) {
  std::string line;
  for (;;) {
    std::cout << "Welcome to the parcelday delivery simulator!\n";
    std::cout << "Please select from the following options:\n";
    std::cout << "1: Run until end of day\n";
    std::cout << "2: Run until a specific time\n";
    std::cout << "3: Exit\n";
    std::cout << "Your selection: " << std::flush;
    if (!std::getline(std::cin, line)) return 0;

    const std::string choice = parcelday::trim_copy(line);
    if (choice == "1") {
      run_and_report(sc, sc.cfg.end_of_day);
    } else if (choice == "2") {
      prompt_and_run_until(sc);
    } else if (choice == "3") {
      return 0;
    } else {
      std::cout << "Sorry, that is an invalid selection.\n\n";
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << PARCELDAY_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_text = get_str_arg(argc, argv, "--log-level", "warn");
    parcelday::log::Level lvl = parcelday::log::Level::Warn;
    if (!parcelday::log::parse_level(level_text, lvl)) {
      std::cerr << "Unknown --log-level: " << level_text << "\n\n";
      print_usage(argv[0]);
      return 2;
    }
    parcelday::log::set_level(lvl);

    const std::string locations_path = get_str_arg(argc, argv, "--locations", "data/locations.csv");
    const std::string items_path = get_str_arg(argc, argv, "--items", "data/items.csv");
    const std::string config_path = get_str_arg(argc, argv, "--config", "data/config.json");
    const std::string until_text = get_str_arg(argc, argv, "--until", "");
    const std::string export_json_path = get_str_arg(argc, argv, "--export-json", "");
    const std::string export_events_csv_path = get_str_arg(argc, argv, "--export-events-csv", "");
    const bool quiet = has_flag(argc, argv, "--quiet");

    const parcelday::Scenario sc = parcelday::load_scenario(locations_path, items_path, config_path);

    if (has_flag(argc, argv, "--validate")) {
      const auto issues = parcelday::validate_scenario_detailed(sc.graph, sc.items, sc.cfg);
      bool ok = true;
      for (const auto& is : issues) {
        const bool err = is.severity == parcelday::ScenarioIssueSeverity::Error;
        ok = ok && !err;
        std::cerr << (err ? "error" : "warning") << " [" << is.code << "] " << is.message << "\n";
      }
      if (!ok) return 1;
      if (!quiet) std::cout << "Scenario OK\n";
      return 0;
    }

    if (has_flag(argc, argv, "--menu")) return run_menu(sc);

    parcelday::TimeOfDay stop = sc.cfg.end_of_day;
    if (!until_text.empty()) {
      std::string err;
      if (!parcelday::parse_stop_time(until_text, sc.cfg, stop, &err)) {
        std::cerr << "Invalid --until: " << err << "\n\n";
        print_usage(argv[0]);
        return 2;
      }
    }

    auto sim = make_simulation(sc);
    const auto res = sim->run_until(stop);
    if (!quiet) {
      std::cout << parcelday::format_status_report(*sim);
      if (res.finished) std::cout << "Finished at " << res.ended_at.to_string() << "\n";
    }

    if (!export_json_path.empty()) {
      parcelday::write_text_file(export_json_path, parcelday::status_to_json(*sim));
      if (!quiet) std::cout << "\nWrote status JSON to " << export_json_path << "\n";
    }
    if (!export_events_csv_path.empty()) {
      parcelday::write_text_file(export_events_csv_path, parcelday::events_to_csv(sim->events()));
      if (!quiet) std::cout << "\nWrote events CSV to " << export_events_csv_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    parcelday::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
