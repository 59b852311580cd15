#include <iostream>
#include <string>

#include "base/log.hpp"
#include "cli/options.hpp"
#include "ingest/map_builder.hpp"
#include "ingest/osm_data_collector.hpp"
#include "route/directions.hpp"
#include "wayfinder.hpp"

namespace wayfinder {
namespace cli {

int PrintRoute(const Navigator& navigator, const RouteQuery& query, const route::SearchOptions& search_options) {
  auto path = navigator.Route(query.start, query.end, search_options);
  if (!path.ok()) {
    std::cerr << "Routing failed: " << path.status() << '\n';
    return 2;
  }

  auto steps = navigator.Directions(*path);
  if (!steps.ok()) {
    std::cerr << "Cannot build directions: " << steps.status() << '\n';
    return 2;
  }
  for (const auto& step : *steps) {
    std::cout << route::FormatStep(step) << '\n';
  }
  return 0;
}

void PrintAutocomplete(const Navigator& navigator, const std::string& prefix) {
  for (const auto& name : navigator.Autocomplete(prefix)) {
    std::cout << name << '\n';
  }
}

void PrintLocations(const Navigator& navigator, const std::string& name) {
  for (const auto& location : navigator.Locate(name)) {
    std::cout << location.id.value << '\t' << location.coordinate.lng() << '\t' << location.coordinate.lat()
              << '\t' << location.display_name << '\n';
  }
}

}  // namespace cli
}  // namespace wayfinder

int main(int argc, char** argv) {
  using namespace wayfinder;

  cli::Options cli_options = cli::Options::Parse(argc, argv);

  base::InitializeLogging();

  try {
    ingest::MapBuilder builder;
    ingest::OSMDataCollector collector{builder};
    collector.CollectFrom(cli_options.osm_file);

    const Navigator navigator = builder.Build();

    int exit_code = 0;
    if (cli_options.route) {
      exit_code = cli::PrintRoute(navigator, *cli_options.route, {cli_options.max_expanded_nodes});
    }
    if (cli_options.autocomplete) {
      cli::PrintAutocomplete(navigator, *cli_options.autocomplete);
    }
    if (cli_options.locate) {
      cli::PrintLocations(navigator, *cli_options.locate);
    }
    return exit_code;
  } catch (const std::exception& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }
}
