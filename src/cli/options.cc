#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>

#include <absl/strings/numbers.h>

namespace wayfinder::cli {

namespace {

std::string_view NextValue(int argc, char** argv, int& arg_index, std::string_view flag) {
  if (arg_index + 1 >= argc) {
    throw std::runtime_error("Missing value for " + std::string(flag));
  }
  return argv[++arg_index];
}

double ParseDegrees(std::string_view value, std::string_view flag) {
  double degrees = 0.0;
  if (!absl::SimpleAtod(value, &degrees)) {
    throw std::runtime_error("Invalid coordinate for " + std::string(flag) + ": " + std::string(value));
  }
  return degrees;
}

} // namespace

// static
Options Options::Parse(int argc, char** argv) {
  Options options;
  try {
    // -1 to skip the program name
    options = ParseOrThrow(argc - 1, argv + 1);
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    PrintUsage(argv[0]);
    std::exit(1);
  }
  return options;
}

// static
void Options::PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " OSMFILE [options]\n"
            << "  --route FROM_LON FROM_LAT TO_LON TO_LAT  print directions between two points\n"
            << "  --autocomplete PREFIX                    print location names starting with PREFIX\n"
            << "  --locate NAME                            print locations named NAME\n"
            << "  --max-expanded-nodes N                   give up routing after expanding N nodes\n";
}

// static
Options Options::ParseOrThrow(int argc, char** argv) {
  Options options;
  for (int arg_index = 0; arg_index < argc; ++arg_index) {
    std::string_view arg = argv[arg_index];
    if (arg == "--route") {
      RouteQuery query;
      query.start.x = ParseDegrees(NextValue(argc, argv, arg_index, arg), arg);
      query.start.y = ParseDegrees(NextValue(argc, argv, arg_index, arg), arg);
      query.end.x = ParseDegrees(NextValue(argc, argv, arg_index, arg), arg);
      query.end.y = ParseDegrees(NextValue(argc, argv, arg_index, arg), arg);
      options.route = query;
    } else if (arg == "--autocomplete") {
      options.autocomplete = std::string(NextValue(argc, argv, arg_index, arg));
    } else if (arg == "--locate") {
      options.locate = std::string(NextValue(argc, argv, arg_index, arg));
    } else if (arg == "--max-expanded-nodes") {
      auto value = NextValue(argc, argv, arg_index, arg);
      uint64_t max_expanded_nodes = 0;
      if (!absl::SimpleAtoi(value, &max_expanded_nodes)) {
        throw std::runtime_error("Invalid value for --max-expanded-nodes: " + std::string(value));
      }
      options.max_expanded_nodes = max_expanded_nodes;
    } else if (options.osm_file.empty()) {
      options.osm_file = std::string(arg);
    } else {
      throw std::runtime_error("Unexpected argument: " + std::string(arg));
    }
  }
  if (options.osm_file.empty()) {
    throw std::runtime_error("Missing OSMFILE");
  }
  return options;
}

} // namespace wayfinder::cli
