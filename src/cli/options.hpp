#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "base/coordinate.hpp"

namespace wayfinder::cli {

struct RouteQuery {
  Coordinate start;
  Coordinate end;
};

struct Options {
  std::string osm_file;
  std::optional<RouteQuery> route;
  std::optional<std::string> autocomplete;
  std::optional<std::string> locate;
  std::optional<uint64_t> max_expanded_nodes;

  static Options Parse(int argc, char** argv);
  // the same as `Parse`, but throws std::runtime_error instead of exiting
  static Options ParseOrThrow(int argc, char** argv);

private:
  Options() = default;

  static void PrintUsage(const char* program_name);
};

} // namespace wayfinder::cli
