#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "base/coordinate.hpp"
#include "graph/node_id.hpp"

namespace wayfinder {
namespace search {

struct Location {
  NodeId id;
  Coordinate coordinate;
  std::string display_name;
};

// Exact lookup of named locations by canonical name. Keeps every named node,
// including the ones pruned from the routable graph.
class NameIndex {
 public:
  // returns false if the name canonicalizes to nothing
  bool Add(NodeId id, const Coordinate& coordinate, std::string_view display_name);

  // `name` is canonicalized before the lookup; locations keep insertion order
  std::vector<Location> Locate(std::string_view name) const;

  size_t size() const { return locations_.size(); }

 private:
  absl::flat_hash_map<std::string, std::vector<Location>> locations_;
};

}  // namespace search
}  // namespace wayfinder
