#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <absl/status/statusor.h>

#include "graph/graph.hpp"

namespace wayfinder {
namespace route {

struct SearchOptions {
  // upper bound on expanded nodes, exceeding it aborts the search
  std::optional<uint64_t> max_expanded_nodes;
};

// A* over an immutable graph. Every ShortestPath call owns its search state,
// so one PathFinder may be shared between threads.
class PathFinder {
 public:
  explicit PathFinder(const Graph& graph) : graph_(graph) {}

  // returns the node sequence from `from` to `to` inclusive
  absl::StatusOr<std::vector<NodeId>> ShortestPath(NodeId from, NodeId to,
                                                   const SearchOptions& options = {}) const;

 private:
  const Graph& graph_;
};

// sum of edge lengths along `path` in miles
absl::StatusOr<double> PathLength(const Graph& graph, const std::vector<NodeId>& path);

}  // namespace route
}  // namespace wayfinder
