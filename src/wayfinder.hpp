#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>

#include "base/coordinate.hpp"
#include "graph/graph.hpp"
#include "route/directions.hpp"
#include "route/path_finder.hpp"
#include "search/name_index.hpp"
#include "search/trie.hpp"

namespace wayfinder {

// Query surface over a fully built map. All methods are const and may be
// called from any number of threads.
class Navigator {
 public:
  Navigator(std::shared_ptr<const Graph> graph, std::shared_ptr<const search::Trie> trie,
            std::shared_ptr<const search::NameIndex> name_index);

  // route between the nodes closest to `start` and `end`
  absl::StatusOr<std::vector<NodeId>> Route(const Coordinate& start, const Coordinate& end,
                                            const route::SearchOptions& options = {}) const;

  absl::StatusOr<std::vector<route::DirectionStep>> Directions(absl::Span<const NodeId> path) const;

  absl::flat_hash_set<std::string> Autocomplete(std::string_view prefix) const;

  std::vector<search::Location> Locate(std::string_view name) const;

  const Graph& graph() const { return *graph_; }

 private:
  std::shared_ptr<const Graph> graph_;
  std::shared_ptr<const search::Trie> trie_;
  std::shared_ptr<const search::NameIndex> name_index_;
  route::PathFinder path_finder_;
};

}  // namespace wayfinder
