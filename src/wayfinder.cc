#include "wayfinder.hpp"

#include "base/log.hpp"

namespace wayfinder {

Navigator::Navigator(std::shared_ptr<const Graph> graph, std::shared_ptr<const search::Trie> trie,
                     std::shared_ptr<const search::NameIndex> name_index)
    : graph_(std::move(graph)),
      trie_(std::move(trie)),
      name_index_(std::move(name_index)),
      path_finder_(*graph_) {}

absl::StatusOr<std::vector<NodeId>> Navigator::Route(const Coordinate& start, const Coordinate& end,
                                                     const route::SearchOptions& options) const {
  auto from = graph_->NearestNode(start);
  if (!from.ok()) {
    return from.status();
  }
  auto to = graph_->NearestNode(end);
  if (!to.ok()) {
    return to.status();
  }

  WAYFINDER_DEBUG("Routing ({}, {}) -> ({}, {}) between nodes {} and {}", start.lng(), start.lat(), end.lng(),
                  end.lat(), from->value, to->value);
  return path_finder_.ShortestPath(*from, *to, options);
}

absl::StatusOr<std::vector<route::DirectionStep>> Navigator::Directions(absl::Span<const NodeId> path) const {
  return route::BuildDirections(*graph_, path);
}

absl::flat_hash_set<std::string> Navigator::Autocomplete(std::string_view prefix) const {
  return trie_->PrefixSearch(prefix);
}

std::vector<search::Location> Navigator::Locate(std::string_view name) const {
  return name_index_->Locate(name);
}

}  // namespace wayfinder
