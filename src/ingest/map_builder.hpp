#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/types/span.h>

#include "base/coordinate.hpp"
#include "graph/graph.hpp"
#include "search/name_index.hpp"
#include "search/trie.hpp"
#include "wayfinder.hpp"

namespace wayfinder {
namespace ingest {

// Receives map events in document order (nodes before the ways referencing
// them) and assembles the graph and name indexes. Build() is one-shot.
class MapBuilder {
 public:
  MapBuilder();

  void AddNode(NodeId id, const Coordinate& coordinate, std::optional<std::string> name = {});
  void AddWay(absl::Span<const NodeId> node_ids, std::string_view way_name);

  Navigator Build();

  size_t node_events() const { return node_events_; }
  size_t way_events() const { return way_events_; }
  // ways which contributed no edge
  size_t skipped_ways() const { return skipped_ways_; }

 private:
  void CheckNotBuilt() const;

  std::shared_ptr<Graph> graph_;
  std::shared_ptr<search::Trie> trie_;
  std::shared_ptr<search::NameIndex> name_index_;
  size_t node_events_ = 0;
  size_t way_events_ = 0;
  size_t skipped_ways_ = 0;
  bool built_ = false;
};

}  // namespace ingest
}  // namespace wayfinder
