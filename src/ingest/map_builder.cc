#include "ingest/map_builder.hpp"

#include <stdexcept>

#include "base/log.hpp"

namespace wayfinder {
namespace ingest {

MapBuilder::MapBuilder()
    : graph_(std::make_shared<Graph>()),
      trie_(std::make_shared<search::Trie>()),
      name_index_(std::make_shared<search::NameIndex>()) {}

void MapBuilder::AddNode(NodeId id, const Coordinate& coordinate, std::optional<std::string> name) {
  CheckNotBuilt();
  ++node_events_;

  if (name) {
    name_index_->Add(id, coordinate, *name);
    trie_->Insert(*name);
  }
  graph_->AddNode(id, coordinate, std::move(name));
}

void MapBuilder::AddWay(absl::Span<const NodeId> node_ids, std::string_view way_name) {
  CheckNotBuilt();
  ++way_events_;

  if (node_ids.size() < 2) {
    WAYFINDER_DEBUG("Skipping way \"{}\" with {} nodes", way_name, node_ids.size());
    ++skipped_ways_;
    return;
  }
  if (graph_->AddWay(node_ids, way_name) == 0) {
    WAYFINDER_WARN("Way \"{}\" references no known consecutive nodes, no edges added", way_name);
    ++skipped_ways_;
  }
}

Navigator MapBuilder::Build() {
  CheckNotBuilt();
  built_ = true;

  graph_->Finalize();
  WAYFINDER_INFO("Built map from {} nodes and {} ways ({} ways without edges), {} names indexed",
                 node_events_, way_events_, skipped_ways_, trie_->size());
  return Navigator(std::move(graph_), std::move(trie_), std::move(name_index_));
}

void MapBuilder::CheckNotBuilt() const {
  if (built_) {
    throw std::logic_error("MapBuilder used after Build()");
  }
}

}  // namespace ingest
}  // namespace wayfinder
