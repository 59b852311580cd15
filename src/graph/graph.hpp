#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>

#include <s2/s2point_index.h>

#include "base/coordinate.hpp"
#include "node_id.hpp"

namespace wayfinder {

inline constexpr std::string_view kUnknownRoad = "unknown road";

struct Node {
  NodeId id;
  Coordinate coordinate;
  std::optional<std::string> name;
  // name of the last way which touched this node
  std::optional<std::string> way_name;
  std::vector<NodeId> adjacent;
};

// Undirected road graph. Filled once through AddNode/AddWay, then frozen by
// Finalize(); after that every method is const and safe to call concurrently.
class Graph {
 public:
  Graph() = default;

  Graph(const Graph&) = delete;
  Graph& operator=(const Graph&) = delete;

  // inserts or overwrites the node with `id`
  void AddNode(NodeId id, const Coordinate& coordinate, std::optional<std::string> name = {});

  // links consecutive nodes of the way in both directions, pairs with unknown
  // ids are skipped; returns the number of linked pairs
  size_t AddWay(absl::Span<const NodeId> node_ids, std::string_view way_name);

  // drops nodes without edges and builds the spatial index
  void Finalize();

  absl::StatusOr<double> Distance(NodeId from, NodeId to) const;
  absl::StatusOr<double> Bearing(NodeId from, NodeId to) const;

  // closest node to `coordinate`, the lowest id wins among equidistant ones
  absl::StatusOr<NodeId> NearestNode(const Coordinate& coordinate) const;

  absl::StatusOr<absl::Span<const NodeId>> Adjacent(NodeId id) const;
  absl::StatusOr<std::string_view> WayName(NodeId id) const;

  const Node* FindNode(NodeId id) const;

  std::vector<NodeId> node_ids() const;
  size_t size() const { return nodes_.size(); }
  bool finalized() const { return finalized_; }

 private:
  void CheckNotFinalized(const char* operation) const;

  absl::flat_hash_map<NodeId, Node> nodes_;
  S2PointIndex<NodeId> point_index_;
  bool finalized_ = false;
};

}  // namespace wayfinder
