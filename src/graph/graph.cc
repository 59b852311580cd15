#include "graph/graph.hpp"

#include <algorithm>
#include <stdexcept>

#include <s2/s1angle.h>
#include <s2/s2closest_point_query.h>

#include "base/log.hpp"
#include "base/status.hpp"

namespace wayfinder {

namespace {
// S2 ranks candidates by chord angle, which can differ from haversine in the
// last bits; every point this close to the best one is re-ranked exactly
constexpr double kTieToleranceRadians = 1e-9;
}  // namespace

void Graph::AddNode(NodeId id, const Coordinate& coordinate, std::optional<std::string> name) {
  CheckNotFinalized("AddNode");

  // edges already linked to `id` are kept so that adjacency stays symmetric
  Node& node = nodes_[id];
  node.id = id;
  node.coordinate = coordinate;
  node.name = std::move(name);
}

size_t Graph::AddWay(absl::Span<const NodeId> node_ids, std::string_view way_name) {
  CheckNotFinalized("AddWay");

  const std::string name = way_name.empty() ? std::string(kUnknownRoad) : std::string(way_name);

  size_t linked = 0;
  for (size_t i = 1; i < node_ids.size(); ++i) {
    auto from_itr = nodes_.find(node_ids[i - 1]);
    auto to_itr = nodes_.find(node_ids[i]);
    if (from_itr == nodes_.end() || to_itr == nodes_.end()) {
      WAYFINDER_DEBUG("Skipping edge {} -> {} of way \"{}\": unknown node", node_ids[i - 1].value,
                      node_ids[i].value, name);
      continue;
    }

    Node& from = from_itr->second;
    Node& to = to_itr->second;
    from.adjacent.push_back(to.id);
    to.adjacent.push_back(from.id);
    from.way_name = name;
    to.way_name = name;
    ++linked;
  }
  return linked;
}

void Graph::Finalize() {
  CheckNotFinalized("Finalize");

  const size_t total = nodes_.size();
  for (auto itr = nodes_.begin(); itr != nodes_.end();) {
    if (itr->second.adjacent.empty()) {
      nodes_.erase(itr++);
    } else {
      ++itr;
    }
  }

  for (const auto& [id, node] : nodes_) {
    point_index_.Add(node.coordinate.AsS2Point(), id);
  }
  finalized_ = true;

  WAYFINDER_INFO("Graph finalized with {} nodes, {} isolated nodes pruned", nodes_.size(),
                 total - nodes_.size());
}

absl::StatusOr<double> Graph::Distance(NodeId from, NodeId to) const {
  const Node* from_node = FindNode(from);
  if (!from_node) {
    return UnknownVertexError(from);
  }
  const Node* to_node = FindNode(to);
  if (!to_node) {
    return UnknownVertexError(to);
  }
  return from_node->coordinate.DistanceMiles(to_node->coordinate);
}

absl::StatusOr<double> Graph::Bearing(NodeId from, NodeId to) const {
  const Node* from_node = FindNode(from);
  if (!from_node) {
    return UnknownVertexError(from);
  }
  const Node* to_node = FindNode(to);
  if (!to_node) {
    return UnknownVertexError(to);
  }
  return from_node->coordinate.BearingTo(to_node->coordinate);
}

absl::StatusOr<NodeId> Graph::NearestNode(const Coordinate& coordinate) const {
  if (!finalized_) {
    throw std::logic_error("Graph::NearestNode called before Graph::Finalize");
  }
  if (nodes_.empty()) {
    return EmptyGraphError();
  }

  S2ClosestPointQuery<NodeId>::PointTarget target(coordinate.AsS2Point());

  S2ClosestPointQuery<NodeId> closest_query(&point_index_);
  closest_query.mutable_options()->set_max_results(1);
  const auto closest = closest_query.FindClosestPoint(&target);
  if (closest.is_empty()) {
    return EmptyGraphError();
  }

  S2ClosestPointQuery<NodeId> candidates_query(&point_index_);
  candidates_query.mutable_options()->set_inclusive_max_distance(
      S1Angle::Radians(closest.distance().ToAngle().radians() + kTieToleranceRadians));

  std::optional<NodeId> best;
  double best_distance = 0.0;
  for (const auto& candidate : candidates_query.FindClosestPoints(&target)) {
    const NodeId id = candidate.data();
    const double distance = nodes_.at(id).coordinate.DistanceMiles(coordinate);
    if (!best || distance < best_distance || (distance == best_distance && id < *best)) {
      best = id;
      best_distance = distance;
    }
  }

  if (!best) {
    return EmptyGraphError();
  }
  return *best;
}

absl::StatusOr<absl::Span<const NodeId>> Graph::Adjacent(NodeId id) const {
  const Node* node = FindNode(id);
  if (!node) {
    return UnknownVertexError(id);
  }
  return absl::MakeConstSpan(node->adjacent);
}

absl::StatusOr<std::string_view> Graph::WayName(NodeId id) const {
  const Node* node = FindNode(id);
  if (!node) {
    return UnknownVertexError(id);
  }
  if (!node->way_name) {
    return kUnknownRoad;
  }
  return std::string_view(*node->way_name);
}

const Node* Graph::FindNode(NodeId id) const {
  auto itr = nodes_.find(id);
  return itr == nodes_.end() ? nullptr : &itr->second;
}

std::vector<NodeId> Graph::node_ids() const {
  std::vector<NodeId> ids;
  ids.reserve(nodes_.size());
  for (const auto& [id, _] : nodes_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void Graph::CheckNotFinalized(const char* operation) const {
  if (finalized_) {
    throw std::logic_error(std::string("Graph::") + operation + " called on a finalized graph");
  }
}

}  // namespace wayfinder
