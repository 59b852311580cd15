#include "route/path_finder.hpp"

#include <algorithm>
#include <cassert>
#include <queue>

#include <absl/container/flat_hash_map.h>

#include "base/log.hpp"
#include "base/status.hpp"

namespace wayfinder {
namespace route {

namespace {

struct FrontierEntry {
  double priority = 0.0;
  double distance = 0.0;
  NodeId node_id;

  bool operator<(const FrontierEntry& rhs) const {
    if (priority != rhs.priority) {
      return priority > rhs.priority;
    }
    return rhs.node_id < node_id;
  }
};

struct SearchContext {
  std::priority_queue<FrontierEntry> frontier;
  absl::flat_hash_map<NodeId, double> best_distance;
  absl::flat_hash_map<NodeId, NodeId> predecessor;
  uint64_t expanded = 0;
};

std::vector<NodeId> ReconstructPath(const SearchContext& context, NodeId from, NodeId to) {
  std::vector<NodeId> path = {to};
  NodeId current = to;
  while (current != from) {
    current = context.predecessor.at(current);
    path.push_back(current);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace

absl::StatusOr<std::vector<NodeId>> PathFinder::ShortestPath(NodeId from, NodeId to,
                                                             const SearchOptions& options) const {
  const Node* from_node = graph_.FindNode(from);
  if (!from_node) {
    return UnknownVertexError(from);
  }
  const Node* goal_node = graph_.FindNode(to);
  if (!goal_node) {
    return UnknownVertexError(to);
  }

  if (from == to) {
    return std::vector<NodeId>{from};
  }

  auto heuristic = [goal_node](const Node& node) {
    return node.coordinate.DistanceMiles(goal_node->coordinate);
  };

  SearchContext context;
  context.best_distance[from] = 0.0;
  context.frontier.push({heuristic(*from_node), 0.0, from});

  while (!context.frontier.empty()) {
    const auto current = context.frontier.top();
    context.frontier.pop();

    // a better entry for this node was pushed after this one
    if (current.distance > context.best_distance.at(current.node_id)) {
      continue;
    }

    if (current.node_id == to) {
      WAYFINDER_TRACE("Route {} -> {} found after expanding {} nodes", from.value, to.value,
                      context.expanded);
      return ReconstructPath(context, from, to);
    }

    if (options.max_expanded_nodes && context.expanded >= *options.max_expanded_nodes) {
      WAYFINDER_DEBUG("Route {} -> {} aborted after expanding {} nodes", from.value, to.value,
                      context.expanded);
      return SearchAbortedError(context.expanded);
    }
    ++context.expanded;

    const Node* node = graph_.FindNode(current.node_id);
    // adjacency is symmetric and pruning never removes linked nodes
    assert(node);

    for (const NodeId neighbour_id : node->adjacent) {
      const Node* neighbour = graph_.FindNode(neighbour_id);
      assert(neighbour);

      const double distance = current.distance + node->coordinate.DistanceMiles(neighbour->coordinate);
      auto best_itr = context.best_distance.find(neighbour_id);
      if (best_itr != context.best_distance.end() && distance >= best_itr->second) {
        continue;
      }
      context.best_distance[neighbour_id] = distance;
      context.predecessor[neighbour_id] = current.node_id;
      context.frontier.push({distance + heuristic(*neighbour), distance, neighbour_id});
    }
  }

  WAYFINDER_TRACE("No route {} -> {} after expanding {} nodes", from.value, to.value, context.expanded);
  return NoRouteError(from, to);
}

absl::StatusOr<double> PathLength(const Graph& graph, const std::vector<NodeId>& path) {
  if (!path.empty() && !graph.FindNode(path.front())) {
    return UnknownVertexError(path.front());
  }
  double length = 0.0;
  for (size_t i = 1; i < path.size(); ++i) {
    auto distance = graph.Distance(path[i - 1], path[i]);
    if (!distance.ok()) {
      return distance.status();
    }
    length += *distance;
  }
  return length;
}

}  // namespace route
}  // namespace wayfinder
