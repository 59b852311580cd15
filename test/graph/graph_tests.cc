#include "graph/graph.hpp"

#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "base/angle.hpp"
#include "base/status.hpp"

namespace wayfinder {
namespace {
std::vector<NodeId> Ids(std::initializer_list<int64_t> values) {
  std::vector<NodeId> ids;
  for (auto value : values) {
    ids.emplace_back(value);
  }
  return ids;
}

std::vector<NodeId> Neighbours(const Graph &graph, NodeId id) {
  auto adjacent = graph.Adjacent(id);
  REQUIRE(adjacent.ok());
  return {adjacent->begin(), adjacent->end()};
}

NodeId BruteForceNearest(const Graph &graph, const Coordinate &coordinate) {
  NodeId best;
  double best_distance = std::numeric_limits<double>::max();
  // node_ids() is sorted, so the first minimum is the lowest id
  for (const auto id : graph.node_ids()) {
    const double distance = graph.FindNode(id)->coordinate.DistanceMiles(coordinate);
    if (distance < best_distance) {
      best_distance = distance;
      best = id;
    }
  }
  return best;
}
} // namespace

TEST_CASE("AddWay links consecutive nodes in both directions") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  graph.AddNode(NodeId{2}, {0.0, 1.0});
  graph.AddNode(NodeId{3}, {1.0, 1.0});

  REQUIRE(graph.AddWay(Ids({1, 2, 3}), "Elm St") == 2);
  graph.Finalize();

  REQUIRE(Neighbours(graph, NodeId{2}) == Ids({1, 3}));
  REQUIRE(Neighbours(graph, NodeId{1}) == Ids({2}));
  REQUIRE(Neighbours(graph, NodeId{3}) == Ids({2}));
  REQUIRE(*graph.WayName(NodeId{1}) == "Elm St");
}

TEST_CASE("Adjacency is symmetric and keeps duplicates") {
  Graph graph;
  for (int64_t id = 1; id <= 4; ++id) {
    graph.AddNode(NodeId{id}, {static_cast<double>(id), 0.0});
  }
  graph.AddWay(Ids({1, 2, 3, 2, 4}), "Loop");
  graph.Finalize();

  REQUIRE(Neighbours(graph, NodeId{2}) == Ids({1, 3, 3, 4}));

  for (const auto id : graph.node_ids()) {
    for (const auto neighbour : Neighbours(graph, id)) {
      const auto back = Neighbours(graph, neighbour);
      REQUIRE(std::find(back.begin(), back.end(), id) != back.end());
    }
  }
}

TEST_CASE("AddWay skips pairs with unknown nodes") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  graph.AddNode(NodeId{2}, {0.0, 1.0});
  graph.AddNode(NodeId{5}, {0.0, 2.0});

  REQUIRE(graph.AddWay(Ids({1, 2, 3, 5}), "Main St") == 1);
  REQUIRE(graph.AddWay({}, "Empty") == 0);
  REQUIRE(graph.AddWay(Ids({1}), "Single") == 0);
  graph.Finalize();

  REQUIRE(graph.size() == 2);
  REQUIRE(graph.FindNode(NodeId{5}) == nullptr);
  REQUIRE(IsUnknownVertex(graph.Adjacent(NodeId{3}).status()));
}

TEST_CASE("Way names are last-write-wins and default to unknown road") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  graph.AddNode(NodeId{2}, {0.0, 1.0});
  graph.AddNode(NodeId{3}, {1.0, 1.0});
  graph.AddNode(NodeId{4}, {2.0, 1.0});
  graph.AddWay(Ids({1, 2}), "First");
  graph.AddWay(Ids({2, 3}), "Second");
  graph.AddWay(Ids({3, 4}), "");
  graph.Finalize();

  REQUIRE(*graph.WayName(NodeId{1}) == "First");
  REQUIRE(*graph.WayName(NodeId{2}) == "Second");
  REQUIRE(*graph.WayName(NodeId{3}) == kUnknownRoad);
  REQUIRE(*graph.WayName(NodeId{4}) == kUnknownRoad);
  REQUIRE(IsUnknownVertex(graph.WayName(NodeId{42}).status()));
}

TEST_CASE("AddNode overwrites the coordinate but keeps edges") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0}, "Old");
  graph.AddNode(NodeId{2}, {0.0, 1.0});
  graph.AddWay(Ids({1, 2}), "Road");
  graph.AddNode(NodeId{1}, {0.5, 0.5}, "New");
  graph.Finalize();

  const Node *node = graph.FindNode(NodeId{1});
  REQUIRE(node);
  REQUIRE(node->coordinate == Coordinate{0.5, 0.5});
  REQUIRE(node->name == "New");
  REQUIRE(node->adjacent.size() == 1);
}

TEST_CASE("Finalize prunes isolated nodes and freezes the graph") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  graph.AddNode(NodeId{2}, {0.0, 1.0});
  graph.AddNode(NodeId{3}, {5.0, 5.0}, "Lonely Cafe");
  graph.AddWay(Ids({1, 2}), "Road");

  REQUIRE(graph.size() == 3);
  graph.Finalize();
  REQUIRE(graph.finalized());
  REQUIRE(graph.size() == 2);
  REQUIRE(graph.FindNode(NodeId{3}) == nullptr);

  REQUIRE_THROWS_AS(graph.Finalize(), std::logic_error);
  REQUIRE_THROWS_AS(graph.AddNode(NodeId{4}, {0.0, 0.0}), std::logic_error);
  REQUIRE_THROWS_AS(graph.AddWay(Ids({1, 2}), "Road"), std::logic_error);
}

TEST_CASE("Distance and Bearing between nodes") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  graph.AddNode(NodeId{2}, {0.0, 1.0});
  graph.AddNode(NodeId{3}, {1.0, 1.0});
  graph.AddWay(Ids({1, 2, 3}), "Road");
  graph.Finalize();

  REQUIRE_THAT(*graph.Distance(NodeId{1}, NodeId{2}), Catch::Matchers::WithinAbs(69.1673982565, 1e-6));
  REQUIRE(*graph.Distance(NodeId{1}, NodeId{3}) == *graph.Distance(NodeId{3}, NodeId{1}));
  REQUIRE(*graph.Distance(NodeId{2}, NodeId{2}) == 0.0);

  REQUIRE_THAT(*graph.Bearing(NodeId{1}, NodeId{2}), Catch::Matchers::WithinAbs(0.0, 1e-9));
  REQUIRE_THAT(*graph.Bearing(NodeId{2}, NodeId{1}), Catch::Matchers::WithinAbs(180.0, 1e-9));
  REQUIRE_THAT(*graph.Bearing(NodeId{2}, NodeId{3}), Catch::Matchers::WithinAbs(89.9912735753, 1e-6));

  REQUIRE(IsUnknownVertex(graph.Distance(NodeId{1}, NodeId{9}).status()));
  REQUIRE(IsUnknownVertex(graph.Bearing(NodeId{9}, NodeId{1}).status()));
}

TEST_CASE("Bearing reciprocal relation holds") {
  Graph graph;
  // close to the equator meridians are parallel enough for 1e-6
  graph.AddNode(NodeId{1}, {0.001, 0.001});
  graph.AddNode(NodeId{2}, {0.002, 0.0015});
  graph.AddWay(Ids({1, 2}), "Road");
  graph.Finalize();

  const double forward = *graph.Bearing(NodeId{1}, NodeId{2});
  const double backward = *graph.Bearing(NodeId{2}, NodeId{1});
  REQUIRE_THAT(TurnAngle(ReciprocalBearing(forward), backward), Catch::Matchers::WithinAbs(0.0, 1e-6));
}

TEST_CASE("NearestNode fails on an empty graph") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  graph.Finalize();

  auto nearest = graph.NearestNode({0.0, 0.0});
  REQUIRE_FALSE(nearest.ok());
  REQUIRE(IsEmptyGraph(nearest.status()));
}

TEST_CASE("NearestNode before Finalize is a programming error") {
  Graph graph;
  graph.AddNode(NodeId{1}, {0.0, 0.0});
  REQUIRE_THROWS_AS(graph.NearestNode({0.0, 0.0}), std::logic_error);
}

TEST_CASE("NearestNode prefers the lowest id among equidistant nodes") {
  Graph graph;
  graph.AddNode(NodeId{7}, {1.0, 0.0});
  graph.AddNode(NodeId{3}, {-1.0, 0.0});
  graph.AddNode(NodeId{5}, {0.0, 3.0});
  graph.AddWay(Ids({7, 3, 5}), "Road");
  graph.Finalize();

  REQUIRE(*graph.NearestNode({0.0, 0.0}) == NodeId{3});
  REQUIRE(*graph.NearestNode({0.9, 0.0}) == NodeId{7});
  REQUIRE(*graph.NearestNode({0.0, 2.0}) == NodeId{5});
}

TEST_CASE("NearestNode matches brute force search") {
  std::mt19937 random(42);
  std::uniform_real_distribution<double> lon(-122.30, -122.20);
  std::uniform_real_distribution<double> lat(37.80, 37.90);

  Graph graph;
  std::vector<NodeId> way;
  for (int64_t id = 1; id <= 500; ++id) {
    graph.AddNode(NodeId{id}, {lon(random), lat(random)});
    way.emplace_back(id);
  }
  graph.AddWay(way, "Everything");
  graph.Finalize();

  for (int query = 0; query < 200; ++query) {
    const Coordinate coordinate{lon(random), lat(random)};
    REQUIRE(*graph.NearestNode(coordinate) == BruteForceNearest(graph, coordinate));
  }
}

} // namespace wayfinder
