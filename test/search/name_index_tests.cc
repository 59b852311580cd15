#include "search/name_index.hpp"

#include <catch2/catch_test_macros.hpp>

namespace wayfinder {
namespace search {

TEST_CASE("Locate returns every location with the canonical name") {
  NameIndex index;
  REQUIRE(index.Add(NodeId{10}, {-122.26, 37.87}, "Peet's Coffee"));
  REQUIRE(index.Add(NodeId{20}, {-122.27, 37.88}, "Peets Coffee"));
  REQUIRE(index.Add(NodeId{30}, {-122.28, 37.89}, "Top Dog"));

  auto locations = index.Locate("peets coffee");
  REQUIRE(locations.size() == 2);
  REQUIRE(locations[0].id == NodeId{10});
  REQUIRE(locations[0].display_name == "Peet's Coffee");
  REQUIRE(locations[0].coordinate == Coordinate{-122.26, 37.87});
  REQUIRE(locations[1].id == NodeId{20});

  REQUIRE(index.Locate("PEET'S COFFEE").size() == 2);
  REQUIRE(index.Locate("top dog").size() == 1);
}

TEST_CASE("Locate misses unknown and partial names") {
  NameIndex index;
  index.Add(NodeId{1}, {0.0, 0.0}, "Top Dog");

  REQUIRE(index.Locate("top").empty());
  REQUIRE(index.Locate("topdog").empty());
  REQUIRE(index.Locate("").empty());
}

TEST_CASE("Add ignores names without letters") {
  NameIndex index;
  REQUIRE_FALSE(index.Add(NodeId{1}, {0.0, 0.0}, "42"));
  REQUIRE(index.size() == 0);
}

} // namespace search
} // namespace wayfinder
