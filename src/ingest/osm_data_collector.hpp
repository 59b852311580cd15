#pragma once

#include <string>
#include <vector>

#include <osmium/handler.hpp>
#include <osmium/osm/node.hpp>
#include <osmium/osm/way.hpp>

#include "ingest/map_builder.hpp"

namespace wayfinder {
namespace ingest {

// Streams an OSM file into a MapBuilder: every located node becomes a node
// event, every drivable highway a way event.
struct OSMDataCollector : public osmium::handler::Handler {
public:
  explicit OSMDataCollector(MapBuilder &builder) : builder_(builder) {}

  void node(const osmium::Node &node);
  void way(const osmium::Way &way);

  void CollectFrom(const std::string &filename);

private:
  bool isWayAccessibleByAuto(const osmium::Way &way) const;

  MapBuilder &builder_;
  std::vector<NodeId> way_nodes_;
};

} // namespace ingest
} // namespace wayfinder
