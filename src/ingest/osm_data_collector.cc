#include "osm_data_collector.hpp"

#include <optional>
#include <string_view>
#include <unordered_set>

#include <osmium/io/any_input.hpp>
#include <osmium/util/progress_bar.hpp>
#include <osmium/visitor.hpp>

#include "base/log.hpp"

namespace wayfinder {
namespace ingest {

void OSMDataCollector::CollectFrom(const std::string& filename) {
  osmium::io::Reader reader{filename, osmium::osm_entity_bits::node | osmium::osm_entity_bits::way};
  osmium::ProgressBar progress{reader.file_size(), osmium::isatty(2)};

  while (osmium::memory::Buffer buffer = reader.read()) {
    osmium::apply(buffer, *this);
    progress.update(reader.offset());
  }

  progress.done();
  reader.close();
  WAYFINDER_INFO("Read {} nodes and {} ways from {}", builder_.node_events(), builder_.way_events(), filename);
}

void OSMDataCollector::node(const osmium::Node& node) {
  if (!node.location().valid()) {
    return;
  }

  std::optional<std::string> name;
  if (const char* name_tag = node.tags()["name"]) {
    name = name_tag;
  }
  builder_.AddNode(NodeId{node.id()}, {node.location().lon(), node.location().lat()}, std::move(name));
}

void OSMDataCollector::way(const osmium::Way& way) {
  if (!isWayAccessibleByAuto(way)) {
    return;
  }

  way_nodes_.clear();
  for (const auto& node : way.nodes()) {
    way_nodes_.push_back(NodeId{node.ref()});
  }
  const char* name = way.tags()["name"];
  builder_.AddWay(way_nodes_, name ? std::string_view(name) : std::string_view());
}

bool OSMDataCollector::isWayAccessibleByAuto(const osmium::Way& way) const {
  static const std::unordered_set<std::string_view> kAccessibleTags = {
      "motorway",      "trunk",      "primary",      "secondary",      "tertiary",
      "unclassified",  "residential", "living_street", "motorway_link", "trunk_link",
      "primary_link",  "secondary_link", "tertiary_link"};
  const char* highway = way.tags()["highway"];
  if (highway == nullptr) {
    return false;
  }
  return kAccessibleTags.contains(highway);
}

}  // namespace ingest
}  // namespace wayfinder
