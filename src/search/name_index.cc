#include "search/name_index.hpp"

#include "base/text.hpp"

namespace wayfinder {
namespace search {

bool NameIndex::Add(NodeId id, const Coordinate& coordinate, std::string_view display_name) {
  std::string key = Canonicalize(display_name);
  if (!HasLetters(key)) {
    return false;
  }
  locations_[std::move(key)].push_back(Location{id, coordinate, std::string(display_name)});
  return true;
}

std::vector<Location> NameIndex::Locate(std::string_view name) const {
  auto itr = locations_.find(Canonicalize(name));
  if (itr == locations_.end()) {
    return {};
  }
  return itr->second;
}

}  // namespace search
}  // namespace wayfinder
