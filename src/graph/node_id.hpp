#pragma once

#include <cstdint>
#include <utility>

namespace wayfinder {

struct NodeId {
  int64_t value = 0;

  NodeId() = default;
  explicit NodeId(int64_t value) : value(value) {}

  bool operator==(const NodeId& other) const { return value == other.value; }
  bool operator!=(const NodeId& other) const { return value != other.value; }
  bool operator<(const NodeId& other) const { return value < other.value; }

  template <typename H>
  friend H AbslHashValue(H h, const NodeId& id) {
    return H::combine(std::move(h), id.value);
  }
};

}  // namespace wayfinder
