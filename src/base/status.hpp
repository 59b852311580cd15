#pragma once

#include <cstdint>
#include <string_view>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "graph/node_id.hpp"

namespace wayfinder {

// Errors reported by the query surface. Each kind owns one absl status code so
// callers can tell them apart without inspecting messages.

inline absl::Status UnknownVertexError(NodeId id) {
  return absl::NotFoundError(absl::StrCat("unknown vertex ", id.value));
}

inline absl::Status EmptyGraphError() {
  return absl::FailedPreconditionError("graph has no nodes");
}

inline absl::Status NoRouteError(NodeId from, NodeId to) {
  return absl::UnavailableError(absl::StrCat("no route from ", from.value, " to ", to.value));
}

inline absl::Status SearchAbortedError(uint64_t expanded_nodes) {
  return absl::ResourceExhaustedError(
      absl::StrCat("search aborted after expanding ", expanded_nodes, " nodes"));
}

inline absl::Status ParseFailureError(std::string_view text, std::string_view reason) {
  return absl::InvalidArgumentError(absl::StrCat("cannot parse \"", text, "\": ", reason));
}

inline bool IsUnknownVertex(const absl::Status &status) { return absl::IsNotFound(status); }
inline bool IsEmptyGraph(const absl::Status &status) { return absl::IsFailedPrecondition(status); }
inline bool IsNoRoute(const absl::Status &status) { return absl::IsUnavailable(status); }
inline bool IsSearchAborted(const absl::Status &status) { return absl::IsResourceExhausted(status); }
inline bool IsParseFailure(const absl::Status &status) { return absl::IsInvalidArgument(status); }

} // namespace wayfinder
