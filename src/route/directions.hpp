#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/types/span.h>

#include "graph/graph.hpp"

namespace wayfinder {
namespace route {

enum class TurnKind { Start, Straight, SlightLeft, SlightRight, Right, Left, SharpLeft, SharpRight };

struct DirectionStep {
  TurnKind turn = TurnKind::Straight;
  std::string road_name = std::string(kUnknownRoad);
  double distance_miles = 0.0;

  bool operator==(const DirectionStep& other) const {
    return turn == other.turn && road_name == other.road_name && distance_miles == other.distance_miles;
  }
};

// classifies a heading change in degrees, positive is a turn to the right
TurnKind ClassifyTurn(double relative_bearing);

std::string_view TurnPhrase(TurnKind turn);

// Converts a route into turn-by-turn steps. The first step is always `Start`,
// a new step begins whenever the road changes.
absl::StatusOr<std::vector<DirectionStep>> BuildDirections(const Graph& graph, absl::Span<const NodeId> path);

// "<Phrase> on <RoadName> and continue for <distance> miles."
std::string FormatStep(const DirectionStep& step);
absl::StatusOr<DirectionStep> ParseStep(std::string_view text);

}  // namespace route
}  // namespace wayfinder
