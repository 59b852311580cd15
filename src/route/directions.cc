#include "route/directions.hpp"

#include <array>
#include <utility>

#include <absl/strings/numbers.h>
#include <fmt/format.h>

#include "base/angle.hpp"
#include "base/status.hpp"

namespace wayfinder {
namespace route {

namespace {

constexpr std::array<std::pair<TurnKind, std::string_view>, 8> kPhrases = {{
    {TurnKind::Start, "Start"},
    {TurnKind::Straight, "Go straight"},
    {TurnKind::SlightLeft, "Slight left"},
    {TurnKind::SlightRight, "Slight right"},
    {TurnKind::Left, "Turn left"},
    {TurnKind::Right, "Turn right"},
    {TurnKind::SharpLeft, "Sharp left"},
    {TurnKind::SharpRight, "Sharp right"},
}};

constexpr std::string_view kRoadSeparator = " on ";
constexpr std::string_view kDistanceSeparator = " and continue for ";
constexpr std::string_view kSuffix = " miles.";

bool IsDistanceLiteral(std::string_view literal) {
  if (literal.empty()) {
    return false;
  }
  size_t dots = 0;
  size_t digits = 0;
  for (char c : literal) {
    if (c == '.') {
      ++dots;
    } else if (c >= '0' && c <= '9') {
      ++digits;
    } else {
      return false;
    }
  }
  return dots <= 1 && digits > 0;
}

}  // namespace

TurnKind ClassifyTurn(double relative_bearing) {
  if (relative_bearing >= -15.0 && relative_bearing <= 15.0) {
    return TurnKind::Straight;
  }
  if (relative_bearing > 15.0 && relative_bearing <= 30.0) {
    return TurnKind::SlightRight;
  }
  if (relative_bearing < -15.0 && relative_bearing >= -30.0) {
    return TurnKind::SlightLeft;
  }
  if (relative_bearing > 30.0 && relative_bearing <= 100.0) {
    return TurnKind::Right;
  }
  if (relative_bearing < -30.0 && relative_bearing >= -100.0) {
    return TurnKind::Left;
  }
  if (relative_bearing > 100.0) {
    return TurnKind::SharpRight;
  }
  return TurnKind::SharpLeft;
}

std::string_view TurnPhrase(TurnKind turn) {
  for (const auto& [kind, phrase] : kPhrases) {
    if (kind == turn) {
      return phrase;
    }
  }
  return {};
}

absl::StatusOr<std::vector<DirectionStep>> BuildDirections(const Graph& graph, absl::Span<const NodeId> path) {
  if (path.empty()) {
    return absl::InvalidArgumentError("cannot build directions for an empty path");
  }

  auto first_way = graph.WayName(path.front());
  if (!first_way.ok()) {
    return first_way.status();
  }

  std::vector<DirectionStep> steps;
  DirectionStep active{TurnKind::Start, std::string(*first_way), 0.0};
  double previous_heading = 0.0;

  for (size_t i = 1; i < path.size(); ++i) {
    const NodeId from = path[i - 1];
    const NodeId to = path[i];

    auto heading = graph.Bearing(from, to);
    if (!heading.ok()) {
      return heading.status();
    }
    auto distance = graph.Distance(from, to);
    if (!distance.ok()) {
      return distance.status();
    }
    // a segment belongs to the road it leaves its first node on
    auto road = graph.WayName(from);
    if (!road.ok()) {
      return road.status();
    }

    if (*road != active.road_name) {
      // a dropped zero-length Start hands its role to the next road
      TurnKind turn = TurnKind::Start;
      if (active.distance_miles != 0.0) {
        steps.push_back(std::move(active));
      }
      if (!steps.empty()) {
        turn = ClassifyTurn(TurnAngle(previous_heading, *heading));
      }
      active = DirectionStep{turn, std::string(*road), 0.0};
    }
    active.distance_miles += *distance;
    // coincident nodes have no heading
    if (*distance > 0.0) {
      previous_heading = *heading;
    }
  }

  steps.push_back(std::move(active));
  return steps;
}

std::string FormatStep(const DirectionStep& step) {
  return fmt::format("{} on {} and continue for {:.3f} miles.", TurnPhrase(step.turn), step.road_name,
                     step.distance_miles);
}

absl::StatusOr<DirectionStep> ParseStep(std::string_view text) {
  DirectionStep step;

  // phrase, matched against the closed set
  std::string_view rest;
  bool matched = false;
  for (const auto& [kind, phrase] : kPhrases) {
    if (text.size() > phrase.size() + kRoadSeparator.size() && text.substr(0, phrase.size()) == phrase &&
        text.substr(phrase.size(), kRoadSeparator.size()) == kRoadSeparator) {
      step.turn = kind;
      rest = text.substr(phrase.size() + kRoadSeparator.size());
      matched = true;
      break;
    }
  }
  if (!matched) {
    return ParseFailureError(text, "unknown turn phrase");
  }

  if (rest.size() < kSuffix.size() || rest.substr(rest.size() - kSuffix.size()) != kSuffix) {
    return ParseFailureError(text, "missing \" miles.\" suffix");
  }
  rest.remove_suffix(kSuffix.size());

  // road names may contain the separator words, the distance never does
  const size_t separator = rest.rfind(kDistanceSeparator);
  if (separator == std::string_view::npos) {
    return ParseFailureError(text, "missing distance");
  }
  const std::string_view road_name = rest.substr(0, separator);
  const std::string_view literal = rest.substr(separator + kDistanceSeparator.size());
  if (road_name.empty()) {
    return ParseFailureError(text, "empty road name");
  }

  if (!IsDistanceLiteral(literal) || !absl::SimpleAtod(literal, &step.distance_miles)) {
    return ParseFailureError(text, "distance is not a number");
  }
  step.road_name = std::string(road_name);
  return step;
}

}  // namespace route
}  // namespace wayfinder
