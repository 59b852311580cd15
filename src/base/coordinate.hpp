#pragma once

#include <s2/s1angle.h>
#include <s2/s2earth.h>
#include <s2/s2latlng.h>
#include <s2/s2point.h>

#include "angle.hpp"

namespace wayfinder {

// distances are reported in miles on a sphere of this radius, not S2Earth's
inline constexpr double kEarthRadiusMiles = 3963.0;

struct Coordinate {
  double x{};
  double y{};

  double lng() const { return x; }

  double lat() const { return y; }

  bool operator==(const Coordinate &other) const { return x == other.x && y == other.y; }

  S2LatLng AsS2LatLng() const { return S2LatLng::FromDegrees(y, x); }

  S2Point AsS2Point() const { return AsS2LatLng().Normalized().ToPoint(); }

  // returns great-circle (haversine) distance to `coordinate` in miles
  double DistanceMiles(const Coordinate &coordinate) const {
    return AsS2LatLng().GetDistance(coordinate.AsS2LatLng()).radians() * kEarthRadiusMiles;
  }

  // returns initial bearing in direction of `coordinate` in degrees, range (-180, 180]
  double BearingTo(const Coordinate &coordinate) const {
    // atan2 may yield -180 for a due south heading
    return NormalizeSignedAngle(S2Earth::InitialBearing(AsS2LatLng(), coordinate.AsS2LatLng()).degrees());
  }
};

} // namespace wayfinder
