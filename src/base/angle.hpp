#pragma once

#include <cmath>

namespace wayfinder {

// maps any angle to [0, 360)
inline double NormalizeAngle(double angle) {
  angle = std::fmod(angle, 360.0);
  if (angle < 0.0) {
    angle += 360.0;
  }
  return angle;
}

// maps any angle to (-180, 180]
inline double NormalizeSignedAngle(double angle) {
  angle = NormalizeAngle(angle);
  if (angle > 180.0) {
    angle -= 360.0;
  }
  return angle;
}

// signed change of heading when turning from `from_bearing` to `to_bearing`,
// positive is clockwise (to the right)
inline double TurnAngle(double from_bearing, double to_bearing) {
  return NormalizeSignedAngle(to_bearing - from_bearing);
}

// bearing of the way back, i.e. bearing(b, a) for bearing(a, b) on a plane
inline double ReciprocalBearing(double bearing) {
  return NormalizeSignedAngle(bearing + 180.0);
}

} // namespace wayfinder
