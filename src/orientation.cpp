#define _USE_MATH_DEFINES

#include "orientation.h"

#include <cmath>

double compassBearing(const Vector3 &normal) {
    double angle = std::atan2(normal.x, normal.y) * 180.0 / M_PI;
    if (angle < 0.0) angle += 360.0;
    if (angle >= 360.0) angle -= 360.0;
    return angle;
}

Orientation classifyOrientation(const Vector3 &normal) {
    double angle = compassBearing(normal);
    if (angle >= 337.5 || angle < 22.5) return Orientation::North;
    if (angle < 67.5)  return Orientation::NorthEast;
    if (angle < 112.5) return Orientation::East;
    if (angle < 157.5) return Orientation::SouthEast;
    if (angle < 202.5) return Orientation::South;
    if (angle < 247.5) return Orientation::SouthWest;
    if (angle < 292.5) return Orientation::West;
    return Orientation::NorthWest;
}

const char* orientationName(Orientation o) {
    switch (o) {
        case Orientation::North:     return "North";
        case Orientation::NorthEast: return "Northeast";
        case Orientation::East:      return "East";
        case Orientation::SouthEast: return "Southeast";
        case Orientation::South:     return "South";
        case Orientation::SouthWest: return "Southwest";
        case Orientation::West:      return "West";
        case Orientation::NorthWest: return "Northwest";
        case Orientation::Unknown:   break;
    }
    return "Unknown";
}

Orientation opposite(Orientation o) {
    if (o == Orientation::Unknown) return o;
    return static_cast<Orientation>((static_cast<int>(o) + 4) % NUM_ORIENTATIONS);
}
