#ifndef ORIENTATION_H
#define ORIENTATION_H

#include <string>

#include "surface_properties.h"

enum class Orientation {
    North,
    NorthEast,
    East,
    SouthEast,
    South,
    SouthWest,
    West,
    NorthWest,
    Unknown
};

static const int NUM_ORIENTATIONS = 8;

// Compass bearing of the XY projection of a normal: 0 = +Y (North),
// increasing clockwise, in [0,360).
double compassBearing(const Vector3 &normal);

// 45 degree sectors centred on the eight compass points; lower bound
// inclusive, upper bound exclusive.
Orientation classifyOrientation(const Vector3 &normal);

const char* orientationName(Orientation o);
Orientation opposite(Orientation o);

#endif
