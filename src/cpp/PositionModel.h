#ifndef POSITION_MODEL_H
#define POSITION_MODEL_H

#include "MissionTime.h"

// Geodetic point directly below the spacecraft
struct SubPoint {
    double latitude_deg = 0.0;   // +north
    double longitude_deg = 0.0;  // +east, [-180, 180)
    double altitude_km = 0.0;    // above the WGS-84 ellipsoid
};

/**
 * Source of the spacecraft sub-point for a UTC instant.
 * Implementations throw PropagationError when no state can be produced.
 */
class PositionModel {
public:
    virtual ~PositionModel() = default;
    virtual SubPoint subPointAt(const MissionTimePoint& time) const = 0;
};

#endif // POSITION_MODEL_H
