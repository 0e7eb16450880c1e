#ifndef SOLAR_EPHEMERIS_H
#define SOLAR_EPHEMERIS_H

#include "MissionTime.h"
#include "Vector3.h"

// Point on the ground the sun is observed from
struct GroundObserver {
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double pressure_mbar = 0.0;     // 0 disables refraction
    double temperature_c = 15.0;
    double horizon_deg = 0.0;       // depression used for rise/set, not for altitude
};

struct SolarPosition {
    double right_ascension_rad = 0.0;
    double declination_rad = 0.0;
};

/**
 * Apparent solar position from libnova (VSOP87 with nutation and
 * aberration), reduced to altitude for an observer on the ground.
 */
class SolarEphemeris {
public:
    static SolarPosition sunPosition(double julian_date);
    // Unit vector toward the sun in the true-equator frame
    static Vector3 sunDirection(double julian_date);

    // Apparent altitude of the sun's centre above the observer's geometric horizon
    static double altitudeDeg(const GroundObserver& observer, const MissionTimePoint& time);

    // Atmospheric refraction in degrees (libnova), scaled for pressure and temperature
    static double refractionDeg(double altitude_deg, double pressure_mbar, double temperature_c);
};

#endif // SOLAR_EPHEMERIS_H
