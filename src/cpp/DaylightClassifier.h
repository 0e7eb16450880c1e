#ifndef DAYLIGHT_CLASSIFIER_H
#define DAYLIGHT_CLASSIFIER_H

#include <string>
#include "MissionTime.h"
#include "SolarEphemeris.h"

/**
 * Day/night decision for the ground point under the spacecraft.
 * Daylight means the sun's centre is strictly above the horizon.
 */
class DaylightClassifier {
public:
    static constexpr double HORIZON_DEPRESSION_DEG = -0.34;

    // Airless observer at the sub-point
    static GroundObserver observerAt(double latitude_deg, double longitude_deg);

    static double sunAltitudeDeg(double latitude_deg, double longitude_deg, const MissionTimePoint& time);

    static bool isDaylightAltitude(double altitude_deg) { return altitude_deg > 0.0; }
    // Below the geometric horizon but above the rise/set depression
    static bool isInTerminatorBand(double altitude_deg) {
        return altitude_deg <= 0.0 && altitude_deg > HORIZON_DEPRESSION_DEG;
    }

    static bool isDay(double latitude_deg, double longitude_deg, const MissionTimePoint& time);
    // Decimal-degree strings; throws std::invalid_argument when unparsable
    static bool isDay(const std::string& latitude_deg, const std::string& longitude_deg, const MissionTimePoint& time);
};

#endif // DAYLIGHT_CLASSIFIER_H
