#ifndef TWO_LINE_ELEMENTS_H
#define TWO_LINE_ELEMENTS_H

#include <string>
#include "MissionTime.h"

/**
 * NORAD two-line mean element set. Angles are stored in degrees and
 * mean motion in revolutions per day, exactly as printed on the lines.
 */
struct TwoLineElements {
    std::string name;
    std::string line1;
    std::string line2;

    int catalog_number = 0;
    MissionTimePoint epoch;
    double epoch_julian_date = 0.0;
    double mean_motion_dot = 0.0;      // rev/day^2 / 2
    double mean_motion_ddot = 0.0;     // rev/day^3 / 6
    double bstar = 0.0;                // 1/earth radii
    double inclination_deg = 0.0;
    double raan_deg = 0.0;
    double eccentricity = 0.0;
    double arg_perigee_deg = 0.0;
    double mean_anomaly_deg = 0.0;
    double mean_motion_rev_per_day = 0.0;
    int revolution_number = 0;
};

// Column-exact parse with checksum and line-number checks; throws TleFormatError
TwoLineElements parseTwoLineElements(const std::string& name, const std::string& line1, const std::string& line2);

// Mod-10 checksum over the first 68 columns, '-' counts as one
int tleChecksum(const std::string& line);

#endif // TWO_LINE_ELEMENTS_H
