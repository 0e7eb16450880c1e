#include "DaylightClassifier.h"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace {

double parseDegrees(const std::string& text, const char* what) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("unparsable ") + what + " '" + text + "'");
    }
    while (used < text.size() && std::isspace(static_cast<unsigned char>(text[used]))) {
        ++used;
    }
    if (used != text.size() || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("unparsable ") + what + " '" + text + "'");
    }
    return value;
}

} // namespace

GroundObserver DaylightClassifier::observerAt(double latitude_deg, double longitude_deg) {
    GroundObserver observer;
    observer.latitude_deg = latitude_deg;
    observer.longitude_deg = longitude_deg;
    observer.pressure_mbar = 0.0;
    observer.horizon_deg = HORIZON_DEPRESSION_DEG;
    return observer;
}

double DaylightClassifier::sunAltitudeDeg(double latitude_deg, double longitude_deg, const MissionTimePoint& time) {
    if (!std::isfinite(latitude_deg) || !std::isfinite(longitude_deg) ||
        latitude_deg < -90.0 || latitude_deg > 90.0) {
        throw std::invalid_argument("sub-point outside the valid coordinate range");
    }
    return SolarEphemeris::altitudeDeg(observerAt(latitude_deg, longitude_deg), time);
}

bool DaylightClassifier::isDay(double latitude_deg, double longitude_deg, const MissionTimePoint& time) {
    return isDaylightAltitude(sunAltitudeDeg(latitude_deg, longitude_deg, time));
}

bool DaylightClassifier::isDay(const std::string& latitude_deg, const std::string& longitude_deg, const MissionTimePoint& time) {
    return isDay(parseDegrees(latitude_deg, "latitude"), parseDegrees(longitude_deg, "longitude"), time);
}
