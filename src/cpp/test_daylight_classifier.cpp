#define _USE_MATH_DEFINES
#include <iostream>
#include <stdexcept>
#include "DaylightClassifier.h"
#include "SolarEphemeris.h"
#include "test_support.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

TEST(solstice_declination) {
    SolarPosition sun = SolarEphemeris::sunPosition(toJulianDate(fromUtc(2020, 6, 21, 12, 0, 0.0)));
    ASSERT_NEAR(sun.declination_rad * 180.0 / M_PI, 23.44, 0.02);
    Vector3 direction = SolarEphemeris::sunDirection(toJulianDate(fromUtc(2020, 6, 21, 12, 0, 0.0)));
    ASSERT_NEAR(direction.magnitude(), 1.0, 1e-12);
}

TEST(noon_over_gulf_of_guinea_is_day) {
    MissionTimePoint noon = fromUtc(2020, 6, 21, 12, 0, 0.0);
    double altitude = DaylightClassifier::sunAltitudeDeg(0.0, 0.0, noon);
    std::cout << "altitude " << altitude << " ";
    ASSERT_NEAR(altitude, 66.56, 0.1);
    ASSERT(DaylightClassifier::isDay(0.0, 0.0, noon));
}

TEST(midnight_is_night) {
    MissionTimePoint midnight = fromUtc(2020, 6, 21, 0, 0, 0.0);
    ASSERT_NEAR(DaylightClassifier::sunAltitudeDeg(0.0, 0.0, midnight), -66.56, 0.1);
    ASSERT(!DaylightClassifier::isDay(0.0, 0.0, midnight));
}

TEST(southern_summer_over_sydney) {
    MissionTimePoint time = fromUtc(2020, 12, 21, 2, 0, 0.0);
    ASSERT(DaylightClassifier::isDay("-33.9", "151.2", time));
    ASSERT(!DaylightClassifier::isDay("33.9", "-28.8", time));
}

TEST(east_longitude_is_positive) {
    // 06:00 UTC is local noon at 90E and local midnight at 90W
    MissionTimePoint time = fromUtc(2020, 6, 21, 6, 0, 0.0);
    ASSERT_NEAR(DaylightClassifier::sunAltitudeDeg(0.0, 90.0, time), 66.56, 0.2);
    ASSERT_NEAR(DaylightClassifier::sunAltitudeDeg(0.0, -90.0, time), -66.56, 0.2);
}

TEST(horizon_itself_is_night) {
    ASSERT(!DaylightClassifier::isDaylightAltitude(0.0));
    ASSERT(DaylightClassifier::isDaylightAltitude(1e-9));
    ASSERT(!DaylightClassifier::isDaylightAltitude(-0.2));
}

TEST(terminator_band_sits_below_horizon) {
    ASSERT(DaylightClassifier::isInTerminatorBand(0.0));
    ASSERT(DaylightClassifier::isInTerminatorBand(-0.2));
    ASSERT(!DaylightClassifier::isInTerminatorBand(-0.34));
    ASSERT(!DaylightClassifier::isInTerminatorBand(0.1));
}

TEST(airless_observer_ignores_refraction) {
    GroundObserver observer = DaylightClassifier::observerAt(10.0, 20.0);
    ASSERT_NEAR(observer.pressure_mbar, 0.0, 0.0);
    ASSERT_NEAR(observer.horizon_deg, -0.34, 1e-12);

    MissionTimePoint time = fromUtc(2020, 3, 20, 6, 0, 0.0);
    GroundObserver with_air = observer;
    with_air.pressure_mbar = 1010.0;
    double lift = SolarEphemeris::altitudeDeg(with_air, time) - SolarEphemeris::altitudeDeg(observer, time);
    ASSERT(lift > 0.0);
    double at_horizon = SolarEphemeris::refractionDeg(0.0, 1010.0, 10.0);
    ASSERT(at_horizon > 0.4 && at_horizon < 0.65);
    ASSERT(SolarEphemeris::refractionDeg(45.0, 1010.0, 10.0) < 0.05);
    ASSERT_NEAR(SolarEphemeris::refractionDeg(-5.0, 1010.0, 10.0), 0.0, 0.0);
}

TEST(unparsable_coordinates_throw) {
    MissionTimePoint time = fromUtc(2020, 6, 21, 12, 0, 0.0);
    ASSERT_THROWS(DaylightClassifier::isDay("51:30:00", "0", time), std::invalid_argument);
    ASSERT_THROWS(DaylightClassifier::isDay("", "0", time), std::invalid_argument);
    ASSERT_THROWS(DaylightClassifier::isDay(95.0, 0.0, time), std::invalid_argument);
}

int main() {
    std::cout << "=== Daylight Classifier Tests ===" << std::endl;
    RUN_TEST(solstice_declination);
    RUN_TEST(noon_over_gulf_of_guinea_is_day);
    RUN_TEST(midnight_is_night);
    RUN_TEST(southern_summer_over_sydney);
    RUN_TEST(east_longitude_is_positive);
    RUN_TEST(horizon_itself_is_night);
    RUN_TEST(terminator_band_sits_below_horizon);
    RUN_TEST(airless_observer_ignores_refraction);
    RUN_TEST(unparsable_coordinates_throw);
    return reportResults();
}
