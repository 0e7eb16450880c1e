#define _USE_MATH_DEFINES
#include "SolarEphemeris.h"

#include <cmath>
#include <libnova/libnova.h>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

double radians(double degrees) { return degrees * M_PI / 180.0; }

} // namespace

SolarPosition SolarEphemeris::sunPosition(double julian_date) {
    struct ln_equ_posn equ;
    ln_get_solar_equ_coords(julian_date, &equ);

    SolarPosition position;
    position.right_ascension_rad = radians(equ.ra);
    position.declination_rad = radians(equ.dec);
    return position;
}

Vector3 SolarEphemeris::sunDirection(double julian_date) {
    SolarPosition sun = sunPosition(julian_date);
    double cos_dec = std::cos(sun.declination_rad);
    return Vector3(cos_dec * std::cos(sun.right_ascension_rad),
                   cos_dec * std::sin(sun.right_ascension_rad),
                   std::sin(sun.declination_rad));
}

double SolarEphemeris::altitudeDeg(const GroundObserver& observer, const MissionTimePoint& time) {
    double jd = toJulianDate(time);

    struct ln_equ_posn equ;
    ln_get_solar_equ_coords(jd, &equ);

    // libnova longitudes are east positive, same as the sub-point
    struct ln_lnlat_posn position;
    position.lng = observer.longitude_deg;
    position.lat = observer.latitude_deg;

    struct ln_hrz_posn hrz;
    ln_get_hrz_from_equ(&equ, &position, jd, &hrz);

    double altitude = hrz.alt;
    if (observer.pressure_mbar > 0.0) {
        altitude += refractionDeg(altitude, observer.pressure_mbar, observer.temperature_c);
    }
    return altitude;
}

double SolarEphemeris::refractionDeg(double altitude_deg, double pressure_mbar, double temperature_c) {
    // Formula diverges well below the horizon
    if (altitude_deg < -1.9) {
        return 0.0;
    }
    return ln_get_refraction_adj(altitude_deg, pressure_mbar, temperature_c);
}
