#define _USE_MATH_DEFINES
#include "OrbitPropagator.h"
#include "MissionErrors.h"

#include <chrono>
#include <cmath>
#include <sstream>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

constexpr double TWO_PI = 2.0 * M_PI;
constexpr double DEG_TO_RAD = M_PI / 180.0;
constexpr double X2O3 = 2.0 / 3.0;
constexpr double MINUTES_PER_DAY = 1440.0;

constexpr double WGS84_A = 6378.137;
constexpr double WGS84_F = 1.0 / 298.257223563;
constexpr double WGS84_E2 = WGS84_F * (2.0 - WGS84_F);

} // namespace

OrbitPropagator::OrbitPropagator(const TwoLineElements& elements) : elements(elements) {
    initialize();
}

void OrbitPropagator::initialize() {
    ecco = elements.eccentricity;
    inclo = elements.inclination_deg * DEG_TO_RAD;
    nodeo = elements.raan_deg * DEG_TO_RAD;
    argpo = elements.arg_perigee_deg * DEG_TO_RAD;
    mo = elements.mean_anomaly_deg * DEG_TO_RAD;
    bstar = elements.bstar;
    double no_kozai = elements.mean_motion_rev_per_day * TWO_PI / MINUTES_PER_DAY;

    if (ecco < 0.0 || ecco >= 1.0) {
        throw PropagationError("eccentricity out of range at epoch");
    }

    const double j3oj2 = J3 / J2;
    const double ss = 78.0 / EARTH_RADIUS_KM + 1.0;
    const double qzms2t = std::pow((120.0 - 78.0) / EARTH_RADIUS_KM, 4);

    // Un-Kozai the mean motion
    double eccsq = ecco * ecco;
    double omeosq = 1.0 - eccsq;
    double rteosq = std::sqrt(omeosq);
    double cosio = std::cos(inclo);
    double cosio2 = cosio * cosio;
    double ak = std::pow(XKE / no_kozai, X2O3);
    double d1 = 0.75 * J2 * (3.0 * cosio2 - 1.0) / (rteosq * omeosq);
    double del = d1 / (ak * ak);
    double adel = ak * (1.0 - del * del - del * (1.0 / 3.0 + 134.0 * del * del / 81.0));
    del = d1 / (adel * adel);
    no_unkozai = no_kozai / (1.0 + del);

    if (TWO_PI / no_unkozai >= DEEP_SPACE_PERIOD_MIN) {
        std::ostringstream msg;
        msg << "period of " << TWO_PI / no_unkozai << " min needs deep-space propagation";
        throw PropagationError(msg.str());
    }

    ao = std::pow(XKE / no_unkozai, X2O3);
    double sinio = std::sin(inclo);
    double po = ao * omeosq;
    double con42 = 1.0 - 5.0 * cosio2;
    con41 = -con42 - cosio2 - cosio2;
    double posq = po * po;
    double rp = ao * (1.0 - ecco);

    simplified_drag = rp < (220.0 / EARTH_RADIUS_KM + 1.0);

    // Atmospheric model altitude adjustments for low perigee
    double sfour = ss;
    double qzms24 = qzms2t;
    double perige = (rp - 1.0) * EARTH_RADIUS_KM;
    if (perige < 156.0) {
        sfour = perige - 78.0;
        if (perige < 98.0) {
            sfour = 20.0;
        }
        qzms24 = std::pow((120.0 - sfour) / EARTH_RADIUS_KM, 4);
        sfour = sfour / EARTH_RADIUS_KM + 1.0;
    }

    double pinvsq = 1.0 / posq;
    double tsi = 1.0 / (ao - sfour);
    eta = ao * ecco * tsi;
    double etasq = eta * eta;
    double eeta = ecco * eta;
    double psisq = std::fabs(1.0 - etasq);
    double coef = qzms24 * std::pow(tsi, 4);
    double coef1 = coef / std::pow(psisq, 3.5);
    double cc2 = coef1 * no_unkozai * (ao * (1.0 + 1.5 * etasq + eeta * (4.0 + etasq)) +
                 0.375 * J2 * tsi / psisq * con41 * (8.0 + 3.0 * etasq * (8.0 + etasq)));
    cc1 = bstar * cc2;
    double cc3 = 0.0;
    if (ecco > 1.0e-4) {
        cc3 = -2.0 * coef * tsi * j3oj2 * no_unkozai * sinio / ecco;
    }
    x1mth2 = 1.0 - cosio2;
    cc4 = 2.0 * no_unkozai * coef1 * ao * omeosq *
          (eta * (2.0 + 0.5 * etasq) + ecco * (0.5 + 2.0 * etasq) -
           J2 * tsi / (ao * psisq) *
           (-3.0 * con41 * (1.0 - 2.0 * eeta + etasq * (1.5 - 0.5 * eeta)) +
            0.75 * x1mth2 * (2.0 * etasq - eeta * (1.0 + etasq)) * std::cos(2.0 * argpo)));
    cc5 = 2.0 * coef1 * ao * omeosq * (1.0 + 2.75 * (etasq + eeta) + eeta * etasq);

    double cosio4 = cosio2 * cosio2;
    double temp1 = 1.5 * J2 * pinvsq * no_unkozai;
    double temp2 = 0.5 * temp1 * J2 * pinvsq;
    double temp3 = -0.46875 * J4 * pinvsq * pinvsq * no_unkozai;
    mdot = no_unkozai + 0.5 * temp1 * rteosq * con41 +
           0.0625 * temp2 * rteosq * (13.0 - 78.0 * cosio2 + 137.0 * cosio4);
    argpdot = -0.5 * temp1 * con42 + 0.0625 * temp2 * (7.0 - 114.0 * cosio2 + 395.0 * cosio4) +
              temp3 * (3.0 - 36.0 * cosio2 + 49.0 * cosio4);
    double xhdot1 = -temp1 * cosio;
    nodedot = xhdot1 + (0.5 * temp2 * (4.0 - 19.0 * cosio2) + 2.0 * temp3 * (3.0 - 7.0 * cosio2)) * cosio;

    omgcof = bstar * cc3 * std::cos(argpo);
    xmcof = 0.0;
    if (ecco > 1.0e-4) {
        xmcof = -X2O3 * coef * bstar / eeta;
    }
    nodecf = 3.5 * omeosq * xhdot1 * cc1;
    t2cof = 1.5 * cc1;
    // Avoid division by zero at 180 deg inclination
    if (std::fabs(cosio + 1.0) > 1.5e-12) {
        xlcof = -0.25 * j3oj2 * sinio * (3.0 + 5.0 * cosio) / (1.0 + cosio);
    } else {
        xlcof = -0.25 * j3oj2 * sinio * (3.0 + 5.0 * cosio) / 1.5e-12;
    }
    aycof = -0.5 * j3oj2 * sinio;
    delmo = std::pow(1.0 + eta * std::cos(mo), 3);
    sinmao = std::sin(mo);
    x7thm1 = 7.0 * cosio2 - 1.0;

    d2 = d3 = d4 = 0.0;
    t3cof = t4cof = t5cof = 0.0;
    if (!simplified_drag) {
        double cc1sq = cc1 * cc1;
        d2 = 4.0 * ao * tsi * cc1sq;
        double temp = d2 * tsi * cc1 / 3.0;
        d3 = (17.0 * ao + sfour) * temp;
        d4 = 0.5 * temp * ao * tsi * (221.0 * ao + 31.0 * sfour) * cc1;
        t3cof = d2 + 2.0 * cc1sq;
        t4cof = 0.25 * (3.0 * d3 + cc1 * (12.0 * d2 + 10.0 * cc1sq));
        t5cof = 0.2 * (3.0 * d4 + 12.0 * cc1 * d3 + 6.0 * d2 * d2 + 15.0 * cc1sq * (2.0 * d2 + cc1sq));
    }
}

void OrbitPropagator::propagate(double t, Vector3& position_km, Vector3& velocity_km_s) const {
    const double vkmpersec = EARTH_RADIUS_KM * XKE / 60.0;

    // Secular gravity and atmospheric drag
    double xmdf = mo + mdot * t;
    double argpdf = argpo + argpdot * t;
    double nodedf = nodeo + nodedot * t;
    double argpm = argpdf;
    double mm = xmdf;
    double t2 = t * t;
    double nodem = nodedf + nodecf * t2;
    double tempa = 1.0 - cc1 * t;
    double tempe = bstar * cc4 * t;
    double templ = t2cof * t2;

    if (!simplified_drag) {
        double delomg = omgcof * t;
        double delmtemp = 1.0 + eta * std::cos(xmdf);
        double delm = xmcof * (delmtemp * delmtemp * delmtemp - delmo);
        double temp = delomg + delm;
        mm = xmdf + temp;
        argpm = argpdf - temp;
        double t3 = t2 * t;
        double t4 = t3 * t;
        tempa = tempa - d2 * t2 - d3 * t3 - d4 * t4;
        tempe = tempe + bstar * cc5 * (std::sin(mm) - sinmao);
        templ = templ + t3cof * t3 + t4 * (t4cof + t * t5cof);
    }

    double nm = no_unkozai;
    double em = ecco;
    double inclm = inclo;
    if (nm <= 0.0) {
        throw PropagationError("mean motion went non-positive");
    }
    double am = std::pow(XKE / nm, X2O3) * tempa * tempa;
    nm = XKE / std::pow(am, 1.5);
    em = em - tempe;

    if (em >= 1.0 || em < -0.001) {
        std::ostringstream msg;
        msg << "mean eccentricity " << em << " out of range at " << t << " min";
        throw PropagationError(msg.str());
    }
    if (em < 1.0e-6) {
        em = 1.0e-6;
    }
    mm = mm + no_unkozai * templ;
    double xlm = mm + argpm + nodem;

    nodem = std::fmod(nodem, TWO_PI);
    argpm = std::fmod(argpm, TWO_PI);
    xlm = std::fmod(xlm, TWO_PI);
    mm = std::fmod(xlm - argpm - nodem, TWO_PI);

    double sinim = std::sin(inclm);
    double cosim = std::cos(inclm);

    // Long period periodics
    double ep = em;
    double axnl = ep * std::cos(argpm);
    double temp = 1.0 / (am * (1.0 - ep * ep));
    double aynl = ep * std::sin(argpm) + temp * aycof;
    double xl = mm + argpm + nodem + temp * xlcof * axnl;

    // Kepler's equation
    double u = std::fmod(xl - nodem, TWO_PI);
    double eo1 = u;
    double tem5 = 9999.9;
    double sineo1 = 0.0, coseo1 = 0.0;
    int ktr = 1;
    while (std::fabs(tem5) >= 1.0e-12 && ktr <= 10) {
        sineo1 = std::sin(eo1);
        coseo1 = std::cos(eo1);
        tem5 = 1.0 - coseo1 * axnl - sineo1 * aynl;
        tem5 = (u - aynl * coseo1 + axnl * sineo1 - eo1) / tem5;
        if (std::fabs(tem5) >= 0.95) {
            tem5 = tem5 > 0.0 ? 0.95 : -0.95;
        }
        eo1 = eo1 + tem5;
        ++ktr;
    }

    // Short period preliminary quantities
    double ecose = axnl * coseo1 + aynl * sineo1;
    double esine = axnl * sineo1 - aynl * coseo1;
    double el2 = axnl * axnl + aynl * aynl;
    double pl = am * (1.0 - el2);
    if (pl < 0.0) {
        throw PropagationError("semi-latus rectum went negative");
    }

    double rl = am * (1.0 - ecose);
    double rdotl = std::sqrt(am) * esine / rl;
    double rvdotl = std::sqrt(pl) / rl;
    double betal = std::sqrt(1.0 - el2);
    temp = esine / (1.0 + betal);
    double sinu = am / rl * (sineo1 - aynl - axnl * temp);
    double cosu = am / rl * (coseo1 - axnl + aynl * temp);
    double su = std::atan2(sinu, cosu);
    double sin2u = (cosu + cosu) * sinu;
    double cos2u = 1.0 - 2.0 * sinu * sinu;
    temp = 1.0 / pl;
    double temp1 = 0.5 * J2 * temp;
    double temp2 = temp1 * temp;

    // Short period periodics
    double mrt = rl * (1.0 - 1.5 * temp2 * betal * con41) + 0.5 * temp1 * x1mth2 * cos2u;
    su = su - 0.25 * temp2 * x7thm1 * sin2u;
    double xnode = nodem + 1.5 * temp2 * cosim * sin2u;
    double xinc = inclm + 1.5 * temp2 * cosim * sinim * cos2u;
    double mvt = rdotl - nm * temp1 * x1mth2 * sin2u / XKE;
    double rvdot = rvdotl + nm * temp1 * (x1mth2 * cos2u + 1.5 * con41) / XKE;

    // Orientation vectors
    double sinsu = std::sin(su), cossu = std::cos(su);
    double snod = std::sin(xnode), cnod = std::cos(xnode);
    double sini = std::sin(xinc), cosi = std::cos(xinc);
    double xmx = -snod * cosi;
    double xmy = cnod * cosi;
    Vector3 uvec(xmx * sinsu + cnod * cossu, xmy * sinsu + snod * cossu, sini * sinsu);
    Vector3 vvec(xmx * cossu - cnod * sinsu, xmy * cossu - snod * sinsu, sini * cossu);

    if (mrt < 1.0) {
        std::ostringstream msg;
        msg << "satellite decayed at " << t << " min";
        throw PropagationError(msg.str());
    }

    position_km = uvec * (mrt * EARTH_RADIUS_KM);
    velocity_km_s = (uvec * mvt + vvec * rvdot) * vkmpersec;
}

Vector3 OrbitPropagator::temePositionAt(const MissionTimePoint& time) const {
    double tsince = std::chrono::duration<double, std::ratio<60>>(time - elements.epoch).count();
    Vector3 position, velocity;
    propagate(tsince, position, velocity);
    return position;
}

SubPoint OrbitPropagator::subPointAt(const MissionTimePoint& time) const {
    Vector3 teme = temePositionAt(time);
    Vector3 ecef = teme.rotatedAboutZ(greenwichMeanSiderealTime(toJulianDate(time)));
    return ecefToSubPoint(ecef);
}

double OrbitPropagator::getPeriodMinutes() const {
    return TWO_PI / no_unkozai;
}

// Bowring iteration on the WGS-84 ellipsoid
SubPoint OrbitPropagator::ecefToSubPoint(const Vector3& ecef_km) {
    double x = ecef_km.getX(), y = ecef_km.getY(), z = ecef_km.getZ();
    double lon = std::atan2(y, x);
    double p = std::sqrt(x * x + y * y);

    double lat = std::atan2(z, p * (1.0 - WGS84_E2));
    for (int i = 0; i < 10; ++i) {
        double sin_lat = std::sin(lat);
        double n = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sin_lat * sin_lat);
        lat = std::atan2(z + WGS84_E2 * n * sin_lat, p);
    }
    double sin_lat = std::sin(lat);
    double n = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sin_lat * sin_lat);

    SubPoint point;
    point.latitude_deg = lat / DEG_TO_RAD;
    point.longitude_deg = lon / DEG_TO_RAD;
    if (point.longitude_deg >= 180.0) {
        point.longitude_deg -= 360.0;
    }
    point.altitude_km = std::fabs(std::cos(lat)) > 1.0e-9 ? p / std::cos(lat) - n : std::fabs(z) - n * (1.0 - WGS84_E2);
    return point;
}
