#ifndef ORBIT_PROPAGATOR_H
#define ORBIT_PROPAGATOR_H

#include "PositionModel.h"
#include "TwoLineElements.h"
#include "Vector3.h"

/**
 * OrbitPropagator - SGP4 near-earth propagation of a two-line element set
 *
 * Produces TEME position/velocity for minutes since the element epoch and
 * the geodetic sub-point (WGS-84) for a UTC instant. Orbits with a period
 * of 225 minutes or more need the deep-space terms and are rejected.
 */
class OrbitPropagator : public PositionModel {
private:
    TwoLineElements elements;

    // Mean elements at epoch, radians and radians/minute
    double ecco, inclo, nodeo, argpo, mo, bstar;
    double no_unkozai;

    // SGP4 secular and drag coefficients
    bool simplified_drag;
    double ao, con41, x1mth2, x7thm1;
    double cc1, cc4, cc5, d2, d3, d4;
    double delmo, eta, sinmao;
    double mdot, argpdot, nodedot, nodecf;
    double omgcof, xmcof, xlcof, aycof;
    double t2cof, t3cof, t4cof, t5cof;

    // WGS-72, the constants the element sets are fitted with
    static constexpr double EARTH_RADIUS_KM = 6378.135;
    static constexpr double XKE = 0.0743669161331734132;   // 60 / sqrt(Re^3 / mu)
    static constexpr double J2 = 0.001082616;
    static constexpr double J3 = -0.00000253881;
    static constexpr double J4 = -0.00000165597;
    static constexpr double DEEP_SPACE_PERIOD_MIN = 225.0;

    void initialize();

public:
    explicit OrbitPropagator(const TwoLineElements& elements);

    // TEME state at tsince minutes from epoch; km and km/s. Throws PropagationError
    void propagate(double tsince_minutes, Vector3& position_km, Vector3& velocity_km_s) const;
    Vector3 temePositionAt(const MissionTimePoint& time) const;

    SubPoint subPointAt(const MissionTimePoint& time) const override;

    const TwoLineElements& getElements() const { return elements; }
    double getPeriodMinutes() const;

    static SubPoint ecefToSubPoint(const Vector3& ecef_km);
};

#endif // ORBIT_PROPAGATOR_H
