#ifndef ORIENTATION_ESTIMATOR_H
#define ORIENTATION_ESTIMATOR_H

#include "Quaternion.h"
#include "Vector3.h"

/**
 * Complementary filter for a 9-DOF IMU.
 *
 * Keeps three attitude estimates side by side:
 * - fused: gyro propagation pulled toward the accelerometer/compass attitude
 * - gyro only: pure integration of body rates from the first sample
 * - accel only: tilt from gravity, no heading
 */
class OrientationEstimator {
private:
    Quaternion fused;
    Quaternion gyro_only;
    EulerAngles accel_only;
    double measurement_weight;
    bool initialised = false;

public:
    explicit OrientationEstimator(double measurement_weight = 0.02);

    void update(const Vector3& accel_g, const Vector3& gyro_rad_s, const Vector3& compass_ut, double dt_s);
    void reset();
    bool isInitialised() const { return initialised; }

    EulerAngles fusedRadians() const { return fused.toEuler(); }
    EulerAngles gyroRadians() const { return gyro_only.toEuler(); }
    EulerAngles accelRadians() const { return accel_only; }

    // Roll/pitch from gravity, yaw from the tilt-compensated compass (0 when no field)
    static EulerAngles attitudeFromSensors(const Vector3& accel_g, const Vector3& compass_ut);
    // Radians to degrees wrapped into [0, 360)
    static EulerAngles toDegrees360(const EulerAngles& radians);
};

#endif // ORIENTATION_ESTIMATOR_H
