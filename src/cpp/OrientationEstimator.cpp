#define _USE_MATH_DEFINES
#include "OrientationEstimator.h"

#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

double wrapDegrees360(double radians) {
    double degrees = std::fmod(radians * 180.0 / M_PI, 360.0);
    if (degrees < 0.0) {
        degrees += 360.0;
    }
    return degrees >= 360.0 ? 0.0 : degrees;
}

} // namespace

OrientationEstimator::OrientationEstimator(double measurement_weight)
    : measurement_weight(measurement_weight) {
}

void OrientationEstimator::reset() {
    fused = Quaternion();
    gyro_only = Quaternion();
    accel_only = EulerAngles();
    initialised = false;
}

EulerAngles OrientationEstimator::attitudeFromSensors(const Vector3& accel_g, const Vector3& compass_ut) {
    EulerAngles attitude;
    double ax = accel_g.getX(), ay = accel_g.getY(), az = accel_g.getZ();
    if (accel_g.magnitude() == 0.0) {
        return attitude;
    }
    attitude.roll = std::atan2(ay, az);
    attitude.pitch = std::atan2(-ax, std::sqrt(ay * ay + az * az));

    if (compass_ut.magnitude() > 0.0) {
        double cr = std::cos(attitude.roll), sr = std::sin(attitude.roll);
        double cp = std::cos(attitude.pitch), sp = std::sin(attitude.pitch);
        double mx = compass_ut.getX(), my = compass_ut.getY(), mz = compass_ut.getZ();
        // Rotate the field back into the horizontal plane
        double hx = mx * cp + my * sr * sp + mz * cr * sp;
        double hy = my * cr - mz * sr;
        attitude.yaw = std::atan2(-hy, hx);
    }
    return attitude;
}

void OrientationEstimator::update(const Vector3& accel_g, const Vector3& gyro_rad_s, const Vector3& compass_ut, double dt_s) {
    EulerAngles measured = attitudeFromSensors(accel_g, compass_ut);
    accel_only = attitudeFromSensors(accel_g, Vector3());
    Quaternion measured_q = Quaternion::fromEuler(measured);

    if (!initialised) {
        fused = measured_q;
        gyro_only = measured_q;
        initialised = true;
        return;
    }

    gyro_only = gyro_only.integrated(gyro_rad_s, dt_s);
    Quaternion predicted = fused.integrated(gyro_rad_s, dt_s);
    fused = predicted.blendedToward(measured_q, measurement_weight);
}

EulerAngles OrientationEstimator::toDegrees360(const EulerAngles& radians) {
    EulerAngles degrees;
    degrees.roll = wrapDegrees360(radians.roll);
    degrees.pitch = wrapDegrees360(radians.pitch);
    degrees.yaw = wrapDegrees360(radians.yaw);
    return degrees;
}
