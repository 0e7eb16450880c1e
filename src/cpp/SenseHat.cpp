#include "SenseHat.h"

SenseHat::SenseHat(const std::string& iio_root)
    : humidity_sensor(IioDevice::find(iio_root, "hts221")),
      pressure_sensor(IioDevice::find(iio_root, "lps25h")),
      accel_sensor(IioDevice::find(iio_root, "lsm9ds1_accel")),
      gyro_sensor(IioDevice::find(iio_root, "lsm9ds1_gyro")),
      magn_sensor(IioDevice::find(iio_root, "lsm9ds1_magn")) {
}

double SenseHat::readTemperature() {
    return humidity_sensor.readChannel("temp") * MILLI;
}

double SenseHat::readHumidity() {
    return humidity_sensor.readChannel("humidityrelative") * MILLI;
}

double SenseHat::readPressure() {
    return pressure_sensor.readChannel("pressure") * KPA_TO_MBAR;
}

Vector3 SenseHat::readCompassRaw() {
    return magn_sensor.readAxes("magn") * GAUSS_TO_MICROTESLA;
}

Vector3 SenseHat::readGyroscopeRaw() {
    return gyro_sensor.readAxes("anglvel");
}

Vector3 SenseHat::readAccelerometerRaw() {
    return accel_sensor.readAxes("accel") / STANDARD_GRAVITY;
}

void SenseHat::updateFusion() {
    auto now = std::chrono::steady_clock::now();
    if (estimator.isInitialised() && now - last_fusion < FUSION_REFRESH) {
        return;
    }
    Vector3 accel = readAccelerometerRaw();
    Vector3 gyro = readGyroscopeRaw();
    Vector3 compass = readCompassRaw();
    double dt = estimator.isInitialised() ? std::chrono::duration<double>(now - last_fusion).count() : 0.0;
    estimator.update(accel, gyro, compass, dt);
    last_fusion = now;
}

EulerAngles SenseHat::readOrientationRadians() {
    updateFusion();
    return estimator.fusedRadians();
}

EulerAngles SenseHat::readOrientationDegrees() {
    updateFusion();
    return OrientationEstimator::toDegrees360(estimator.fusedRadians());
}

EulerAngles SenseHat::readOrientation() {
    return readOrientationDegrees();
}

EulerAngles SenseHat::readGyroscope() {
    updateFusion();
    return OrientationEstimator::toDegrees360(estimator.gyroRadians());
}

EulerAngles SenseHat::readAccelerometer() {
    updateFusion();
    return OrientationEstimator::toDegrees360(estimator.accelRadians());
}
