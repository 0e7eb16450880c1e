#ifndef SENSE_HAT_H
#define SENSE_HAT_H

#include <chrono>
#include <string>
#include "IioDevice.h"
#include "OrientationEstimator.h"
#include "SensorSuite.h"

/**
 * Raspberry Pi Sense HAT read through the kernel IIO drivers:
 * HTS221 (humidity, temperature), LPS25H (pressure) and LSM9DS1
 * (accelerometer, gyroscope, magnetometer).
 */
class SenseHat : public SensorSuite {
private:
    IioDevice humidity_sensor;
    IioDevice pressure_sensor;
    IioDevice accel_sensor;
    IioDevice gyro_sensor;
    IioDevice magn_sensor;

    OrientationEstimator estimator;
    std::chrono::steady_clock::time_point last_fusion;

    static constexpr double STANDARD_GRAVITY = 9.80665;  // m/s2 per g
    static constexpr double GAUSS_TO_MICROTESLA = 100.0;
    static constexpr double KPA_TO_MBAR = 10.0;
    static constexpr double MILLI = 1.0e-3;
    // Re-run the filter only when the last update is older than this
    static constexpr std::chrono::milliseconds FUSION_REFRESH{50};

    void updateFusion();

public:
    // Throws SensorUnavailableError when any of the five devices is missing
    explicit SenseHat(const std::string& iio_root = "/sys/bus/iio/devices");

    double readTemperature() override;
    double readHumidity() override;
    double readPressure() override;

    EulerAngles readOrientationRadians() override;
    EulerAngles readOrientationDegrees() override;
    EulerAngles readOrientation() override;
    Vector3 readCompassRaw() override;
    EulerAngles readGyroscope() override;
    Vector3 readGyroscopeRaw() override;
    EulerAngles readAccelerometer() override;
    Vector3 readAccelerometerRaw() override;
};

#endif // SENSE_HAT_H
