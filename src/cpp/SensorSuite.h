#ifndef SENSOR_SUITE_H
#define SENSOR_SUITE_H

#include "Quaternion.h"
#include "Vector3.h"

/**
 * Environmental and inertial sensor board. Every read may throw
 * SensorReadError; orientation readings are roll/pitch/yaw.
 */
class SensorSuite {
public:
    virtual ~SensorSuite() = default;

    virtual double readTemperature() = 0;          // deg C
    virtual double readHumidity() = 0;             // % relative
    virtual double readPressure() = 0;             // mbar

    virtual EulerAngles readOrientationRadians() = 0;
    virtual EulerAngles readOrientationDegrees() = 0;  // each in [0, 360)
    virtual EulerAngles readOrientation() = 0;         // fused, degrees
    virtual Vector3 readCompassRaw() = 0;              // uT
    virtual EulerAngles readGyroscope() = 0;           // gyro-only attitude, degrees
    virtual Vector3 readGyroscopeRaw() = 0;            // rad/s
    virtual EulerAngles readAccelerometer() = 0;       // accel-only attitude, degrees
    virtual Vector3 readAccelerometerRaw() = 0;        // g
};

#endif // SENSOR_SUITE_H
