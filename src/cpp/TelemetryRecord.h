#ifndef TELEMETRY_RECORD_H
#define TELEMETRY_RECORD_H

#include <optional>
#include <string>
#include <vector>
#include "MissionTime.h"
#include "Quaternion.h"
#include "Vector3.h"

struct EnvironmentReading {
    double temperature = 0.0;   // deg C
    double humidity = 0.0;      // %
    double pressure = 0.0;      // mbar
};

// Everything read from the sensor board for one row, in column order
struct SensorSample {
    EnvironmentReading environment;
    EulerAngles orientation_rad;
    EulerAngles orientation_deg;
    EulerAngles orientation;
    Vector3 compass_raw;
    EulerAngles gyro_orientation;
    Vector3 gyro_raw;
    EulerAngles accel_orientation;
    Vector3 accel_raw;
};

/**
 * One CSV row. A missing sensor block is written as 27 zero columns so
 * every row has the same shape.
 */
struct TelemetryRecord {
    static constexpr std::size_t LEADING_FIELDS = 5;
    static constexpr std::size_t SENSOR_FIELDS = 27;
    static constexpr std::size_t FIELD_COUNT = LEADING_FIELDS + SENSOR_FIELDS;

    MissionTimePoint timestamp;
    bool is_day = false;
    double longitude_deg = 0.0;
    double latitude_deg = 0.0;
    int photo_number = 0;
    std::optional<SensorSample> sensors;

    static std::vector<std::string> columnNames();
    std::vector<std::string> toFields() const;

    // Inverse of toFields; an all-zero sensor block reads back as absent.
    // Throws std::invalid_argument on a malformed row
    static TelemetryRecord fromFields(const std::vector<std::string>& fields);
};

// 27 readings in column order
std::vector<double> flattenSensorSample(const SensorSample& sample);

#endif // TELEMETRY_RECORD_H
