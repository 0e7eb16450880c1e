#include "TelemetrySampler.h"

#include <exception>

TelemetrySampler::TelemetrySampler(SensorSuite& sensors, MissionLog& log)
    : sensors(sensors), log(log) {
}

SensorSample TelemetrySampler::readSensors() {
    SensorSample sample;
    sample.environment.temperature = sensors.readTemperature();
    sample.environment.humidity = sensors.readHumidity();
    sample.environment.pressure = sensors.readPressure();
    sample.orientation_rad = sensors.readOrientationRadians();
    sample.orientation_deg = sensors.readOrientationDegrees();
    sample.orientation = sensors.readOrientation();
    sample.compass_raw = sensors.readCompassRaw();
    sample.gyro_orientation = sensors.readGyroscope();
    sample.gyro_raw = sensors.readGyroscopeRaw();
    sample.accel_orientation = sensors.readAccelerometer();
    sample.accel_raw = sensors.readAccelerometerRaw();
    return sample;
}

TelemetryRecord TelemetrySampler::sample(const MissionTimePoint& timestamp, bool is_day,
                                         double longitude_deg, double latitude_deg, int photo_number) {
    TelemetryRecord record;
    record.timestamp = timestamp;
    record.is_day = is_day;
    record.longitude_deg = longitude_deg;
    record.latitude_deg = latitude_deg;
    record.photo_number = photo_number;

    try {
        record.sensors = readSensors();
    } catch (const std::exception& e) {
        ++failed_samples;
        record.sensors.reset();
        log.error(std::string("TelemetryError: ") + e.what() + ", sensor columns written as zero");
    }
    return record;
}
