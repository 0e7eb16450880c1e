#ifndef TELEMETRY_SAMPLER_H
#define TELEMETRY_SAMPLER_H

#include "MissionLog.h"
#include "SensorSuite.h"
#include "TelemetryRecord.h"

/**
 * Builds telemetry rows from the sensor board. Sampling never throws:
 * a failed read leaves the sensor block empty (written as zeros).
 */
class TelemetrySampler {
private:
    SensorSuite& sensors;
    MissionLog& log;
    int failed_samples = 0;

public:
    TelemetrySampler(SensorSuite& sensors, MissionLog& log);

    // All 27 readings in column order; throws on the first failed read
    SensorSample readSensors();

    TelemetryRecord sample(const MissionTimePoint& timestamp, bool is_day,
                           double longitude_deg, double latitude_deg, int photo_number);

    int getFailedSamples() const { return failed_samples; }
};

#endif // TELEMETRY_SAMPLER_H
