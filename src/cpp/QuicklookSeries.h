#ifndef QUICKLOOK_SERIES_H
#define QUICKLOOK_SERIES_H

#include <string>
#include <vector>
#include "TelemetryRecord.h"

/**
 * Plot-ready columns extracted from a telemetry CSV.
 * Rows without a sensor block are skipped in the sensor series and
 * counted as dropouts.
 */
struct QuicklookSeries {
    // Sensor series, x axis is minutes since the first row
    std::vector<float> sensor_minutes;
    std::vector<float> temperature;
    std::vector<float> humidity;
    std::vector<float> pressure;
    std::vector<float> roll_deg;
    std::vector<float> pitch_deg;
    std::vector<float> yaw_deg;
    std::vector<float> accel_magnitude;
    std::vector<float> gyro_magnitude;
    std::vector<float> compass_magnitude;

    // Ground track split by illumination
    std::vector<float> day_longitude;
    std::vector<float> day_latitude;
    std::vector<float> night_longitude;
    std::vector<float> night_latitude;

    int rows = 0;
    int malformed_rows = 0;
    int sensor_dropouts = 0;
    int day_photos = 0;
    int night_photos = 0;
    int last_photo_number = -1;
    double elapsed_minutes = 0.0;
    long long estimated_volume_kb = 0;

    void clear();
    void addRecord(const TelemetryRecord& record);

    // Header row is skipped; malformed rows are counted and skipped
    static QuicklookSeries fromRows(const std::vector<std::vector<std::string>>& rows);
    // Throws StorageError when the file cannot be read
    static QuicklookSeries fromFile(const std::string& csv_path);
};

#endif // QUICKLOOK_SERIES_H
