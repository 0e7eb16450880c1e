#include "QuicklookSeries.h"
#include "CapturePolicy.h"
#include "TelemetryCsv.h"

#include <chrono>
#include <stdexcept>

void QuicklookSeries::clear() {
    *this = QuicklookSeries();
}

void QuicklookSeries::addRecord(const TelemetryRecord& record) {
    ++rows;
    last_photo_number = record.photo_number;
    if (record.is_day) {
        ++day_photos;
        day_longitude.push_back(static_cast<float>(record.longitude_deg));
        day_latitude.push_back(static_cast<float>(record.latitude_deg));
    } else {
        ++night_photos;
        night_longitude.push_back(static_cast<float>(record.longitude_deg));
        night_latitude.push_back(static_cast<float>(record.latitude_deg));
    }
    estimated_volume_kb = CapturePolicy::photoVolumeKb(day_photos, night_photos);

    if (!record.sensors) {
        ++sensor_dropouts;
        return;
    }
    const SensorSample& s = *record.sensors;
    sensor_minutes.push_back(static_cast<float>(elapsed_minutes));
    temperature.push_back(static_cast<float>(s.environment.temperature));
    humidity.push_back(static_cast<float>(s.environment.humidity));
    pressure.push_back(static_cast<float>(s.environment.pressure));
    roll_deg.push_back(static_cast<float>(s.orientation.roll));
    pitch_deg.push_back(static_cast<float>(s.orientation.pitch));
    yaw_deg.push_back(static_cast<float>(s.orientation.yaw));
    accel_magnitude.push_back(static_cast<float>(s.accel_raw.magnitude()));
    gyro_magnitude.push_back(static_cast<float>(s.gyro_raw.magnitude()));
    compass_magnitude.push_back(static_cast<float>(s.compass_raw.magnitude()));
}

QuicklookSeries QuicklookSeries::fromRows(const std::vector<std::vector<std::string>>& rows) {
    QuicklookSeries series;
    bool started = false;
    MissionTimePoint first;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i == 0 && !rows[i].empty() && rows[i][0] == "Date/time") {
            continue;
        }
        TelemetryRecord record;
        try {
            record = TelemetryRecord::fromFields(rows[i]);
        } catch (const std::invalid_argument&) {
            ++series.malformed_rows;
            continue;
        }
        if (!started) {
            started = true;
            first = record.timestamp;
        }
        series.elapsed_minutes = std::chrono::duration<double, std::ratio<60>>(record.timestamp - first).count();
        series.addRecord(record);
    }
    return series;
}

QuicklookSeries QuicklookSeries::fromFile(const std::string& csv_path) {
    return fromRows(TelemetryCsv::readAll(csv_path));
}
