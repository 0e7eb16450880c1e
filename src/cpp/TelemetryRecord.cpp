#include "TelemetryRecord.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string formatNumber(double value) {
    std::ostringstream out;
    out << std::setprecision(12) << value;
    return out.str();
}

double parseNumber(const std::string& text, const char* column) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("bad ") + column + " value '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(std::string("bad ") + column + " value '" + text + "'");
    }
    return value;
}

void appendTriple(std::vector<double>& values, double a, double b, double c) {
    values.push_back(a);
    values.push_back(b);
    values.push_back(c);
}

} // namespace

std::vector<double> flattenSensorSample(const SensorSample& s) {
    std::vector<double> values;
    values.reserve(TelemetryRecord::SENSOR_FIELDS);
    appendTriple(values, s.environment.temperature, s.environment.humidity, s.environment.pressure);
    appendTriple(values, s.orientation_rad.roll, s.orientation_rad.pitch, s.orientation_rad.yaw);
    appendTriple(values, s.orientation_deg.roll, s.orientation_deg.pitch, s.orientation_deg.yaw);
    appendTriple(values, s.orientation.roll, s.orientation.pitch, s.orientation.yaw);
    appendTriple(values, s.compass_raw.getX(), s.compass_raw.getY(), s.compass_raw.getZ());
    appendTriple(values, s.gyro_orientation.roll, s.gyro_orientation.pitch, s.gyro_orientation.yaw);
    appendTriple(values, s.gyro_raw.getX(), s.gyro_raw.getY(), s.gyro_raw.getZ());
    appendTriple(values, s.accel_orientation.roll, s.accel_orientation.pitch, s.accel_orientation.yaw);
    appendTriple(values, s.accel_raw.getX(), s.accel_raw.getY(), s.accel_raw.getZ());
    return values;
}

std::vector<std::string> TelemetryRecord::columnNames() {
    return {
        "Date/time", "Day or Night", "Longitude", "Latitude", "Photo Number",
        "Temperature", "Humidity", "Pressure",
        "Orientation Rad Roll", "Orientation Rad Pitch", "Orientation Rad Yaw",
        "Orientation Degrees Roll", "Orientation Degrees Pitch", "Orientation Degrees Yaw",
        "Orientation Roll", "Orientation Pitch", "Orientation Yaw",
        "Compass Raw X", "Compass Raw Y", "Compass Raw Z",
        "Gyro Only Roll", "Gyro Only Pitch", "Gyro Only Yaw",
        "Gyro Raw X", "Gyro Raw Y", "Gyro Raw Z",
        "Acceleration Only Roll", "Acceleration Only Pitch", "Acceleration Only Yaw",
        "Acceleration Raw X", "Acceleration Raw Y", "Acceleration Raw Z"
    };
}

std::vector<std::string> TelemetryRecord::toFields() const {
    std::vector<std::string> fields;
    fields.reserve(FIELD_COUNT);
    fields.push_back(formatCsvTimestamp(timestamp));
    fields.push_back(is_day ? "True" : "False");
    fields.push_back(formatNumber(longitude_deg));
    fields.push_back(formatNumber(latitude_deg));
    fields.push_back(std::to_string(photo_number));

    if (sensors) {
        for (double value : flattenSensorSample(*sensors)) {
            fields.push_back(formatNumber(value));
        }
    } else {
        fields.insert(fields.end(), SENSOR_FIELDS, "0");
    }
    return fields;
}

TelemetryRecord TelemetryRecord::fromFields(const std::vector<std::string>& fields) {
    if (fields.size() != FIELD_COUNT) {
        throw std::invalid_argument("expected 32 columns, got " + std::to_string(fields.size()));
    }
    TelemetryRecord record;
    if (!parseCsvTimestamp(fields[0], record.timestamp)) {
        throw std::invalid_argument("bad Date/time value '" + fields[0] + "'");
    }
    if (fields[1] != "True" && fields[1] != "False") {
        throw std::invalid_argument("bad Day or Night value '" + fields[1] + "'");
    }
    record.is_day = fields[1] == "True";
    record.longitude_deg = parseNumber(fields[2], "Longitude");
    record.latitude_deg = parseNumber(fields[3], "Latitude");
    record.photo_number = static_cast<int>(parseNumber(fields[4], "Photo Number"));

    std::vector<double> v;
    bool all_zero = true;
    for (std::size_t i = LEADING_FIELDS; i < FIELD_COUNT; ++i) {
        v.push_back(parseNumber(fields[i], "sensor"));
        all_zero = all_zero && v.back() == 0.0;
    }
    if (all_zero) {
        return record;
    }

    SensorSample s;
    s.environment = EnvironmentReading{v[0], v[1], v[2]};
    s.orientation_rad = EulerAngles{v[3], v[4], v[5]};
    s.orientation_deg = EulerAngles{v[6], v[7], v[8]};
    s.orientation = EulerAngles{v[9], v[10], v[11]};
    s.compass_raw = Vector3(v[12], v[13], v[14]);
    s.gyro_orientation = EulerAngles{v[15], v[16], v[17]};
    s.gyro_raw = Vector3(v[18], v[19], v[20]);
    s.accel_orientation = EulerAngles{v[21], v[22], v[23]};
    s.accel_raw = Vector3(v[24], v[25], v[26]);
    record.sensors = s;
    return record;
}
