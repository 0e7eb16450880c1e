#include <fstream>
#include <iostream>
#include <stdexcept>
#include "MissionErrors.h"
#include "TelemetryCsv.h"
#include "test_support.h"

namespace {

SensorSample boardSample() {
    SensorSample s;
    s.environment = EnvironmentReading{27.5, 41.25, 1013.5};
    s.orientation_rad = EulerAngles{0.1, 0.2, 0.3};
    s.orientation_deg = EulerAngles{5.0, 10.0, 15.0};
    s.orientation = EulerAngles{5.0, 10.0, 15.0};
    s.compass_raw = Vector3(20.0, -5.0, 40.0);
    s.gyro_orientation = EulerAngles{6.0, 11.0, 16.0};
    s.gyro_raw = Vector3(0.01, 0.02, 0.03);
    s.accel_orientation = EulerAngles{4.0, 9.0, 0.0};
    s.accel_raw = Vector3(0.0, 0.0, 1.0);
    return s;
}

TelemetryRecord recordAt(int photo_number, bool with_sensors) {
    TelemetryRecord record;
    record.timestamp = fromUtc(2020, 6, 21, 12, 0, 0.0) + std::chrono::seconds(7 * photo_number);
    record.is_day = photo_number % 2 == 0;
    record.longitude_deg = -74.006;
    record.latitude_deg = 40.7128;
    record.photo_number = photo_number;
    if (with_sensors) {
        record.sensors = boardSample();
    }
    return record;
}

} // namespace

TEST(header_has_thirty_two_columns) {
    std::vector<std::string> names = TelemetryRecord::columnNames();
    ASSERT_EQ(names.size(), TelemetryRecord::FIELD_COUNT);
    ASSERT_EQ(names[0], std::string("Date/time"));
    ASSERT_EQ(names[2], std::string("Longitude"));
    ASSERT_EQ(names[3], std::string("Latitude"));
    ASSERT_EQ(names[31], std::string("Acceleration Raw Z"));
}

TEST(rows_follow_header) {
    ScratchDirectory scratch("csv_rows");
    TelemetryCsv csv(scratch.file("telemetry.csv"));
    csv.create();
    csv.append(recordAt(0, true));
    csv.append(recordAt(1, false));
    ASSERT_EQ(csv.getRowsWritten(), 2);

    std::vector<std::vector<std::string>> rows = TelemetryCsv::readAll(csv.path());
    ASSERT_EQ(rows.size(), 3u);
    ASSERT(rows[0] == TelemetryRecord::columnNames());
    ASSERT_EQ(rows[1].size(), TelemetryRecord::FIELD_COUNT);
    ASSERT_EQ(rows[1][1], std::string("True"));
    ASSERT_EQ(rows[1][2], std::string("-74.006"));
    ASSERT_EQ(rows[1][3], std::string("40.7128"));
    ASSERT_EQ(rows[1][5], std::string("27.5"));
    ASSERT_EQ(rows[2][1], std::string("False"));
    ASSERT_EQ(rows[2][4], std::string("1"));
    for (std::size_t i = TelemetryRecord::LEADING_FIELDS; i < TelemetryRecord::FIELD_COUNT; ++i) {
        ASSERT_EQ(rows[2][i], std::string("0"));
    }
}

TEST(lines_end_with_crlf) {
    ScratchDirectory scratch("csv_crlf");
    TelemetryCsv csv(scratch.file("telemetry.csv"));
    csv.create();
    std::ifstream file(csv.path(), std::ios::binary);
    std::string header;
    std::getline(file, header);
    ASSERT(!header.empty());
    ASSERT_EQ(header.back(), '\r');
}

TEST(create_truncates_previous_run) {
    ScratchDirectory scratch("csv_truncate");
    TelemetryCsv first(scratch.file("telemetry.csv"));
    first.create();
    first.append(recordAt(0, true));

    TelemetryCsv second(scratch.file("telemetry.csv"));
    second.create();
    ASSERT_EQ(TelemetryCsv::readAll(second.path()).size(), 1u);
}

TEST(quoting_survives_parse) {
    std::vector<std::string> fields = {"plain", "with,comma", "say \"hi\"", ""};
    std::string line = TelemetryCsv::formatRow(fields);
    ASSERT_EQ(line, std::string("plain,\"with,comma\",\"say \"\"hi\"\"\","));
    ASSERT(TelemetryCsv::parseRow(line) == fields);
}

TEST(record_reads_back_from_fields) {
    TelemetryRecord original = recordAt(4, true);
    TelemetryRecord back = TelemetryRecord::fromFields(original.toFields());
    ASSERT(back.timestamp == original.timestamp);
    ASSERT(back.is_day);
    ASSERT_EQ(back.photo_number, 4);
    ASSERT(back.sensors.has_value());
    ASSERT_NEAR(back.sensors->environment.pressure, 1013.5, 1e-9);
    ASSERT_NEAR(back.sensors->compass_raw.getY(), -5.0, 1e-9);

    TelemetryRecord empty = TelemetryRecord::fromFields(recordAt(5, false).toFields());
    ASSERT(!empty.sensors.has_value());
}

TEST(malformed_rows_rejected) {
    std::vector<std::string> fields = recordAt(0, true).toFields();
    fields[1] = "Maybe";
    ASSERT_THROWS(TelemetryRecord::fromFields(fields), std::invalid_argument);
    fields = recordAt(0, true).toFields();
    fields[7] = "12abc";
    ASSERT_THROWS(TelemetryRecord::fromFields(fields), std::invalid_argument);
    fields.pop_back();
    ASSERT_THROWS(TelemetryRecord::fromFields(fields), std::invalid_argument);
}

TEST(unwritable_directory_is_storage_error) {
    ScratchDirectory scratch("csv_missing");
    TelemetryCsv csv(scratch.file("no_such_dir/telemetry.csv"));
    ASSERT_THROWS(csv.create(), StorageError);
    ASSERT_THROWS(csv.append(recordAt(0, true)), StorageError);
    ASSERT_THROWS(TelemetryCsv::readAll(csv.path()), StorageError);
}

int main() {
    std::cout << "=== Telemetry CSV Tests ===" << std::endl;
    RUN_TEST(header_has_thirty_two_columns);
    RUN_TEST(rows_follow_header);
    RUN_TEST(lines_end_with_crlf);
    RUN_TEST(create_truncates_previous_run);
    RUN_TEST(quoting_survives_parse);
    RUN_TEST(record_reads_back_from_fields);
    RUN_TEST(malformed_rows_rejected);
    RUN_TEST(unwritable_directory_is_storage_error);
    return reportResults();
}
