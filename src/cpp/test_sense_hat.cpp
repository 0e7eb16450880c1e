#define _USE_MATH_DEFINES
#include <filesystem>
#include <fstream>
#include <iostream>
#include "MissionErrors.h"
#include "OrientationEstimator.h"
#include "SenseHat.h"
#include "test_support.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

void writeAttribute(const std::filesystem::path& device, const std::string& name, const std::string& value) {
    std::ofstream file(device / name);
    file << value << "\n";
}

std::filesystem::path addDevice(const std::string& root, int index, const std::string& name) {
    std::filesystem::path device = std::filesystem::path(root) / ("iio:device" + std::to_string(index));
    std::filesystem::create_directories(device);
    writeAttribute(device, "name", name);
    return device;
}

// Level board, heading east, at rest
void buildBoard(const std::string& root) {
    std::filesystem::path hts221 = addDevice(root, 0, "hts221");
    writeAttribute(hts221, "in_temp_raw", "2500");
    writeAttribute(hts221, "in_temp_offset", "25000");
    writeAttribute(hts221, "in_temp_scale", "1");
    writeAttribute(hts221, "in_humidityrelative_raw", "41250");

    std::filesystem::path lps25h = addDevice(root, 1, "lps25h");
    writeAttribute(lps25h, "in_pressure_raw", "101350");
    writeAttribute(lps25h, "in_pressure_scale", "0.001");

    std::filesystem::path accel = addDevice(root, 2, "lsm9ds1_accel");
    writeAttribute(accel, "in_accel_x_raw", "0");
    writeAttribute(accel, "in_accel_y_raw", "0");
    writeAttribute(accel, "in_accel_z_raw", "1");
    writeAttribute(accel, "in_accel_scale", "9.80665");

    std::filesystem::path gyro = addDevice(root, 3, "lsm9ds1_gyro");
    writeAttribute(gyro, "in_anglvel_x_raw", "0");
    writeAttribute(gyro, "in_anglvel_y_raw", "0");
    writeAttribute(gyro, "in_anglvel_z_raw", "0");

    std::filesystem::path magn = addDevice(root, 4, "lsm9ds1_magn");
    writeAttribute(magn, "in_magn_x_raw", "0");
    writeAttribute(magn, "in_magn_y_raw", "-250");
    writeAttribute(magn, "in_magn_z_raw", "0");
    writeAttribute(magn, "in_magn_scale", "0.001");
}

} // namespace

TEST(environment_channels_in_board_units) {
    ScratchDirectory scratch("sensehat_env");
    buildBoard(scratch.path());
    SenseHat board(scratch.path());
    ASSERT_NEAR(board.readTemperature(), 27.5, 1e-9);
    ASSERT_NEAR(board.readHumidity(), 41.25, 1e-9);
    ASSERT_NEAR(board.readPressure(), 1013.5, 1e-9);
}

TEST(raw_imu_channels_in_board_units) {
    ScratchDirectory scratch("sensehat_imu");
    buildBoard(scratch.path());
    SenseHat board(scratch.path());
    ASSERT_NEAR(board.readAccelerometerRaw().getZ(), 1.0, 1e-12);
    ASSERT_NEAR(board.readCompassRaw().getY(), -25.0, 1e-9);
    ASSERT_NEAR(board.readGyroscopeRaw().magnitude(), 0.0, 1e-12);
}

TEST(level_board_heading_east) {
    ScratchDirectory scratch("sensehat_heading");
    buildBoard(scratch.path());
    SenseHat board(scratch.path());
    ASSERT_NEAR(board.readOrientationDegrees().yaw, 90.0, 1e-6);
    ASSERT_NEAR(board.readOrientationRadians().yaw, M_PI / 2, 1e-8);
    ASSERT_NEAR(board.readAccelerometer().yaw, 0.0, 1e-12);
}

TEST(missing_device_is_unavailable) {
    ScratchDirectory scratch("sensehat_missing");
    addDevice(scratch.path(), 0, "hts221");
    ASSERT_THROWS(SenseHat board(scratch.path()), SensorUnavailableError);
    ASSERT_THROWS(SenseHat board(scratch.file("no_such_root")), SensorUnavailableError);
}

TEST(missing_raw_value_is_read_error) {
    ScratchDirectory scratch("sensehat_raw");
    buildBoard(scratch.path());
    std::filesystem::remove(std::filesystem::path(scratch.path()) / "iio:device1" / "in_pressure_raw");
    SenseHat board(scratch.path());
    ASSERT_THROWS(board.readPressure(), SensorReadError);
}

TEST(tilt_from_gravity) {
    // Rolled 90 degrees onto the right side
    EulerAngles attitude = OrientationEstimator::attitudeFromSensors(Vector3(0, 1, 0), Vector3());
    ASSERT_NEAR(attitude.roll, M_PI / 2, 1e-12);
    ASSERT_NEAR(attitude.pitch, 0.0, 1e-12);
    ASSERT_NEAR(attitude.yaw, 0.0, 1e-12);
    EulerAngles none = OrientationEstimator::attitudeFromSensors(Vector3(), Vector3(1, 0, 0));
    ASSERT_NEAR(none.roll, 0.0, 0.0);
}

TEST(gyro_estimate_follows_rates) {
    OrientationEstimator estimator;
    Vector3 gravity(0, 0, 1);
    Vector3 north(30, 0, 0);
    estimator.update(gravity, Vector3(), north, 0.0);
    for (int i = 0; i < 10; ++i) {
        estimator.update(gravity, Vector3(0, 0, 0.1), north, 0.1);
    }
    ASSERT_NEAR(estimator.gyroRadians().yaw, 0.1, 1e-9);
    // Fused estimate is pulled back toward the compass
    double fused_yaw = estimator.fusedRadians().yaw;
    ASSERT(fused_yaw > 0.0 && fused_yaw < 0.1);
    estimator.reset();
    ASSERT(!estimator.isInitialised());
}

TEST(degrees_wrap_into_full_circle) {
    EulerAngles degrees = OrientationEstimator::toDegrees360(EulerAngles{-M_PI / 2, M_PI, 5 * M_PI / 2});
    ASSERT_NEAR(degrees.roll, 270.0, 1e-9);
    ASSERT_NEAR(degrees.pitch, 180.0, 1e-9);
    ASSERT_NEAR(degrees.yaw, 90.0, 1e-9);
}

int main() {
    std::cout << "=== Sense HAT Tests ===" << std::endl;
    RUN_TEST(environment_channels_in_board_units);
    RUN_TEST(raw_imu_channels_in_board_units);
    RUN_TEST(level_board_heading_east);
    RUN_TEST(missing_device_is_unavailable);
    RUN_TEST(missing_raw_value_is_read_error);
    RUN_TEST(tilt_from_gravity);
    RUN_TEST(gyro_estimate_follows_rates);
    RUN_TEST(degrees_wrap_into_full_circle);
    return reportResults();
}
