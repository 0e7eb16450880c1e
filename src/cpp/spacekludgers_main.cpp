#include "AcquisitionLoop.h"
#include "MissionErrors.h"
#include "OrbitPropagator.h"
#include "RaspiStillCamera.h"
#include "SenseHat.h"
#include "TwoLineElements.h"

#include <exception>
#include <filesystem>
#include <iostream>

/**
 * Space Kludgers data acquisition
 * Photographs the ground under the ISS with GPS EXIF tags and logs
 * Sense HAT telemetry for 178 minutes.
 */

namespace {

// Output lands next to the executable
std::string executableDirectory() {
    std::error_code ec;
    std::filesystem::path self = std::filesystem::canonical("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::current_path().string();
    }
    return self.parent_path().string();
}

} // namespace

int main() {
    std::cout << "======================================================================" << std::endl;
    std::cout << "           SPACE KLUDGERS DATA ACQUISITION" << std::endl;
    std::cout << "======================================================================" << std::endl;

    try {
        MissionContext context;
        context.config.run_directory = executableDirectory();
        const MissionConfig& config = context.config;

        context.csv = std::make_unique<TelemetryCsv>(config.csvPath());
        context.csv->create();
        context.log = std::make_unique<MissionLog>(config.logger_name, config.logPath());

        context.sensors = std::make_unique<SenseHat>();
        context.log->info("Sense HAT sensors found");

        TwoLineElements elements = parseTwoLineElements(config.tle_name, config.tle_line1, config.tle_line2);
        auto propagator = std::make_unique<OrbitPropagator>(elements);
        context.log->info("Tracking " + elements.name + " (catalog " + std::to_string(elements.catalog_number) +
                          "), period " + std::to_string(propagator->getPeriodMinutes()) + " min");
        context.position_model = std::move(propagator);

        auto camera = std::make_unique<RaspiStillCamera>(config.camera_width, config.camera_height);
        context.log->info("Camera ready using " + camera->activeProgram() + " at " +
                          std::to_string(config.camera_width) + "x" + std::to_string(config.camera_height));
        context.camera = std::move(camera);

        context.clock = std::make_unique<SystemMissionClock>();

        AcquisitionLoop loop(std::move(context));
        AcquisitionCounters counters = loop.run();

        std::cout << std::endl;
        std::cout << "Photos captured: " << counters.photos_captured << std::endl;
        std::cout << "Telemetry rows:  " << counters.rows_written << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error during startup or run: " << e.what() << std::endl;
        return -1;
    }
}
