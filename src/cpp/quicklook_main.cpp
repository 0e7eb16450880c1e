#include "telemetry_quicklook.hpp"
#include <exception>
#include <iostream>

/**
 * Telemetry quicklook for the Space Kludgers CSV log
 * Usage: telemetry_quicklook [spacekludgers.csv]
 */

int main(int argc, char* argv[]) {
    std::string csv_path = argc > 1 ? argv[1] : "spacekludgers.csv";

    std::cout << "======================================================================" << std::endl;
    std::cout << "           SPACE KLUDGERS TELEMETRY QUICKLOOK" << std::endl;
    std::cout << "======================================================================" << std::endl;
    std::cout << "Telemetry file: " << csv_path << std::endl;

    try {
        TelemetryQuicklook viewer(csv_path);
        if (!viewer.Initialize()) {
            std::cerr << "Failed to initialize quicklook viewer!" << std::endl;
            return -1;
        }
        std::cout << "F5 reloads the file; File > Follow File re-reads it every few seconds" << std::endl;
        viewer.Run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception caught in main: " << e.what() << std::endl;
        return -1;
    }
}
