#ifndef MISSION_CONFIG_H
#define MISSION_CONFIG_H

#include <chrono>
#include <string>

/**
 * Compiled-in mission parameters. The flight build only overrides
 * run_directory (the executable's directory); tests override the rest.
 */
struct MissionConfig {
    std::string run_directory = ".";
    std::string logger_name = "spacekludgers";
    std::string csv_file_name = "spacekludgers.csv";
    std::string log_file_name = "spacekludgers.log";
    std::string photo_name_format = "image_%03d.jpg";

    std::chrono::minutes run_duration{178};
    std::chrono::seconds failure_backoff{5};

    int camera_width = 2592;
    int camera_height = 1944;
    int jpeg_quality = 100;

    // ISS (ZARYA), epoch 2020 day 41
    std::string tle_name = "ISS (ZARYA)";
    std::string tle_line1 = "1 25544U 98067A   20041.35648148  .00000452  00000-0  16324-4 0  9997";
    std::string tle_line2 = "2 25544  51.6446 260.9599 0004888 249.2039  92.3149 15.49151626212198";

    std::string csvPath() const;
    std::string logPath() const;
    std::string photoPath(int photo_number) const;
};

#endif // MISSION_CONFIG_H
