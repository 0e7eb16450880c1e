#include "MissionConfig.h"

#include <cstdio>
#include <filesystem>

std::string MissionConfig::csvPath() const {
    return (std::filesystem::path(run_directory) / csv_file_name).string();
}

std::string MissionConfig::logPath() const {
    return (std::filesystem::path(run_directory) / log_file_name).string();
}

std::string MissionConfig::photoPath(int photo_number) const {
    char name[256];
    std::snprintf(name, sizeof(name), photo_name_format.c_str(), photo_number);
    return (std::filesystem::path(run_directory) / name).string();
}
