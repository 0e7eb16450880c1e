#include "MissionLog.h"
#include "MissionErrors.h"

#include <chrono>
#include <fstream>
#include <iostream>

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

MissionLog::MissionLog(const std::string& logger_name, const std::string& file_path, bool echo_to_console)
    : logger_name(logger_name), file_path(file_path), echo_to_console(echo_to_console) {
    std::ofstream file(file_path, std::ios::app);
    if (!file.is_open()) {
        throw StorageError("cannot open log file " + file_path);
    }
}

std::string MissionLog::formatLine(LogLevel level, const std::string& message, const MissionTimePoint& time) const {
    return logger_name + " - " + formatLogTimestamp(time) + " - " + logLevelName(level) + ": " + message;
}

void MissionLog::log(LogLevel level, const std::string& message) {
    if (level < minimum_level) {
        return;
    }
    std::string line = formatLine(level, message, std::chrono::system_clock::now());

    if (echo_to_console) {
        std::cout << line << std::endl;
    }

    std::ofstream file(file_path, std::ios::app);
    if (file.is_open()) {
        file << line << '\n';
    }
    // A full disk must not stop the mission; report and keep going
    if (!file.is_open() || file.fail()) {
        ++write_failures;
        std::cerr << "Error: cannot append to " << file_path << std::endl;
    }
}
