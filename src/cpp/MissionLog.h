#ifndef MISSION_LOG_H
#define MISSION_LOG_H

#include <string>
#include "MissionTime.h"

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

const char* logLevelName(LogLevel level);

/**
 * Mission log file. Each line reads
 *   <logger-name> - <YYYY-MM-DD HH:MM:SS,mmm> - <LEVEL>: <message>
 * and is appended with the file reopened per write. Lines that pass the
 * minimum level are echoed to std::cout when console echo is on.
 */
class MissionLog {
private:
    std::string logger_name;
    std::string file_path;
    bool echo_to_console;
    LogLevel minimum_level = LogLevel::Debug;
    int write_failures = 0;

public:
    // Throws StorageError when the file cannot be opened for appending
    MissionLog(const std::string& logger_name, const std::string& file_path, bool echo_to_console = true);

    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warning(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    void setMinimumLevel(LogLevel level) { minimum_level = level; }

    std::string formatLine(LogLevel level, const std::string& message, const MissionTimePoint& time) const;

    const std::string& path() const { return file_path; }
    int getWriteFailures() const { return write_failures; }
};

#endif // MISSION_LOG_H
