#pragma once
#include <string>
#include <vector>
#include "TelemetryRecord.h"

/**
 * Append-only CSV store for telemetry rows. The file is truncated and
 * given its header once, then reopened in append mode for every row.
 */
class TelemetryCsv {
private:
    std::string file_path;
    int rows_written = 0;

public:
    explicit TelemetryCsv(const std::string& file_path);

    // Truncate and write the header; throws StorageError
    void create();
    // Throws StorageError when the row could not be written
    void append(const TelemetryRecord& record);

    const std::string& path() const { return file_path; }
    int getRowsWritten() const { return rows_written; }

    static std::string formatRow(const std::vector<std::string>& fields);
    static std::vector<std::string> parseRow(const std::string& line);

    // Every row of a CSV file, header included; throws StorageError when unreadable
    static std::vector<std::vector<std::string>> readAll(const std::string& file_path);
};
