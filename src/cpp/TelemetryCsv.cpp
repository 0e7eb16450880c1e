#include "TelemetryCsv.h"
#include "MissionErrors.h"

#include <fstream>

TelemetryCsv::TelemetryCsv(const std::string& file_path) : file_path(file_path) {
}

void TelemetryCsv::create() {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        throw StorageError("cannot create " + file_path);
    }
    file << formatRow(TelemetryRecord::columnNames()) << "\r\n";
    if (file.fail()) {
        throw StorageError("cannot write header to " + file_path);
    }
    rows_written = 0;
}

void TelemetryCsv::append(const TelemetryRecord& record) {
    std::ofstream file(file_path, std::ios::app);
    if (!file.is_open()) {
        throw StorageError("cannot open " + file_path + " for appending");
    }
    file << formatRow(record.toFields()) << "\r\n";
    file.flush();
    if (file.fail()) {
        throw StorageError("cannot append row to " + file_path);
    }
    ++rows_written;
}

// Quote only fields that need it
std::string TelemetryCsv::formatRow(const std::vector<std::string>& fields) {
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line += ',';
        }
        const std::string& field = fields[i];
        if (field.find_first_of(",\"\r\n") == std::string::npos) {
            line += field;
            continue;
        }
        line += '"';
        for (char c : field) {
            if (c == '"') {
                line += '"';
            }
            line += c;
        }
        line += '"';
    }
    return line;
}

std::vector<std::string> TelemetryCsv::parseRow(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r' && c != '\n') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

std::vector<std::vector<std::string>> TelemetryCsv::readAll(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw StorageError("cannot read " + file_path);
    }
    std::vector<std::vector<std::string>> rows;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        rows.push_back(parseRow(line));
    }
    return rows;
}
