#ifndef MISSION_ERRORS_H
#define MISSION_ERRORS_H

#include <stdexcept>
#include <string>

// Malformed two-line element set
class TleFormatError : public std::runtime_error {
public:
    explicit TleFormatError(const std::string& message) : std::runtime_error(message) {}
};

// SGP4 could not produce a state (decay, eccentricity out of range, deep-space orbit)
class PropagationError : public std::runtime_error {
public:
    explicit PropagationError(const std::string& message) : std::runtime_error(message) {}
};

class SensorReadError : public std::runtime_error {
public:
    explicit SensorReadError(const std::string& message) : std::runtime_error(message) {}
};

class SensorUnavailableError : public std::runtime_error {
public:
    explicit SensorUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& message) : std::runtime_error(message) {}
};

class CameraUnavailableError : public std::runtime_error {
public:
    explicit CameraUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

// CSV or log file could not be created or appended to
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

#endif // MISSION_ERRORS_H
