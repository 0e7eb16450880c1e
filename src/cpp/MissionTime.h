#ifndef MISSION_TIME_H
#define MISSION_TIME_H

#include <chrono>
#include <string>

using MissionTimePoint = std::chrono::system_clock::time_point;

// Julian date (UTC treated as UT1)
double toJulianDate(const MissionTimePoint& time);

// IAU-82 Greenwich mean sidereal time, radians in [0, 2pi)
double greenwichMeanSiderealTime(double julian_date);

// Build an instant from UTC calendar fields, independent of the host time zone
MissionTimePoint fromUtc(int year, int month, int day, int hour, int minute, double second);

// "YYYY-MM-DD HH:MM:SS,mmm" local time, mission log lines
std::string formatLogTimestamp(const MissionTimePoint& time);
// "YYYY-MM-DD HH:MM:SS.ffffff" local time, CSV Date/time column
std::string formatCsvTimestamp(const MissionTimePoint& time);
// "YYYY-MM-DD HH:MM:SS UTC"
std::string formatUtcTimestamp(const MissionTimePoint& time);

// Inverse of formatCsvTimestamp, returns false on a malformed field
bool parseCsvTimestamp(const std::string& text, MissionTimePoint& time);

#endif // MISSION_TIME_H
