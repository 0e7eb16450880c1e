#include "TwoLineElements.h"
#include "MissionErrors.h"

#include <cctype>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace {

constexpr std::size_t TLE_LINE_LENGTH = 69;

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    std::size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Columns are 1-based and inclusive, as in the published format
std::string field(const std::string& line, std::size_t first_col, std::size_t last_col) {
    return line.substr(first_col - 1, last_col - first_col + 1);
}

double parseDouble(const std::string& line, std::size_t first_col, std::size_t last_col, const char* what) {
    std::string text = trim(field(line, first_col, last_col));
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw TleFormatError(std::string("bad ") + what + " field '" + text + "'");
    }
}

int parseInt(const std::string& line, std::size_t first_col, std::size_t last_col, const char* what) {
    std::string text = trim(field(line, first_col, last_col));
    if (text.empty()) {
        return 0;
    }
    try {
        return std::stoi(text);
    } catch (const std::logic_error&) {
        throw TleFormatError(std::string("bad ") + what + " field '" + text + "'");
    }
}

// " 28098-4" -> 0.28098e-4 ; "-11606-4" -> -0.11606e-4
double parseImpliedExponent(const std::string& line, std::size_t first_col, std::size_t last_col, const char* what) {
    std::string text = trim(field(line, first_col, last_col));
    if (text.empty()) {
        return 0.0;
    }
    double sign = 1.0;
    if (text[0] == '-' || text[0] == '+') {
        sign = text[0] == '-' ? -1.0 : 1.0;
        text = text.substr(1);
    }
    std::size_t exponent_at = text.find_last_of("+-");
    if (exponent_at == std::string::npos || exponent_at == 0) {
        throw TleFormatError(std::string("bad ") + what + " field '" + text + "'");
    }
    try {
        double mantissa = std::stod("0." + text.substr(0, exponent_at));
        int exponent = std::stoi(text.substr(exponent_at));
        return sign * mantissa * std::pow(10.0, exponent);
    } catch (const std::logic_error&) {
        throw TleFormatError(std::string("bad ") + what + " field '" + text + "'");
    }
}

void checkLine(const std::string& line, char expected_number) {
    if (line.size() < TLE_LINE_LENGTH) {
        throw TleFormatError("TLE line " + std::string(1, expected_number) + " is shorter than 69 columns");
    }
    if (line[0] != expected_number) {
        throw TleFormatError("TLE line " + std::string(1, expected_number) + " has wrong line number");
    }
    if (!std::isdigit(static_cast<unsigned char>(line[68]))) {
        throw TleFormatError("TLE line " + std::string(1, expected_number) + " has no checksum digit");
    }
    int expected = line[68] - '0';
    if (tleChecksum(line) != expected) {
        throw TleFormatError("TLE line " + std::string(1, expected_number) + " checksum mismatch");
    }
}

} // namespace

int tleChecksum(const std::string& line) {
    int sum = 0;
    for (std::size_t i = 0; i < line.size() && i < 68; ++i) {
        char c = line[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            sum += c - '0';
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

TwoLineElements parseTwoLineElements(const std::string& name, const std::string& line1, const std::string& line2) {
    std::string l1 = line1;
    std::string l2 = line2;
    while (!l1.empty() && (l1.back() == '\r' || l1.back() == '\n' || l1.back() == ' ')) l1.pop_back();
    while (!l2.empty() && (l2.back() == '\r' || l2.back() == '\n' || l2.back() == ' ')) l2.pop_back();

    checkLine(l1, '1');
    checkLine(l2, '2');

    TwoLineElements tle;
    tle.name = trim(name);
    tle.line1 = l1;
    tle.line2 = l2;

    tle.catalog_number = parseInt(l1, 3, 7, "catalog number");
    if (parseInt(l2, 3, 7, "catalog number") != tle.catalog_number) {
        throw TleFormatError("TLE lines describe different satellites");
    }

    int two_digit_year = parseInt(l1, 19, 20, "epoch year");
    int year = two_digit_year < 57 ? 2000 + two_digit_year : 1900 + two_digit_year;
    double day_of_year = parseDouble(l1, 21, 32, "epoch day");
    if (day_of_year < 1.0 || day_of_year >= 367.0) {
        throw TleFormatError("TLE epoch day out of range");
    }
    auto offset = std::chrono::microseconds(static_cast<long long>(std::llround((day_of_year - 1.0) * 86400.0e6)));
    tle.epoch = fromUtc(year, 1, 1, 0, 0, 0.0) + std::chrono::duration_cast<MissionTimePoint::duration>(offset);
    tle.epoch_julian_date = toJulianDate(fromUtc(year, 1, 1, 0, 0, 0.0)) + (day_of_year - 1.0);

    tle.mean_motion_dot = parseDouble(l1, 34, 43, "first derivative");
    tle.mean_motion_ddot = parseImpliedExponent(l1, 45, 52, "second derivative");
    tle.bstar = parseImpliedExponent(l1, 54, 61, "bstar");

    tle.inclination_deg = parseDouble(l2, 9, 16, "inclination");
    tle.raan_deg = parseDouble(l2, 18, 25, "right ascension");
    tle.eccentricity = parseDouble(l2, 27, 33, "eccentricity") * 1.0e-7;
    tle.arg_perigee_deg = parseDouble(l2, 35, 42, "argument of perigee");
    tle.mean_anomaly_deg = parseDouble(l2, 44, 51, "mean anomaly");
    tle.mean_motion_rev_per_day = parseDouble(l2, 53, 63, "mean motion");
    tle.revolution_number = parseInt(l2, 64, 68, "revolution number");

    if (tle.mean_motion_rev_per_day <= 0.0) {
        throw TleFormatError("TLE mean motion must be positive");
    }
    return tle;
}
