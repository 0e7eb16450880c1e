#include "GpsExif.h"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

std::vector<std::string> splitColons(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream in(text);
    std::string part;
    while (std::getline(in, part, ':')) {
        parts.push_back(part);
    }
    return parts;
}

bool isUnsignedNumber(const std::string& text, bool allow_fraction) {
    if (text.empty()) {
        return false;
    }
    bool seen_digit = false;
    bool seen_point = false;
    for (char c : text) {
        if (c >= '0' && c <= '9') {
            seen_digit = true;
        } else if (c == '.' && allow_fraction && !seen_point) {
            seen_point = true;
        } else {
            return false;
        }
    }
    return seen_digit;
}

} // namespace

std::string formatSexagesimal(double decimal_degrees) {
    if (!std::isfinite(decimal_degrees)) {
        throw std::invalid_argument("coordinate is not finite");
    }
    bool negative = decimal_degrees < 0.0;
    // Work in tenths of an arc-second so rounding carries into minutes and degrees
    long long tenths = std::llround(std::fabs(decimal_degrees) * 36000.0);
    long long degrees = tenths / 36000;
    long long minutes = (tenths % 36000) / 600;
    long long seconds_tenths = tenths % 600;

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%s%lld:%02lld:%02lld.%lld",
                  negative && tenths != 0 ? "-" : "", degrees, minutes,
                  seconds_tenths / 10, seconds_tenths % 10);
    return buffer;
}

SexagesimalAngle parseSexagesimal(const std::string& text) {
    std::string body = text;
    SexagesimalAngle angle;
    if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
        angle.negative = body[0] == '-';
        body = body.substr(1);
    }

    std::vector<std::string> parts = splitColons(body);
    if (parts.size() != 3 ||
        !isUnsignedNumber(parts[0], false) ||
        !isUnsignedNumber(parts[1], false) ||
        !isUnsignedNumber(parts[2], true)) {
        throw std::invalid_argument("expected D:M:S angle, got '" + text + "'");
    }

    angle.degrees = std::stoi(parts[0]);
    angle.minutes = std::stoi(parts[1]);
    angle.seconds = std::stod(parts[2]);
    if (angle.minutes >= 60 || angle.seconds >= 60.0) {
        throw std::invalid_argument("minutes or seconds out of range in '" + text + "'");
    }
    return angle;
}

std::string toExifRational(const SexagesimalAngle& angle) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%d/1,%d/1,%ld/10",
                  angle.degrees, angle.minutes, std::lround(angle.seconds * 10.0));
    return buffer;
}

GpsExifTags buildGpsExifTags(const std::string& latitude, const std::string& longitude) {
    SexagesimalAngle lat = parseSexagesimal(latitude);
    SexagesimalAngle lon = parseSexagesimal(longitude);

    GpsExifTags tags;
    tags.latitude = toExifRational(lat);
    tags.latitude_ref = lat.negative ? "S" : "N";
    tags.longitude = toExifRational(lon);
    tags.longitude_ref = lon.negative ? "W" : "E";
    return tags;
}

GpsExifTags buildGpsExifTags(double latitude_deg, double longitude_deg) {
    return buildGpsExifTags(formatSexagesimal(latitude_deg), formatSexagesimal(longitude_deg));
}
