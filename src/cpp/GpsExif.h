#ifndef GPS_EXIF_H
#define GPS_EXIF_H

#include <string>

// One coordinate split into sexagesimal parts, sign carried by the reference
struct SexagesimalAngle {
    int degrees = 0;
    int minutes = 0;
    double seconds = 0.0;
    bool negative = false;
};

// EXIF GPS tag values ready to hand to the camera
struct GpsExifTags {
    std::string latitude;       // "D/1,M/1,S10/10"
    std::string latitude_ref;   // "N" or "S"
    std::string longitude;
    std::string longitude_ref;  // "E" or "W"
};

// "[-]D:MM:SS.s" with carries so minutes and seconds never reach 60
std::string formatSexagesimal(double decimal_degrees);

// Parse "[-]D:M:S[.s]"; throws std::invalid_argument on anything else
SexagesimalAngle parseSexagesimal(const std::string& text);

// "D/1,M/1,S10/10" with seconds kept to one decimal place
std::string toExifRational(const SexagesimalAngle& angle);

GpsExifTags buildGpsExifTags(const std::string& latitude, const std::string& longitude);
GpsExifTags buildGpsExifTags(double latitude_deg, double longitude_deg);

#endif // GPS_EXIF_H
