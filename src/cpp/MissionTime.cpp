#include "MissionTime.h"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

constexpr double UNIX_EPOCH_JD = 2440587.5;
constexpr double SECONDS_PER_DAY = 86400.0;

// Days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(int year, unsigned month, unsigned day) {
    year -= month <= 2;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

std::string formatCalendar(const MissionTimePoint& time, bool local, char fraction_separator, int fraction_digits) {
    auto since_epoch = time.time_since_epoch();
    auto whole = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - whole).count();
    if (micros < 0) {
        whole -= std::chrono::seconds(1);
        micros += 1000000;
    }
    std::time_t seconds = static_cast<std::time_t>(whole.count());

    struct tm calendar;
    struct tm* call_result = local ? localtime_r(&seconds, &calendar) : gmtime_r(&seconds, &calendar);
    if (call_result == nullptr) {
        return std::string();
    }

    std::ostringstream out;
    out.fill('0');
    out << calendar.tm_year + 1900 << "-"
        << std::setw(2) << calendar.tm_mon + 1 << "-"
        << std::setw(2) << calendar.tm_mday << " "
        << std::setw(2) << calendar.tm_hour << ":"
        << std::setw(2) << calendar.tm_min << ":"
        << std::setw(2) << calendar.tm_sec;
    if (fraction_digits == 3) {
        out << fraction_separator << std::setw(3) << micros / 1000;
    } else if (fraction_digits == 6) {
        out << fraction_separator << std::setw(6) << micros;
    }
    return out.str();
}

} // namespace

double toJulianDate(const MissionTimePoint& time) {
    double unix_seconds = std::chrono::duration<double>(time.time_since_epoch()).count();
    return UNIX_EPOCH_JD + unix_seconds / SECONDS_PER_DAY;
}

double greenwichMeanSiderealTime(double julian_date) {
    const double two_pi = 2.0 * 3.14159265358979323846;
    double tut1 = (julian_date - 2451545.0) / 36525.0;
    double seconds = -6.2e-6 * tut1 * tut1 * tut1 + 0.093104 * tut1 * tut1 +
                     (876600.0 * 3600.0 + 8640184.812866) * tut1 + 67310.54841;
    // 240 seconds of time per degree
    double gmst = std::fmod(seconds / 240.0 * two_pi / 360.0, two_pi);
    if (gmst < 0.0) {
        gmst += two_pi;
    }
    return gmst;
}

MissionTimePoint fromUtc(int year, int month, int day, int hour, int minute, double second) {
    long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    double seconds = static_cast<double>(days) * SECONDS_PER_DAY + hour * 3600.0 + minute * 60.0 + second;
    auto micros = std::chrono::microseconds(static_cast<long long>(std::llround(seconds * 1.0e6)));
    return MissionTimePoint(std::chrono::duration_cast<MissionTimePoint::duration>(micros));
}

std::string formatLogTimestamp(const MissionTimePoint& time) {
    return formatCalendar(time, true, ',', 3);
}

std::string formatCsvTimestamp(const MissionTimePoint& time) {
    return formatCalendar(time, true, '.', 6);
}

std::string formatUtcTimestamp(const MissionTimePoint& time) {
    return formatCalendar(time, false, '.', 0) + " UTC";
}

bool parseCsvTimestamp(const std::string& text, MissionTimePoint& time) {
    std::istringstream in(text);
    struct tm calendar = {};
    in >> std::get_time(&calendar, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) {
        return false;
    }
    long long micros = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        in >> digits;
        digits.resize(6, '0');
        try {
            micros = std::stoll(digits.substr(0, 6));
        } catch (const std::exception&) {
            return false;
        }
    }
    calendar.tm_isdst = -1;
    std::time_t seconds = std::mktime(&calendar);
    if (seconds == static_cast<std::time_t>(-1)) {
        return false;
    }
    time = std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::duration_cast<MissionTimePoint::duration>(std::chrono::microseconds(micros));
    return true;
}
