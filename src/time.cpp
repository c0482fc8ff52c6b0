/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/time.hpp>

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include <date/date.h>

namespace hamsky {

// Convert a time_point to Julian Date
double toJulianDate(time_point tp) {
    using namespace std::chrono;

    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(
        tp.time_since_epoch()
    ).count();

    return UNIX_EPOCH_JD + daysSinceEpoch;
}

// Convert a Julian Date back to a time_point
time_point fromJulianDate(double julianDate) {
    using namespace std::chrono;

    duration<double, days::period> sinceEpoch{julianDate - UNIX_EPOCH_JD};
    return time_point{duration_cast<system_clock::duration>(sinceEpoch)};
}

double daysSinceJ2000(time_point tp) {
    return toJulianDate(tp) - J2000_JD;
}

// Greenwich Mean Sidereal Time in radians
double gmst(double julianDate) {
    // Julian centuries since J2000.0
    double T = (julianDate - J2000_JD) / DAYS_PER_JULIAN_CENTURY;

    double gmstInDegrees = GMST_AT_J2000
                    + EARTH_SIDEREAL_RATE * (julianDate - J2000_JD)
                    + GMST_T2_COEFF * T * T
                    - T * T * T / GMST_T3_DIVISOR;

    // Normalize to [0, 360)
    gmstInDegrees = std::fmod(gmstInDegrees, 360.0);
    if (gmstInDegrees < 0) gmstInDegrees += 360.0;

    return gmstInDegrees * DEGREES_TO_RADIANS;
}

double gmst(time_point tp) {
    return gmst(toJulianDate(tp));
}

// Parse "YYYY-MM-DD HH:MM:SS" as UTC
time_point parseTime(const std::string &timeStr) {
    std::istringstream in(timeStr);
    std::chrono::sys_time<std::chrono::seconds> tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
    }
    return time_point{tp};
}

std::string formatTime(time_point tp) {
    auto truncated = date::floor<std::chrono::seconds>(tp);
    return date::format("%F %T UTC", truncated);
}

time_point startOfDay(time_point tp) {
    return time_point{date::floor<date::days>(tp)};
}

}
