/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_TIME_HPP
#define __HAMSKY_TIME_HPP

#include <hamsky/types.hpp>

#include <string>

namespace hamsky {

// Astronomical constants
constexpr double J2000_JD = 2451545.0;                      // Julian Date of J2000.0 epoch
constexpr double UNIX_EPOCH_JD = 2440587.5;                 // Julian Date of 1970-01-01 00:00 UTC
constexpr double DAYS_PER_JULIAN_CENTURY = 36525.0;         // Days in a Julian century
constexpr double GMST_AT_J2000 = 280.46061837;              // GMST at J2000.0 epoch (degrees)
constexpr double EARTH_SIDEREAL_RATE = 360.98564736629;     // Earth's rotation rate (deg/day)

// IAU polynomial correction coefficients for long-term variations in Earth's rotation
constexpr double GMST_T2_COEFF = 0.000387933;   // Quadratic correction for precession (T² term)
constexpr double GMST_T3_DIVISOR = 38710000.0;  // Cubic correction divisor (T³ term)

/**
 * Converts a time_point to Julian Date.
 */
double toJulianDate(time_point tp);

/**
 * Converts a Julian Date to a time_point.
 */
time_point fromJulianDate(double julianDate);

/**
 * Days elapsed since the J2000.0 epoch.
 */
double daysSinceJ2000(time_point tp);

/**
 * Computes Greenwich Mean Sidereal Time (GMST) for a given Julian Date.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(double julianDate);

/**
 * Computes Greenwich Mean Sidereal Time at a given instant.
 * @return GMST in radians, normalized to [0, 2π)
 */
double gmst(time_point tp);

/**
 * Parse a UTC timestamp in "YYYY-MM-DD HH:MM:SS" format.
 * @throws std::invalid_argument if the string does not match
 */
time_point parseTime(const std::string &timeStr);

/**
 * Format a timestamp as "YYYY-MM-DD HH:MM:SS UTC", truncated to seconds.
 */
std::string formatTime(time_point tp);

/**
 * Midnight UTC at the start of the day containing tp.
 */
time_point startOfDay(time_point tp);

}

#endif
