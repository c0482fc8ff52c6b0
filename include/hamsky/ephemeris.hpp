/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_EPHEMERIS_HPP
#define __HAMSKY_EPHEMERIS_HPP

#include <hamsky/types.hpp>

#include <string>

namespace hamsky {

constexpr double ASTRONOMICAL_UNIT = 149597870.7;   // km

/**
 * Low-precision geocentric Sun position (Meeus, "Astronomical Algorithms",
 * chapter 25), about 0.01 degree accuracy.
 *
 * @return Sun position in the ECI frame (km)
 */
CartesianVector sunPosition(time_point tp);

/**
 * Low-precision geocentric Moon position from the leading terms of the lunar
 * series, about 0.5 degree accuracy.
 *
 * @return Moon position in the ECI frame (km)
 */
CartesianVector moonPosition(time_point tp);

/**
 * Right ascension, declination and distance of an ECI position.
 */
struct EquatorialCoordinates {
    double rightAscensionInHours;
    double declinationInDegrees;
    double distanceInKilometers;
};

EquatorialCoordinates equatorialCoordinates(const CartesianVector &eci);

/**
 * Moon phase.
 *
 * The phase angle is the Moon's ecliptic longitude minus the Sun's,
 * 0 = new, 90 = first quarter, 180 = full, 270 = last quarter.
 */
struct MoonPhase {
    double phaseAngleInDegrees;
    double illuminationPercent;
    std::string name;
};

MoonPhase moonPhase(time_point tp);

/**
 * Name for a phase angle ("New Moon", "Waxing Crescent", ...).
 */
std::string moonPhaseName(double phaseAngleInDegrees);

}

#endif
