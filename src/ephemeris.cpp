/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/ephemeris.hpp>
#include <hamsky/time.hpp>
#include <hamsky/transform.hpp>

#include <cmath>

namespace hamsky {

namespace {

struct Ecliptic {
    double lonInDegrees;
    double latInDegrees;
    double distanceInKilometers;
};

// Mean obliquity of the ecliptic (degrees)
double obliquity(double T) {
    return 23.439291 - 0.0130042 * T;
}

Ecliptic sunEcliptic(time_point tp) {
    double T = daysSinceJ2000(tp) / DAYS_PER_JULIAN_CENTURY;

    // Mean anomaly and mean longitude (degrees)
    double M = normalizeDegrees(357.52911 + 35999.05029 * T - 0.0001537 * T * T);
    double L0 = normalizeDegrees(280.46646 + 36000.76983 * T + 0.0003032 * T * T);
    double Mrad = M * DEGREES_TO_RADIANS;

    // Equation of center
    double C = (1.914602 - 0.004817 * T - 0.000014 * T * T) * std::sin(Mrad)
             + (0.019993 - 0.000101 * T) * std::sin(2.0 * Mrad)
             + 0.000289 * std::sin(3.0 * Mrad);

    double e = 0.016708634 - 0.000042037 * T - 0.0000001267 * T * T;
    double nu = (M + C) * DEGREES_TO_RADIANS;
    double R = 1.000001018 * (1.0 - e * e) / (1.0 + e * std::cos(nu));

    return {normalizeDegrees(L0 + C), 0.0, R * ASTRONOMICAL_UNIT};
}

Ecliptic moonEcliptic(time_point tp) {
    double d = daysSinceJ2000(tp);

    double L = normalizeDegrees(218.316 + 13.176396 * d);  // Mean longitude
    double M = normalizeDegrees(134.963 + 13.064993 * d);  // Mean anomaly
    double F = normalizeDegrees(93.272 + 13.229350 * d);   // Mean distance from ascending node

    double lambda = L + 6.289 * std::sin(M * DEGREES_TO_RADIANS);
    double beta = 5.128 * std::sin(F * DEGREES_TO_RADIANS);
    double distance = 385001.0 - 20905.0 * std::cos(M * DEGREES_TO_RADIANS);

    return {normalizeDegrees(lambda), beta, distance};
}

// Rotate ecliptic spherical coordinates into the equatorial (ECI) frame
CartesianVector eclipticToECI(const Ecliptic &ecl, time_point tp) {
    double T = daysSinceJ2000(tp) / DAYS_PER_JULIAN_CENTURY;
    double eps = obliquity(T) * DEGREES_TO_RADIANS;
    double lon = ecl.lonInDegrees * DEGREES_TO_RADIANS;
    double lat = ecl.latInDegrees * DEGREES_TO_RADIANS;

    double x = ecl.distanceInKilometers * std::cos(lat) * std::cos(lon);
    double y = ecl.distanceInKilometers * std::cos(lat) * std::sin(lon);
    double z = ecl.distanceInKilometers * std::sin(lat);

    return {Frame::ECI, {
        x,
        y * std::cos(eps) - z * std::sin(eps),
        y * std::sin(eps) + z * std::cos(eps)
    }};
}

}

CartesianVector sunPosition(time_point tp) {
    return eclipticToECI(sunEcliptic(tp), tp);
}

CartesianVector moonPosition(time_point tp) {
    return eclipticToECI(moonEcliptic(tp), tp);
}

EquatorialCoordinates equatorialCoordinates(const CartesianVector &eci) {
    const Vec3 &p = eci.position;
    double distance = p.magnitude();
    double ra = normalizeDegrees(std::atan2(p.y, p.x) * RADIANS_TO_DEGREES) / 15.0;
    double dec = distance > 0.0 ? std::asin(p.z / distance) * RADIANS_TO_DEGREES : 0.0;
    return {ra, dec, distance};
}

MoonPhase moonPhase(time_point tp) {
    double angle = normalizeDegrees(moonEcliptic(tp).lonInDegrees - sunEcliptic(tp).lonInDegrees);
    double illumination = (1.0 - std::cos(angle * DEGREES_TO_RADIANS)) / 2.0 * 100.0;
    return {angle, illumination, moonPhaseName(angle)};
}

std::string moonPhaseName(double phaseAngleInDegrees) {
    double angle = normalizeDegrees(phaseAngleInDegrees);
    if (angle < 22.5 || angle >= 337.5) {
        return "New Moon";
    } else if (angle < 67.5) {
        return "Waxing Crescent";
    } else if (angle < 112.5) {
        return "First Quarter";
    } else if (angle < 157.5) {
        return "Waxing Gibbous";
    } else if (angle < 202.5) {
        return "Full Moon";
    } else if (angle < 247.5) {
        return "Waning Gibbous";
    } else if (angle < 292.5) {
        return "Last Quarter";
    }
    return "Waning Crescent";
}

}
