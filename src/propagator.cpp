/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/propagator.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/transform.hpp>

#include <chrono>
#include <cmath>
#include <numbers>

#include <spdlog/fmt/fmt.h>

namespace hamsky {

constexpr double TWO_PI = 2.0 * std::numbers::pi;

double solveKepler(double meanAnomaly, double eccentricity) {
    double M = std::fmod(meanAnomaly, TWO_PI);
    if (M < 0) M += TWO_PI;

    // Starting at pi converges for all elliptical orbits
    double E = eccentricity > 0.8 ? std::numbers::pi : M;

    for (int iter = 0; iter < 50; iter++) {
        double f = E - eccentricity * std::sin(E) - M;
        double fp = 1.0 - eccentricity * std::cos(E);
        double delta = f / fp;
        E -= delta;

        if (std::abs(delta) < 1e-12) {
            break;
        }
    }

    return E;
}

CartesianVector KeplerPropagator::propagate(const OrbitalElementSet &set, time_point tp) const {
    using namespace std::chrono;

    const MeanElements &el = set.getElements();

    if (el.meanMotion <= 0.0) {
        throw InvalidOrbitException(fmt::format(
            "Element set {} has non-positive mean motion {}", set.getNoradID(), el.meanMotion));
    }
    if (el.eccentricity < 0.0 || el.eccentricity >= 1.0) {
        throw InvalidOrbitException(fmt::format(
            "Element set {} has unsupported eccentricity {}", set.getNoradID(), el.eccentricity));
    }

    double dtDays = duration_cast<duration<double, days::period>>(tp - set.getEpoch()).count();
    double dtSeconds = dtDays * SECONDS_PER_DAY;

    // Mean motion (rad/s) and semi-major axis from Kepler's third law
    double n = el.meanMotion * TWO_PI / SECONDS_PER_DAY;
    double a = std::cbrt(EARTH_MU / (n * n));
    double e = el.eccentricity;
    double i = el.inclination * DEGREES_TO_RADIANS;

    if (a * (1.0 - e) < WGS84_A) {
        throw InvalidOrbitException(fmt::format(
            "Element set {} has perigee below the Earth's surface", set.getNoradID()));
    }

    // J2 secular rates
    double p = a * (1.0 - e * e);
    double k = 1.5 * EARTH_J2 * (WGS84_A / p) * (WGS84_A / p) * n;
    double cosI = std::cos(i);
    double raanRate = -k * cosI;
    double argpRate = 0.5 * k * (5.0 * cosI * cosI - 1.0);
    double meanAnomalyRate = n + 0.5 * k * std::sqrt(1.0 - e * e) * (3.0 * cosI * cosI - 1.0);

    double raan = el.rightAscensionOfAscendingNode * DEGREES_TO_RADIANS + raanRate * dtSeconds;
    double argp = el.argumentOfPerigee * DEGREES_TO_RADIANS + argpRate * dtSeconds;
    // The TLE carries half the first derivative of mean motion (rev/day²)
    double M = el.meanAnomaly * DEGREES_TO_RADIANS
             + meanAnomalyRate * dtSeconds
             + el.firstDerivativeMeanMotion * TWO_PI * dtDays * dtDays;

    // Position in the perifocal frame
    double E = solveKepler(M, e);
    double nu = 2.0 * std::atan2(std::sqrt(1.0 + e) * std::sin(E / 2.0),
                                 std::sqrt(1.0 - e) * std::cos(E / 2.0));
    double r = a * (1.0 - e * std::cos(E));
    double xp = r * std::cos(nu);
    double yp = r * std::sin(nu);

    // Rotate perifocal -> ECI: R3(-raan) R1(-i) R3(-argp)
    double cosO = std::cos(raan), sinO = std::sin(raan);
    double cosW = std::cos(argp), sinW = std::sin(argp);
    double sinI = std::sin(i);

    return {Frame::ECI, {
        (cosO * cosW - sinO * sinW * cosI) * xp + (-cosO * sinW - sinO * cosW * cosI) * yp,
        (sinO * cosW + cosO * sinW * cosI) * xp + (-sinO * sinW + cosO * cosW * cosI) * yp,
        (sinW * sinI) * xp + (cosW * sinI) * yp
    }};
}

}
