/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_TERMINATOR_HPP
#define __HAMSKY_TERMINATOR_HPP

#include <hamsky/position_source.hpp>
#include <hamsky/types.hpp>

#include <vector>

namespace hamsky {

/**
 * One sample of the day/night boundary.
 */
struct TerminatorPoint {
    double latInDegrees;
    double lonInDegrees;
    bool bracketed;     ///< False when the Sun does not rise or set anywhere along this meridian
};

/**
 * Day/night boundary, one point per longitude step across [-180, 180).
 */
struct TerminatorPolyline {
    time_point time;
    double stepInDegrees;
    std::vector<TerminatorPoint> points;
};

struct TerminatorOptions {
    int iterations = 20;                ///< Fixed bisection count, 20 gives about 1.7e-4 degrees
    double toleranceInDegrees = 1e-4;   ///< Largest accepted solar elevation at a bracketed point
};

/**
 * Solar elevation seen from a point on the ellipsoid surface.
 *
 * @param sun Sun position (either frame)
 */
double solarElevation(const CartesianVector &sun, double latInDegrees, double lonInDegrees, time_point tp);

/**
 * Trace the terminator at an instant.
 *
 * For each longitude -180 + i * 360 / numPoints the latitude in [-90, 90]
 * where the Sun's elevation is zero is found by bisection with a fixed
 * iteration count. When the poles do not bracket a sign change (near the
 * equinoxes) the search runs to the northern end of the interval and the
 * point is marked unbracketed.
 *
 * @throws std::invalid_argument if numPoints < 2
 * @throws NonConvergenceException if a bracketed point misses the tolerance
 */
TerminatorPolyline traceTerminator(const BodyEphemeris &sun, time_point tp, int numPoints = 360,
                                   const TerminatorOptions &options = {});

/**
 * The point on the ground with the Sun at the zenith.
 */
GeodeticPosition subSolarPoint(const BodyEphemeris &sun, time_point tp);

}

#endif
