/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/terminator.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/observer.hpp>
#include <hamsky/transform.hpp>

#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;

namespace hamsky {

double solarElevation(const CartesianVector &sun, double latInDegrees, double lonInDegrees, time_point tp) {
    return observeUnchecked({latInDegrees, lonInDegrees, 0.0}, sun, tp).elevationInDegrees;
}

TerminatorPolyline traceTerminator(const BodyEphemeris &sun, time_point tp, int numPoints,
                                   const TerminatorOptions &options) {
    if (numPoints < 2) {
        throw std::invalid_argument(fmt::format("Terminator needs at least 2 points, got {}", numPoints));
    }

    // The Sun moves negligibly during the trace, so compute it once in ECEF
    CartesianVector sunECEF = toFrame(sun.positionAt(tp), Frame::ECEF, tp);

    TerminatorPolyline polyline;
    polyline.time = tp;
    polyline.stepInDegrees = 360.0 / numPoints;
    polyline.points.reserve(numPoints);

    int unbracketed = 0;
    for (int i = 0; i < numPoints; ++i) {
        double lon = -180.0 + i * polyline.stepInDegrees;

        double low = -90.0;
        double high = 90.0;
        double fLow = solarElevation(sunECEF, low, lon, tp);
        double fHigh = solarElevation(sunECEF, high, lon, tp);
        bool bracketed = (fLow < 0.0) != (fHigh < 0.0);

        for (int iter = 0; iter < options.iterations; ++iter) {
            double mid = (low + high) / 2.0;
            double fMid = solarElevation(sunECEF, mid, lon, tp);
            // Keep the half whose ends differ in sign. Without a sign change
            // this walks north to the end of the interval.
            if (!bracketed || (fMid < 0.0) == (fLow < 0.0)) {
                low = mid;
                fLow = fMid;
            } else {
                high = mid;
            }
        }

        double lat = (low + high) / 2.0;

        if (bracketed) {
            double residual = solarElevation(sunECEF, lat, lon, tp);
            if (std::abs(residual) > options.toleranceInDegrees) {
                throw NonConvergenceException(fmt::format(
                    "Terminator search at longitude {:.3f} ended {:.6f} degrees from the horizon",
                    lon, residual));
            }
        } else {
            ++unbracketed;
        }

        polyline.points.push_back({lat, lon, bracketed});
    }

    debug("Traced terminator with {} points ({} unbracketed)", numPoints, unbracketed);
    return polyline;
}

GeodeticPosition subSolarPoint(const BodyEphemeris &sun, time_point tp) {
    Vec3 s = toFrame(sun.positionAt(tp), Frame::ECEF, tp).position;
    double lat = std::atan2(s.z, std::sqrt(s.x * s.x + s.y * s.y)) * RADIANS_TO_DEGREES;
    double lon = std::atan2(s.y, s.x) * RADIANS_TO_DEGREES;
    return {lat, lon, 0.0};
}

}
