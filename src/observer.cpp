/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/observer.hpp>
#include <hamsky/time.hpp>
#include <hamsky/transform.hpp>

#include <algorithm>
#include <cmath>

namespace hamsky {

// Transform the observer-to-target vector to ENU (East-North-Up) local tangent plane
Vec3 toENU(const GeodeticPosition &observer, const CartesianVector &target, time_point tp) {
    // Step 1: Express the observer in the target's frame and compute the difference vector
    CartesianVector observerPos = toFrame(geodeticToECEF(observer), target.frame, tp);
    Vec3 diff = target.relativeTo(observerPos);

    // Step 2: Angle of the observer's meridian in the target's frame
    double lat = observer.latInDegrees * DEGREES_TO_RADIANS;
    double theta = observer.lonInDegrees * DEGREES_TO_RADIANS;
    if (target.frame == Frame::ECI) {
        theta += gmst(tp);
    }

    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double sinTheta = std::sin(theta);
    double cosTheta = std::cos(theta);

    // Step 3: Rotate onto the local horizon
    //   - East points along the local latitude circle
    //   - North points along the local meridian
    //   - Up is normal to the ellipsoid
    double east  = -sinTheta * diff.x + cosTheta * diff.y;
    double north = -sinLat * cosTheta * diff.x - sinLat * sinTheta * diff.y + cosLat * diff.z;
    double up    =  cosLat * cosTheta * diff.x + cosLat * sinTheta * diff.y + sinLat * diff.z;

    return {east, north, up};
}

TopocentricFix observeUnchecked(const GeodeticPosition &observer, const CartesianVector &target, time_point tp) {
    Vec3 enu = toENU(observer, target, tp);
    double range = enu.magnitude();

    if (range < DEGENERATE_RANGE) {
        return {0.0, 90.0, range, tp};
    }

    // Rounding can push |up / range| slightly past 1 for a target at the zenith
    double sinElevation = std::clamp(enu.z / range, -1.0, 1.0);
    double elevation = std::asin(sinElevation) * RADIANS_TO_DEGREES;
    double azimuth = normalizeDegrees(std::atan2(enu.x, enu.y) * RADIANS_TO_DEGREES);

    return {azimuth, elevation, range, tp};
}

TopocentricFix observe(const GeodeticPosition &observer, const CartesianVector &target, time_point tp) {
    validateObserver(observer);
    return observeUnchecked(observer, target, tp);
}

TopocentricFix observe(const GeodeticPosition &observer, const BodyPositionSample &sample) {
    return observe(observer, sample.position, sample.time);
}

bool isVisible(const TopocentricFix &fix, double minElevationInDegrees) {
    return fix.elevationInDegrees >= minElevationInDegrees;
}

}
