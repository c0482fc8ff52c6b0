/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/transform.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/time.hpp>

#include <cmath>
#include <sstream>

#include <spdlog/fmt/fmt.h>

namespace hamsky {

// Rotate a vector about the Z axis by angle (radians)
static Vec3 rotateZ(const Vec3 &v, double angle) {
    double cosA = std::cos(angle);
    double sinA = std::sin(angle);

    return {
         v.x * cosA + v.y * sinA,
        -v.x * sinA + v.y * cosA,
         v.z
    };
}

static void requireFrame(const CartesianVector &v, Frame expected) {
    if (v.frame != expected) {
        std::ostringstream msg;
        msg << "Expected " << expected << " vector, got " << v.frame;
        throw FrameMismatchException(msg.str());
    }
}

// Convert geodetic coordinates to ECEF (Earth-Centered Earth-Fixed)
CartesianVector geodeticToECEF(const GeodeticPosition &position) {
    double lat = position.latInDegrees * DEGREES_TO_RADIANS;
    double lon = position.lonInDegrees * DEGREES_TO_RADIANS;
    double alt = position.altInMeters / 1000.0;

    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);

    // Radius of curvature in the prime vertical
    double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sinLat * sinLat);

    return {Frame::ECEF, {
        (N + alt) * cosLat * std::cos(lon),
        (N + alt) * cosLat * std::sin(lon),
        (N * (1.0 - WGS84_E2) + alt) * sinLat
    }};
}

// Convert ECEF coordinates to geodetic latitude, longitude, and altitude
GeodeticPosition ecefToGeodetic(const CartesianVector &ecef) {
    requireFrame(ecef, Frame::ECEF);

    double x = ecef.position.x, y = ecef.position.y, z = ecef.position.z;
    double lon = std::atan2(y, x);
    double p = std::sqrt(x*x + y*y);

    // Iterative latitude calculation (Bowring's method)
    double lat = std::atan2(z, p * (1 - WGS84_E2));
    for (int i = 0; i < 10; ++i) {
        double sinLat = std::sin(lat);
        double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);
        lat = std::atan2(z + WGS84_E2 * N * sinLat, p);
    }

    double sinLat = std::sin(lat);
    double cosLat = std::cos(lat);
    double N = WGS84_A / std::sqrt(1 - WGS84_E2 * sinLat * sinLat);

    // Near the poles p / cos(lat) is unstable, use the Z component instead
    double alt;
    if (std::abs(cosLat) > 1e-6) {
        alt = p / cosLat - N;
    } else {
        alt = std::abs(z) - N * (1 - WGS84_E2);
    }

    return {lat * RADIANS_TO_DEGREES, lon * RADIANS_TO_DEGREES, alt * 1000.0};
}

// ECI to ECEF using Greenwich Mean Sidereal Time
CartesianVector eciToECEF(const CartesianVector &eci, time_point tp) {
    requireFrame(eci, Frame::ECI);
    return {Frame::ECEF, rotateZ(eci.position, gmst(tp))};
}

CartesianVector ecefToECI(const CartesianVector &ecef, time_point tp) {
    requireFrame(ecef, Frame::ECEF);
    return {Frame::ECI, rotateZ(ecef.position, -gmst(tp))};
}

CartesianVector toFrame(const CartesianVector &v, Frame frame, time_point tp) {
    if (v.frame == frame) {
        return v;
    }
    return frame == Frame::ECEF ? eciToECEF(v, tp) : ecefToECI(v, tp);
}

// Haversine distance plus forward azimuth
GreatCircle greatCircle(const GeodeticPosition &p1, const GeodeticPosition &p2) {
    validateObserver(p1);
    validateObserver(p2);

    double lat1 = p1.latInDegrees * DEGREES_TO_RADIANS;
    double lat2 = p2.latInDegrees * DEGREES_TO_RADIANS;
    double dLon = (p2.lonInDegrees - p1.lonInDegrees) * DEGREES_TO_RADIANS;

    // Half-angle terms use absolute differences so swapping the points
    // produces bit-identical results
    double halfLat = std::abs(p2.latInDegrees - p1.latInDegrees) * DEGREES_TO_RADIANS / 2.0;
    double halfLon = std::abs(dLon) / 2.0;

    double a = std::sin(halfLat) * std::sin(halfLat)
             + std::cos(lat1) * std::cos(lat2) * std::sin(halfLon) * std::sin(halfLon);
    if (a > 1.0) a = 1.0;
    double distance = 2.0 * EARTH_MEAN_RADIUS * std::asin(std::sqrt(a));

    if (distance == 0.0) {
        return {0.0, 0.0};
    }

    double x = std::sin(dLon) * std::cos(lat2);
    double y = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dLon);
    double bearing = normalizeDegrees(std::atan2(x, y) * RADIANS_TO_DEGREES);

    return {distance, bearing};
}

double finalBearing(const GeodeticPosition &p1, const GeodeticPosition &p2) {
    GreatCircle reverse = greatCircle(p2, p1);
    if (reverse.distanceInKilometers == 0.0) {
        return 0.0;
    }
    return normalizeDegrees(reverse.bearingInDegrees + 180.0);
}

void validateObserver(const GeodeticPosition &observer) {
    if (!std::isfinite(observer.latInDegrees) || !std::isfinite(observer.lonInDegrees)
            || !std::isfinite(observer.altInMeters)) {
        throw InvalidObserverException("Observer coordinates must be finite");
    }
    if (observer.latInDegrees < -90.0 || observer.latInDegrees > 90.0) {
        throw InvalidObserverException(fmt::format(
            "Latitude must be between -90 and 90, got {}", observer.latInDegrees));
    }
    if (observer.lonInDegrees < -180.0 || observer.lonInDegrees > 180.0) {
        throw InvalidObserverException(fmt::format(
            "Longitude must be between -180 and 180, got {}", observer.lonInDegrees));
    }
    if (observer.altInMeters < MIN_OBSERVER_ALTITUDE) {
        throw InvalidObserverException(fmt::format(
            "Altitude must be at least {} m, got {}", MIN_OBSERVER_ALTITUDE, observer.altInMeters));
    }
}

double normalizeDegrees(double degrees) {
    double result = std::fmod(degrees, 360.0);
    if (result < 0) result += 360.0;
    // fmod of a tiny negative value can round up to exactly 360
    if (result >= 360.0) result = 0.0;
    return result;
}

double normalizeLongitude(double degrees) {
    double result = normalizeDegrees(degrees + 180.0) - 180.0;
    return result;
}

}
