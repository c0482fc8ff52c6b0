/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_TRANSFORM_HPP
#define __HAMSKY_TRANSFORM_HPP

#include <hamsky/types.hpp>

namespace hamsky {

// WGS84 ellipsoid constants
constexpr double WGS84_A = 6378.137;              // Semi-major axis (km) - equatorial radius
constexpr double WGS84_F = 1.0 / 298.257223563;   // Flattening
constexpr double WGS84_E2 = WGS84_F * (2 - WGS84_F);  // Eccentricity squared ≈ 0.00669437999014

// Mean Earth radius used for great-circle math (km)
constexpr double EARTH_MEAN_RADIUS = 6371.0;

// Observer altitude floor (m)
constexpr double MIN_OBSERVER_ALTITUDE = -1000.0;

/**
 * Distance and initial bearing between two points on a spherical Earth.
 */
struct GreatCircle {
    double distanceInKilometers;
    double bearingInDegrees;    ///< Initial bearing from the first point, [0, 360)
};

// ============================================================================
// Frame Conversions
// ============================================================================

/**
 * Converts geodetic coordinates to ECEF.
 *
 * Uses the WGS84 ellipsoid:
 *   N = a / sqrt(1 - e² sin²(lat))
 *   X = (N + h) cos(lat) cos(lon)
 *   Y = (N + h) cos(lat) sin(lon)
 *   Z = (N(1 - e²) + h) sin(lat)
 *
 * @param position Geodetic position (degrees, meters)
 * @return ECEF position in kilometers
 */
CartesianVector geodeticToECEF(const GeodeticPosition &position);

/**
 * Converts an ECEF position to geodetic coordinates using Bowring's iteration.
 *
 * @throws FrameMismatchException if the vector is not in the ECEF frame
 */
GeodeticPosition ecefToGeodetic(const CartesianVector &ecef);

/**
 * Rotates an ECI vector into ECEF at the given instant (rotation about Z by GMST).
 *
 * @throws FrameMismatchException if the vector is not in the ECI frame
 */
CartesianVector eciToECEF(const CartesianVector &eci, time_point tp);

/**
 * Rotates an ECEF vector into ECI at the given instant.
 *
 * @throws FrameMismatchException if the vector is not in the ECEF frame
 */
CartesianVector ecefToECI(const CartesianVector &ecef, time_point tp);

/**
 * Expresses a vector in the requested frame, converting if needed.
 */
CartesianVector toFrame(const CartesianVector &v, Frame frame, time_point tp);

// ============================================================================
// Great Circle Math
// ============================================================================

/**
 * Haversine distance and initial bearing from p1 to p2 on a sphere of radius
 * EARTH_MEAN_RADIUS. Distance is exactly symmetric. Coincident points yield
 * distance 0 and bearing 0.
 *
 * @throws InvalidObserverException if either point is out of range
 */
GreatCircle greatCircle(const GeodeticPosition &p1, const GeodeticPosition &p2);

/**
 * Bearing at which the great circle from p1 arrives at p2, [0, 360).
 */
double finalBearing(const GeodeticPosition &p1, const GeodeticPosition &p2);

// ============================================================================
// Validation and Normalization
// ============================================================================

/**
 * Rejects observers outside the supported range.
 *
 * @throws InvalidObserverException if latitude is outside [-90, 90], longitude
 *         is outside [-180, 180], altitude is below -1000 m, or any value is
 *         not finite
 */
void validateObserver(const GeodeticPosition &observer);

/**
 * Wraps an angle into [0, 360).
 */
double normalizeDegrees(double degrees);

/**
 * Wraps a longitude into [-180, 180).
 */
double normalizeLongitude(double degrees);

}

#endif
