/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_OBSERVER_HPP
#define __HAMSKY_OBSERVER_HPP

#include <hamsky/types.hpp>

namespace hamsky {

// Ranges below this are treated as observer and body coincident (km)
constexpr double DEGENERATE_RANGE = 1e-9;

/**
 * Projects the line of sight from an observer to a target onto the
 * observer's local East-North-Up axes.
 *
 * The observer is first expressed in the target's frame. For ECI targets the
 * local sidereal angle (GMST + longitude) takes the place of the longitude
 * when building the ENU basis.
 *
 * @param observer Geodetic position of the observer
 * @param target Target position in ECEF or ECI
 * @param tp Instant of the observation (used for ECI targets)
 * @return {east, north, up} in kilometers
 */
Vec3 toENU(const GeodeticPosition &observer, const CartesianVector &target, time_point tp);

/**
 * Computes azimuth, elevation and range from an observer to a target.
 *
 *   range     = |ENU|
 *   elevation = asin(up / range)
 *   azimuth   = atan2(east, north), normalized to [0, 360)
 *
 * When the target coincides with the observer (range below DEGENERATE_RANGE)
 * the fix reports elevation 90 and azimuth 0.
 *
 * @throws InvalidObserverException if the observer is out of range
 */
TopocentricFix observe(const GeodeticPosition &observer, const CartesianVector &target, time_point tp);

/**
 * Same as observe() without validating the observer. For inner loops whose
 * caller has already called validateObserver().
 */
TopocentricFix observeUnchecked(const GeodeticPosition &observer, const CartesianVector &target, time_point tp);

/**
 * Computes the topocentric fix for a position source sample.
 */
TopocentricFix observe(const GeodeticPosition &observer, const BodyPositionSample &sample);

/**
 * Checks whether a fix is at or above the minimum elevation.
 */
bool isVisible(const TopocentricFix &fix, double minElevationInDegrees = 0.0);

}

#endif
