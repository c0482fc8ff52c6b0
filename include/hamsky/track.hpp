/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_TRACK_HPP
#define __HAMSKY_TRACK_HPP

#include <hamsky/position_source.hpp>
#include <hamsky/types.hpp>

#include <chrono>
#include <vector>

namespace hamsky {

/**
 * A sub-body point at an instant.
 */
struct TrackPoint {
    time_point time;
    GeodeticPosition position;  ///< Latitude/longitude below the body, altitude of the body
};

/**
 * Project a body position onto the ellipsoid.
 */
GeodeticPosition subPoint(const BodyPositionSample &sample);

/**
 * Sample the ground track of a body at numPoints evenly spaced instants
 * from start to start + duration (both included).
 *
 * @throws std::invalid_argument if numPoints < 2 or duration is not positive
 */
std::vector<TrackPoint> groundTrack(const BodyEphemeris &body, time_point start,
                                    std::chrono::system_clock::duration duration, int numPoints);

}

#endif
