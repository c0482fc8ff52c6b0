/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/track.hpp>
#include <hamsky/transform.hpp>

#include <stdexcept>

namespace hamsky {

// Get geodetic location (lat, lon, alt) below the body at the sample time
GeodeticPosition subPoint(const BodyPositionSample &sample) {
    // Convert to the earth-fixed frame, then to latitude/longitude/altitude
    return ecefToGeodetic(toFrame(sample.position, Frame::ECEF, sample.time));
}

std::vector<TrackPoint> groundTrack(const BodyEphemeris &body, time_point start,
                                    std::chrono::system_clock::duration duration, int numPoints) {
    if (numPoints < 2) {
        throw std::invalid_argument("Ground track needs at least 2 points");
    }
    if (duration <= std::chrono::system_clock::duration::zero()) {
        throw std::invalid_argument("Ground track duration must be positive");
    }

    std::vector<TrackPoint> track;
    track.reserve(numPoints);
    auto step = duration / (numPoints - 1);
    for (int i = 0; i < numPoints; ++i) {
        time_point t = i == numPoints - 1 ? start + duration : start + step * i;
        track.push_back({t, subPoint(body.sampleAt(t))});
    }
    return track;
}

}
