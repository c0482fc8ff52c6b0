/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_TYPES_HPP
#define __HAMSKY_TYPES_HPP

#include <chrono>
#include <cmath>
#include <iostream>
#include <numbers>
#include <string>

namespace hamsky {

using time_point = std::chrono::system_clock::time_point;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    /**
     * Returns a unit vector (magnitude = 1) in the same direction as this vector.
     */
    Vec3 normalize() const {
        double mag = magnitude();
        return {x / mag, y / mag, z / mag};
    }
};

/**
 * Earth-centered reference frames.
 */
enum class Frame {
    ECEF,   ///< Earth-Centered Earth-Fixed, rotates with the Earth
    ECI     ///< Earth-Centered Inertial (true equator, mean equinox of date)
};

std::ostream& operator<<(std::ostream &os, const Frame &frame);

/**
 * A position vector in kilometers, tagged with the frame it is expressed in.
 */
struct CartesianVector {
    Frame frame;
    Vec3 position;

    /**
     * Vector from origin to this position.
     * @throws FrameMismatchException if the two vectors use different frames
     */
    Vec3 relativeTo(const CartesianVector &origin) const;
};

/**
 * Geodetic coordinates on or above the WGS84 ellipsoid.
 */
struct GeodeticPosition {
    double latInDegrees;    ///< Geodetic latitude (-90 to +90, positive = North)
    double lonInDegrees;    ///< Longitude (-180 to +180, positive = East)
    double altInMeters = 0.0;   ///< Altitude above the ellipsoid (>= -1000)
};

/**
 * A body's position at an instant, as produced by a position source.
 */
struct BodyPositionSample {
    std::string bodyId;
    time_point time;
    CartesianVector position;
};

/**
 * What an observer sees at one instant.
 */
struct TopocentricFix {
    double azimuthInDegrees;      ///< Compass direction [0, 360), 0 = North, 90 = East
    double elevationInDegrees;    ///< Angle above the horizon [-90, 90]
    double rangeInKilometers;     ///< Slant range to the target
    time_point time;
};

}

#endif
