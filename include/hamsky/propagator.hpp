/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_PROPAGATOR_HPP
#define __HAMSKY_PROPAGATOR_HPP

#include <hamsky/elements.hpp>
#include <hamsky/types.hpp>

namespace hamsky {

// Earth constants for two-body propagation
constexpr double EARTH_MU = 398600.4418;        // Gravitational parameter (km³/s²)
constexpr double EARTH_J2 = 1.08262668e-3;      // Second zonal harmonic
constexpr double SECONDS_PER_DAY = 86400.0;

/**
 * Turns an element set into a position at an instant.
 *
 * This is the seam where an SGP4-class propagator plugs in.
 */
class Propagator {
public:
    virtual ~Propagator() = default;

    /**
     * Position of the satellite at the given instant in the ECI frame (km).
     *
     * @throws InvalidOrbitException if the elements cannot be propagated
     */
    virtual CartesianVector propagate(const OrbitalElementSet &set, time_point tp) const = 0;
};

/**
 * Two-body propagator with J2 secular drift of the node, perigee and mean
 * anomaly, plus the TLE mean motion derivative.
 *
 * Accurate to a few tens of kilometers over a day for low Earth orbits,
 * which is enough for pass timing to within a minute or so. It does not
 * model drag or deep-space resonances.
 */
class KeplerPropagator : public Propagator {
public:
    CartesianVector propagate(const OrbitalElementSet &set, time_point tp) const override;
};

/**
 * Solve Kepler's equation M = E - e sin(E) for E by Newton-Raphson.
 *
 * @param meanAnomaly Mean anomaly (radians)
 * @param eccentricity Eccentricity in [0, 1)
 * @return Eccentric anomaly (radians)
 */
double solveKepler(double meanAnomaly, double eccentricity);

}

#endif
