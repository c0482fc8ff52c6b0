/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_EVENTS_HPP
#define __HAMSKY_EVENTS_HPP

#include <hamsky/position_source.hpp>
#include <hamsky/types.hpp>

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace hamsky {

// Apparent horizon for sunrise/sunset (refraction plus solar semi-diameter)
constexpr double SUN_HORIZON_DEGREES = -0.8333;
// Apparent horizon for moonrise/moonset (refraction plus mean lunar
// semi-diameter). observe() is topocentric, so parallax is already applied.
constexpr double MOON_HORIZON_DEGREES = -0.8333;

constexpr double CIVIL_TWILIGHT_DEGREES = -6.0;
constexpr double NAUTICAL_TWILIGHT_DEGREES = -12.0;
constexpr double ASTRONOMICAL_TWILIGHT_DEGREES = -18.0;

// How far ahead findNextPass looks
constexpr std::chrono::hours NEXT_PASS_HORIZON{48};

enum class PassEventKind {
    Rise,
    Culminate,
    Set
};

std::ostream& operator<<(std::ostream &os, const PassEventKind &kind);

/**
 * A discrete event within a pass.
 */
struct PassEvent {
    PassEventKind kind;
    time_point time;
    double elevationInDegrees;
    double azimuthInDegrees;
};

/**
 * One pass of a body above the elevation threshold.
 *
 * A pass is partial when the search window cut off its rise and/or set.
 * The missing events are left empty and start/end fall back to the window
 * boundary. Culminate is only present when a true local maximum was found
 * strictly between start and end.
 */
struct Pass {
    std::string bodyId;
    std::optional<PassEvent> rise;
    std::optional<PassEvent> culminate;
    std::optional<PassEvent> set;
    double maxElevationInDegrees = 0.0;
    time_point start;
    time_point end;
    bool partial = false;

    std::chrono::system_clock::duration duration() const { return end - start; }
};

/**
 * Closed time interval [start, end].
 */
struct TimeWindow {
    time_point start;
    time_point end;
};

/**
 * Parameters for the elevation scan and crossing refinement.
 */
struct PassSearchOptions {
    double minElevationInDegrees = 0.0;
    std::chrono::seconds step{60};              ///< Coarse sampling interval
    std::chrono::milliseconds tolerance{100};   ///< Crossing refinement tolerance
    int maxIterations = 64;                     ///< Bisection budget per crossing
};

/**
 * Coarse step suited to a kind of body: 60 seconds for satellites, 5
 * minutes for the Sun and Moon.
 */
std::chrono::seconds defaultSearchStep(BodyKind kind);

/**
 * Search options with the default step for a kind of body.
 */
PassSearchOptions defaultSearchOptions(BodyKind kind, double minElevationInDegrees = 0.0);

/**
 * Standard rise/set horizon for a kind of body.
 */
double standardHorizon(BodyKind kind);

/**
 * Computes the topocentric fix at an instant.
 */
using LookFunction = std::function<TopocentricFix(time_point)>;

/**
 * Computes an elevation in degrees at an instant.
 */
using ElevationFunction = std::function<double(time_point)>;

/**
 * Refine a threshold crossing by bisection.
 *
 * For a rising crossing f(low) must be below the threshold and f(high) at or
 * above it, and the other way around for a setting crossing. The result is
 * the end of the final interval that is at or above the threshold.
 *
 * @throws NonConvergenceException if the interval does not bracket a
 *         crossing or the tolerance is not reached within maxIterations
 */
time_point bisectCrossing(const ElevationFunction &elevation, double threshold,
                          time_point low, time_point high, bool rising,
                          const PassSearchOptions &options);

/**
 * Golden section search for the time of maximum elevation in [low, high].
 */
time_point findMaximum(const ElevationFunction &elevation, time_point low, time_point high,
                       std::chrono::milliseconds tolerance);

/**
 * Scan a window for passes above options.minElevationInDegrees.
 *
 * The elevation is sampled every options.step (the last sample is the window
 * end). Upward crossings are refined to RISE and downward crossings to SET.
 * The highest sample in each pass seeds a golden section search for
 * CULMINATE.
 *
 * A body above the threshold for the whole window yields one partial pass
 * covering the window. A body that never reaches the threshold yields an
 * empty list. Passes are ordered by start.
 *
 * @throws std::invalid_argument if the window is empty or the step is not positive
 * @throws NonConvergenceException if a crossing cannot be refined
 */
std::vector<Pass> findPasses(const LookFunction &look, const TimeWindow &window,
                             const PassSearchOptions &options = {});

/**
 * Scan a window for passes of a body over an observer.
 *
 * @throws InvalidObserverException if the observer is out of range
 */
std::vector<Pass> findPasses(const BodyEphemeris &body, const GeodeticPosition &observer,
                             const TimeWindow &window, const PassSearchOptions &options = {});

/**
 * Scan a window for passes of a body resolved from a position source. When
 * no options are given, the default step for the body's kind is used.
 *
 * @throws UnknownBodyException if the body cannot be resolved
 */
std::vector<Pass> findPasses(const PositionSource &source, const std::string &bodyId,
                             const GeodeticPosition &observer, const TimeWindow &window,
                             const std::optional<PassSearchOptions> &options = std::nullopt);

/**
 * Find the first pass that rises at or after a given time, looking up to
 * horizon ahead. A pass already in progress at that time is skipped.
 */
std::optional<Pass> findNextPass(const BodyEphemeris &body, const GeodeticPosition &observer,
                                 time_point from, const PassSearchOptions &options = {},
                                 std::chrono::hours horizon = NEXT_PASS_HORIZON);

/**
 * Rise, set and transit of a body during one UTC day.
 */
struct RiseSetTimes {
    std::optional<time_point> rise;
    std::optional<time_point> set;
    time_point transit;                     ///< Time of highest elevation during the day
    double transitElevationInDegrees = 0.0;
    bool alwaysUp = false;
    bool alwaysDown = false;

    /**
     * Time between rise and set. 24 hours if always up, zero if always down,
     * empty if the body sets before it rises on this day.
     */
    std::optional<std::chrono::system_clock::duration> dayLength() const;
};

/**
 * Rise and set against a custom horizon on the UTC day containing day.
 */
RiseSetTimes findRiseSet(const BodyEphemeris &body, const GeodeticPosition &observer,
                         time_point day, double horizonInDegrees);

/**
 * Rise and set against the body's standard horizon.
 */
RiseSetTimes findRiseSet(const BodyEphemeris &body, const GeodeticPosition &observer, time_point day);

/**
 * Dawn (rise) and dusk (set) for each twilight definition.
 */
struct TwilightTimes {
    RiseSetTimes civil;
    RiseSetTimes nautical;
    RiseSetTimes astronomical;
};

TwilightTimes findTwilight(const BodyEphemeris &sun, const GeodeticPosition &observer, time_point day);

}

#endif
