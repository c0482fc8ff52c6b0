/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/events.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/observer.hpp>
#include <hamsky/time.hpp>
#include <hamsky/transform.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using spdlog::debug;

namespace hamsky {

using namespace std::chrono_literals;
using std::chrono::duration_cast;
using clock_duration = std::chrono::system_clock::duration;

std::ostream& operator<<(std::ostream &os, const PassEventKind &kind) {
    switch (kind) {
        case PassEventKind::Rise:
            os << "RISE";
            break;
        case PassEventKind::Culminate:
            os << "CULMINATE";
            break;
        case PassEventKind::Set:
            os << "SET";
            break;
    }
    return os;
}

std::chrono::seconds defaultSearchStep(BodyKind kind) {
    return kind == BodyKind::Satellite ? std::chrono::seconds(60) : std::chrono::seconds(300);
}

PassSearchOptions defaultSearchOptions(BodyKind kind, double minElevationInDegrees) {
    PassSearchOptions options;
    options.minElevationInDegrees = minElevationInDegrees;
    options.step = defaultSearchStep(kind);
    return options;
}

double standardHorizon(BodyKind kind) {
    switch (kind) {
        case BodyKind::Sun:
            return SUN_HORIZON_DEGREES;
        case BodyKind::Moon:
            return MOON_HORIZON_DEGREES;
        default:
            return 0.0;
    }
}

// Binary search for the time the elevation crosses the threshold
time_point bisectCrossing(const ElevationFunction &elevation, double threshold,
                          time_point low, time_point high, bool rising,
                          const PassSearchOptions &options) {
    bool lowAbove = elevation(low) >= threshold;
    bool highAbove = elevation(high) >= threshold;
    if (high <= low || lowAbove == highAbove || highAbove != rising) {
        throw NonConvergenceException(fmt::format(
            "Elevation threshold {} is not bracketed between {} and {}",
            threshold, formatTime(low), formatTime(high)));
    }

    int iterations = 0;
    while (high - low > options.tolerance) {
        if (iterations++ >= options.maxIterations) {
            throw NonConvergenceException(fmt::format(
                "Crossing search did not reach {} ms within {} iterations",
                options.tolerance.count(), options.maxIterations));
        }

        time_point mid = low + (high - low) / 2;
        bool above = elevation(mid) >= threshold;

        // Rising: the crossing is before an above-threshold midpoint
        // Setting: the crossing is after an above-threshold midpoint
        if (above == rising) {
            high = mid;
        } else {
            low = mid;
        }
    }

    return rising ? high : low;
}

// Golden section search for the time of maximum elevation
time_point findMaximum(const ElevationFunction &elevation, time_point low, time_point high,
                       std::chrono::milliseconds tolerance) {
    constexpr double PHI = 1.618033988749895;  // Golden ratio
    constexpr double RESPHI = 2.0 - PHI;       // 1/phi²
    constexpr int MAX_ITERATIONS = 200;

    if (high <= low) {
        return low;
    }

    auto span = high - low;
    time_point x1 = low + duration_cast<clock_duration>(span * RESPHI);
    time_point x2 = high - duration_cast<clock_duration>(span * RESPHI);

    double f1 = elevation(x1);
    double f2 = elevation(x2);

    for (int i = 0; i < MAX_ITERATIONS && high - low > tolerance; ++i) {
        if (f1 > f2) {
            high = x2;
            x2 = x1;
            f2 = f1;
            span = high - low;
            x1 = low + duration_cast<clock_duration>(span * RESPHI);
            f1 = elevation(x1);
        } else {
            low = x1;
            x1 = x2;
            f1 = f2;
            span = high - low;
            x2 = high - duration_cast<clock_duration>(span * RESPHI);
            f2 = elevation(x2);
        }
    }

    return low + (high - low) / 2;
}

namespace {

PassEvent makeEvent(PassEventKind kind, const TopocentricFix &fix) {
    return {kind, fix.time, fix.elevationInDegrees, fix.azimuthInDegrees};
}

// Fill in culmination, maximum elevation and the partial flag of a closed pass
void finishPass(Pass &pass, time_point bestTime, double bestElevation,
                const LookFunction &look, const ElevationFunction &elevation,
                const PassSearchOptions &options) {
    time_point low = std::max(pass.start, bestTime - options.step);
    time_point high = std::min(pass.end, bestTime + options.step);

    time_point peak = findMaximum(elevation, low, high, options.tolerance);
    TopocentricFix peakFix = look(peak);
    if (bestElevation > peakFix.elevationInDegrees) {
        peakFix = look(bestTime);
    }

    double startElevation = pass.rise ? pass.rise->elevationInDegrees : elevation(pass.start);
    double endElevation = pass.set ? pass.set->elevationInDegrees : elevation(pass.end);

    pass.maxElevationInDegrees = std::max({peakFix.elevationInDegrees, startElevation, endElevation});

    // Only a true local maximum strictly inside the pass counts as a culmination
    bool interior = peakFix.time - pass.start > options.tolerance
                 && pass.end - peakFix.time > options.tolerance;
    bool localMaximum = peakFix.elevationInDegrees > startElevation
                     && peakFix.elevationInDegrees > endElevation;
    if (interior && localMaximum) {
        pass.culminate = makeEvent(PassEventKind::Culminate, peakFix);
    }

    pass.partial = !pass.rise || !pass.set;
}

}

std::vector<Pass> findPasses(const LookFunction &look, const TimeWindow &window,
                             const PassSearchOptions &options) {
    if (window.end <= window.start) {
        throw std::invalid_argument("Search window must end after it starts");
    }
    if (options.step <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Search step must be positive");
    }

    ElevationFunction elevation = [&look](time_point t) {
        return look(t).elevationInDegrees;
    };

    const double threshold = options.minElevationInDegrees;
    std::vector<Pass> passes;
    Pass current;

    time_point previousTime = window.start;
    double previousElevation = elevation(previousTime);
    bool inPass = previousElevation >= threshold;
    time_point bestTime = previousTime;
    double bestElevation = previousElevation;
    int samples = 1;

    if (inPass) {
        // Already up when the window opens
        current.start = window.start;
    }

    while (previousTime < window.end) {
        time_point t = std::min<time_point>(previousTime + options.step, window.end);
        double e = elevation(t);
        ++samples;

        if (!inPass && e >= threshold) {
            time_point rise = bisectCrossing(elevation, threshold, previousTime, t, true, options);
            current = Pass{};
            current.rise = makeEvent(PassEventKind::Rise, look(rise));
            current.start = rise;
            bestTime = t;
            bestElevation = e;
            inPass = true;
        } else if (inPass && e < threshold) {
            time_point set = bisectCrossing(elevation, threshold, previousTime, t, false, options);
            inPass = false;
            if (current.rise && set <= current.rise->time) {
                // Spike narrower than the bisection tolerance
                debug("Dropping pass with no duration at {}", formatTime(set));
                previousTime = t;
                continue;
            }
            current.set = makeEvent(PassEventKind::Set, look(set));
            current.end = set;
            finishPass(current, bestTime, bestElevation, look, elevation, options);
            passes.push_back(current);
        } else if (inPass && e > bestElevation) {
            bestTime = t;
            bestElevation = e;
        }

        previousTime = t;
    }

    if (inPass) {
        // Still up when the window closes
        current.end = window.end;
        finishPass(current, bestTime, bestElevation, look, elevation, options);
        passes.push_back(current);
    }

    debug("Scanned {} samples, found {} passes", samples, passes.size());
    return passes;
}

std::vector<Pass> findPasses(const BodyEphemeris &body, const GeodeticPosition &observer,
                             const TimeWindow &window, const PassSearchOptions &options) {
    validateObserver(observer);

    LookFunction look = [&body, &observer](time_point t) {
        return observeUnchecked(observer, body.positionAt(t), t);
    };

    auto passes = findPasses(look, window, options);
    for (auto &pass : passes) {
        pass.bodyId = body.bodyId();
    }
    debug("Found {} passes of {} between {} and {}", passes.size(), body.bodyId(),
          formatTime(window.start), formatTime(window.end));
    return passes;
}

std::vector<Pass> findPasses(const PositionSource &source, const std::string &bodyId,
                             const GeodeticPosition &observer, const TimeWindow &window,
                             const std::optional<PassSearchOptions> &options) {
    validateObserver(observer);
    auto body = source.resolve(bodyId);
    return findPasses(*body, observer, window, options.value_or(defaultSearchOptions(body->kind())));
}

std::optional<Pass> findNextPass(const BodyEphemeris &body, const GeodeticPosition &observer,
                                 time_point from, const PassSearchOptions &options,
                                 std::chrono::hours horizon) {
    auto passes = findPasses(body, observer, {from, from + horizon}, options);
    for (auto &pass : passes) {
        if (pass.rise) {
            return pass;
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::system_clock::duration> RiseSetTimes::dayLength() const {
    if (alwaysUp) {
        return std::chrono::hours(24);
    }
    if (alwaysDown) {
        return clock_duration::zero();
    }
    if (rise && set && *set > *rise) {
        return *set - *rise;
    }
    return std::nullopt;
}

RiseSetTimes findRiseSet(const BodyEphemeris &body, const GeodeticPosition &observer,
                         time_point day, double horizonInDegrees) {
    validateObserver(observer);

    time_point dayStart = startOfDay(day);
    TimeWindow window{dayStart, dayStart + std::chrono::hours(24)};
    PassSearchOptions options = defaultSearchOptions(body.kind(), horizonInDegrees);

    auto passes = findPasses(body, observer, window, options);

    RiseSetTimes result;
    for (const auto &pass : passes) {
        if (pass.rise && !result.rise) {
            result.rise = pass.rise->time;
        }
        if (pass.set && !result.set) {
            result.set = pass.set->time;
        }
    }
    result.alwaysDown = passes.empty();
    result.alwaysUp = passes.size() == 1 && !passes.front().rise && !passes.front().set;

    // Transit is the day's highest point, whether or not the body is up
    ElevationFunction elevation = [&body, &observer](time_point t) {
        return observeUnchecked(observer, body.positionAt(t), t).elevationInDegrees;
    };
    time_point bestTime = window.start;
    double bestElevation = elevation(bestTime);
    for (time_point t = window.start + options.step; t <= window.end; t += options.step) {
        double e = elevation(t);
        if (e > bestElevation) {
            bestTime = t;
            bestElevation = e;
        }
    }
    time_point low = std::max(window.start, bestTime - options.step);
    time_point high = std::min(window.end, bestTime + options.step);
    result.transit = findMaximum(elevation, low, high, options.tolerance);
    result.transitElevationInDegrees = elevation(result.transit);

    return result;
}

RiseSetTimes findRiseSet(const BodyEphemeris &body, const GeodeticPosition &observer, time_point day) {
    return findRiseSet(body, observer, day, standardHorizon(body.kind()));
}

TwilightTimes findTwilight(const BodyEphemeris &sun, const GeodeticPosition &observer, time_point day) {
    return {
        findRiseSet(sun, observer, day, CIVIL_TWILIGHT_DEGREES),
        findRiseSet(sun, observer, day, NAUTICAL_TWILIGHT_DEGREES),
        findRiseSet(sun, observer, day, ASTRONOMICAL_TWILIGHT_DEGREES)
    };
}

}
