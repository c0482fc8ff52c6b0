/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/engine.hpp>
#include <hamsky/observer.hpp>
#include <hamsky/time.hpp>
#include <hamsky/transform.hpp>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::warn;

namespace hamsky {

GeometryEngine::GeometryEngine(const PositionSource &source, std::size_t workerThreads,
                               std::chrono::system_clock::duration stalenessHorizon)
    : source_(source), stalenessHorizon_(stalenessHorizon), pool_(workerThreads) {
    debug("Geometry engine started with {} worker threads", workerThreads);
}

GeometryEngine::~GeometryEngine() {
    pool_.join();
}

std::optional<StalenessWarning> GeometryEngine::checkStaleness(const BodyEphemeris &body, time_point now) const {
    auto set = body.elementSet();
    if (!set || !set->isStale(now, stalenessHorizon_)) {
        return std::nullopt;
    }

    auto age = set->age(now);
    warn("Element set for {} was fetched {} hours ago ({}), results may be inaccurate",
         body.bodyId(), std::chrono::duration_cast<std::chrono::hours>(age).count(),
         formatTime(set->getFetchedAt()));
    return StalenessWarning{body.bodyId(), set->getFetchedAt(), age, stalenessHorizon_};
}

std::future<Annotated<TopocentricFix>> GeometryEngine::observe(const std::string &bodyId,
                                                               const GeodeticPosition &observer,
                                                               time_point tp) {
    validateObserver(observer);
    auto body = source_.resolve(bodyId);
    auto staleness = checkStaleness(*body, std::chrono::system_clock::now());

    return submit([body, observer, tp, staleness]() {
        return Annotated<TopocentricFix>{hamsky::observe(observer, body->sampleAt(tp)), staleness};
    });
}

std::future<Annotated<std::vector<Pass>>> GeometryEngine::findPasses(
    const std::string &bodyId, const GeodeticPosition &observer, const TimeWindow &window,
    const std::optional<PassSearchOptions> &options) {
    validateObserver(observer);
    auto body = source_.resolve(bodyId);
    auto staleness = checkStaleness(*body, std::chrono::system_clock::now());
    PassSearchOptions searchOptions = options.value_or(defaultSearchOptions(body->kind()));

    debug("Queueing pass search for {} from {} to {}", bodyId,
          formatTime(window.start), formatTime(window.end));
    return submit([body, observer, window, searchOptions, staleness]() {
        return Annotated<std::vector<Pass>>{
            hamsky::findPasses(*body, observer, window, searchOptions), staleness};
    });
}

std::future<Annotated<std::optional<Pass>>> GeometryEngine::findNextPass(
    const std::string &bodyId, const GeodeticPosition &observer, time_point from,
    const std::optional<PassSearchOptions> &options) {
    validateObserver(observer);
    auto body = source_.resolve(bodyId);
    auto staleness = checkStaleness(*body, std::chrono::system_clock::now());
    PassSearchOptions searchOptions = options.value_or(defaultSearchOptions(body->kind()));

    return submit([body, observer, from, searchOptions, staleness]() {
        return Annotated<std::optional<Pass>>{
            hamsky::findNextPass(*body, observer, from, searchOptions), staleness};
    });
}

std::future<Annotated<RiseSetTimes>> GeometryEngine::riseSet(const std::string &bodyId,
                                                             const GeodeticPosition &observer,
                                                             time_point day) {
    validateObserver(observer);
    auto body = source_.resolve(bodyId);
    auto staleness = checkStaleness(*body, std::chrono::system_clock::now());

    return submit([body, observer, day, staleness]() {
        return Annotated<RiseSetTimes>{hamsky::findRiseSet(*body, observer, day), staleness};
    });
}

std::future<TwilightTimes> GeometryEngine::twilight(const GeodeticPosition &observer, time_point day) {
    validateObserver(observer);
    auto sun = source_.resolve("sun");

    return submit([sun, observer, day]() {
        return findTwilight(*sun, observer, day);
    });
}

std::future<TerminatorPolyline> GeometryEngine::traceTerminator(time_point tp, int numPoints) {
    auto sun = source_.resolve("sun");

    return submit([sun, tp, numPoints]() {
        return hamsky::traceTerminator(*sun, tp, numPoints);
    });
}

std::future<Annotated<std::vector<TrackPoint>>> GeometryEngine::groundTrack(
    const std::string &bodyId, time_point start,
    std::chrono::system_clock::duration duration, int numPoints) {
    auto body = source_.resolve(bodyId);
    auto staleness = checkStaleness(*body, std::chrono::system_clock::now());

    return submit([body, start, duration, numPoints, staleness]() {
        return Annotated<std::vector<TrackPoint>>{
            hamsky::groundTrack(*body, start, duration, numPoints), staleness};
    });
}

}
