/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_ENGINE_HPP
#define __HAMSKY_ENGINE_HPP

#include <hamsky/elements.hpp>
#include <hamsky/events.hpp>
#include <hamsky/position_source.hpp>
#include <hamsky/terminator.hpp>
#include <hamsky/track.hpp>
#include <hamsky/types.hpp>

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace hamsky {

/**
 * Attached to results computed from an element set older than the
 * engine's staleness horizon. The result is still usable.
 */
struct StalenessWarning {
    std::string bodyId;
    time_point fetchedAt;
    std::chrono::system_clock::duration age;
    std::chrono::system_clock::duration horizon;
};

/**
 * A result plus the staleness of the data it was computed from.
 */
template <typename T>
struct Annotated {
    T value;
    std::optional<StalenessWarning> staleness;

    bool isStale() const { return staleness.has_value(); }
};

/**
 * Runs observer geometry and event searches on a worker pool.
 *
 * Each call resolves its body from the position source and validates the
 * observer before returning, so unknown bodies and invalid observers throw
 * immediately. The computation itself runs on the pool; anything it throws
 * is rethrown by the returned future's get().
 *
 * Usage:
 *   GeometryEngine engine(source, 4);
 *   auto passes = engine.findPasses("25544", observer, {start, end}).get();
 *   if (passes.isStale()) { ... }
 */
class GeometryEngine {
public:
    GeometryEngine(const PositionSource &source, std::size_t workerThreads,
                   std::chrono::system_clock::duration stalenessHorizon = DEFAULT_STALENESS_HORIZON);

    /**
     * Waits for submitted work to finish before stopping the workers.
     */
    ~GeometryEngine();

    // Non-copyable, non-movable (owns a thread pool)
    GeometryEngine(const GeometryEngine&) = delete;
    GeometryEngine& operator=(const GeometryEngine&) = delete;
    GeometryEngine(GeometryEngine&&) = delete;
    GeometryEngine& operator=(GeometryEngine&&) = delete;

    std::future<Annotated<TopocentricFix>> observe(const std::string &bodyId,
                                                   const GeodeticPosition &observer, time_point tp);

    /**
     * Search for passes. Without options the defaults for the body's kind are used.
     */
    std::future<Annotated<std::vector<Pass>>> findPasses(
        const std::string &bodyId, const GeodeticPosition &observer, const TimeWindow &window,
        const std::optional<PassSearchOptions> &options = std::nullopt);

    std::future<Annotated<std::optional<Pass>>> findNextPass(
        const std::string &bodyId, const GeodeticPosition &observer, time_point from,
        const std::optional<PassSearchOptions> &options = std::nullopt);

    /**
     * Rise, set and transit of a body on the UTC day containing the given time,
     * using the body's standard horizon.
     */
    std::future<Annotated<RiseSetTimes>> riseSet(const std::string &bodyId,
                                                 const GeodeticPosition &observer, time_point day);

    /**
     * Civil, nautical and astronomical dawn and dusk using the source's "sun" body.
     */
    std::future<TwilightTimes> twilight(const GeodeticPosition &observer, time_point day);

    /**
     * Trace the day/night boundary using the source's "sun" body.
     */
    std::future<TerminatorPolyline> traceTerminator(time_point tp, int numPoints = 360);

    std::future<Annotated<std::vector<TrackPoint>>> groundTrack(
        const std::string &bodyId, time_point start,
        std::chrono::system_clock::duration duration, int numPoints);

    /**
     * Check the body's element set against the staleness horizon.
     * Logs a warning when it is stale.
     */
    std::optional<StalenessWarning> checkStaleness(const BodyEphemeris &body, time_point now) const;

    std::chrono::system_clock::duration getStalenessHorizon() const { return stalenessHorizon_; }

private:
    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F &&f) {
        using Result = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        auto future = task->get_future();
        asio::post(pool_, [task]() { (*task)(); });
        return future;
    }

    const PositionSource &source_;
    std::chrono::system_clock::duration stalenessHorizon_;
    asio::thread_pool pool_;
};

}

#endif
