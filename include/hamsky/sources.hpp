/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_SOURCES_HPP
#define __HAMSKY_SOURCES_HPP

#include <hamsky/catalog.hpp>
#include <hamsky/position_source.hpp>
#include <hamsky/propagator.hpp>

#include <memory>
#include <string>
#include <vector>

namespace hamsky {

/**
 * Ephemeris of the Sun or Moon from the analytic series in ephemeris.hpp.
 */
class SolarSystemEphemeris : public BodyEphemeris {
public:
    explicit SolarSystemEphemeris(BodyKind kind);

    const std::string& bodyId() const override { return bodyId_; }
    BodyKind kind() const override { return kind_; }
    CartesianVector positionAt(time_point tp) const override;

private:
    BodyKind kind_;
    std::string bodyId_;
};

/**
 * Ephemeris of a satellite, bound to one element set snapshot.
 */
class SatelliteEphemeris : public BodyEphemeris {
public:
    SatelliteEphemeris(std::shared_ptr<const OrbitalElementSet> set,
                       std::shared_ptr<const Propagator> propagator);

    const std::string& bodyId() const override { return bodyId_; }
    BodyKind kind() const override { return BodyKind::Satellite; }
    CartesianVector positionAt(time_point tp) const override;
    std::shared_ptr<const OrbitalElementSet> elementSet() const override { return set_; }

private:
    std::shared_ptr<const OrbitalElementSet> set_;
    std::shared_ptr<const Propagator> propagator_;
    std::string bodyId_;
};

/**
 * Resolves "sun" and "moon" (case-insensitive).
 */
class SolarSystemSource : public PositionSource {
public:
    SolarSystemSource();

    std::shared_ptr<const BodyEphemeris> resolve(const std::string &bodyId) const override;
    bool knows(const std::string &bodyId) const override;
    std::vector<std::string> bodies() const override;

private:
    std::shared_ptr<const BodyEphemeris> sun_;
    std::shared_ptr<const BodyEphemeris> moon_;
};

/**
 * Resolves satellites from an element set catalog, by NORAD ID or name.
 *
 * Each resolve() takes a catalog snapshot, so the returned ephemeris keeps
 * using the element set that was current at the time of the call.
 */
class SatelliteSource : public PositionSource {
public:
    SatelliteSource(const ElementSetCatalog &catalog, std::shared_ptr<const Propagator> propagator);

    std::shared_ptr<const BodyEphemeris> resolve(const std::string &bodyId) const override;
    bool knows(const std::string &bodyId) const override;
    std::vector<std::string> bodies() const override;

private:
    const ElementSetCatalog &catalog_;
    std::shared_ptr<const Propagator> propagator_;
};

/**
 * Routes each body identifier to the first source that knows it.
 */
class CompositeSource : public PositionSource {
public:
    CompositeSource() = default;

    void add(std::shared_ptr<const PositionSource> source);

    std::shared_ptr<const BodyEphemeris> resolve(const std::string &bodyId) const override;
    bool knows(const std::string &bodyId) const override;
    std::vector<std::string> bodies() const override;

private:
    std::vector<std::shared_ptr<const PositionSource>> sources_;
};

}

#endif
