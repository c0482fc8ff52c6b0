/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_POSITION_SOURCE_HPP
#define __HAMSKY_POSITION_SOURCE_HPP

#include <hamsky/types.hpp>
#include <hamsky/elements.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace hamsky {

enum class BodyKind {
    Sun,
    Moon,
    Satellite
};

std::ostream& operator<<(std::ostream &os, const BodyKind &kind);

/**
 * Time-parameterized position of a single body.
 *
 * An ephemeris is immutable once resolved. Satellite ephemerides hold the
 * element set they were resolved with for their whole lifetime, so a
 * catalog refresh never changes the answers of a computation in progress.
 * Implementations must be safe to call from several threads at once.
 */
class BodyEphemeris {
public:
    virtual ~BodyEphemeris() = default;

    virtual const std::string& bodyId() const = 0;

    virtual BodyKind kind() const = 0;

    /**
     * Position of the body at the given instant, in kilometers.
     */
    virtual CartesianVector positionAt(time_point tp) const = 0;

    /**
     * The element set behind this ephemeris, or null for bodies that do not
     * have one.
     */
    virtual std::shared_ptr<const OrbitalElementSet> elementSet() const;

    /**
     * Position wrapped as a sample.
     */
    BodyPositionSample sampleAt(time_point tp) const;
};

/**
 * Resolves body identifiers to ephemerides.
 */
class PositionSource {
public:
    virtual ~PositionSource() = default;

    /**
     * Resolve a body. The returned ephemeris is a snapshot and stays valid
     * after the source is refreshed.
     *
     * @throws UnknownBodyException if the identifier is not known
     */
    virtual std::shared_ptr<const BodyEphemeris> resolve(const std::string &bodyId) const = 0;

    /**
     * Whether resolve() would succeed for this identifier.
     */
    virtual bool knows(const std::string &bodyId) const = 0;

    /**
     * Identifiers of all bodies this source can resolve.
     */
    virtual std::vector<std::string> bodies() const = 0;

    BodyPositionSample positionAt(const std::string &bodyId, time_point tp) const;

    std::shared_ptr<const OrbitalElementSet> elementSetFor(const std::string &bodyId) const;

    BodyKind bodyKind(const std::string &bodyId) const;
};

}

#endif
