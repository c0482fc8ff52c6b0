/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_ERRORS_HPP
#define __HAMSKY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace hamsky {

// ============================================================================
// Geometry Exception Classes
// ============================================================================

/**
 * Base exception class for geometry and event prediction errors.
 */
class GeometryException : public std::runtime_error {
public:
    explicit GeometryException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a position source cannot resolve a body identifier.
 */
class UnknownBodyException : public GeometryException {
public:
    explicit UnknownBodyException(const std::string& bodyId)
        : GeometryException("Unknown body: " + bodyId), bodyId_(bodyId) {}

    const std::string& bodyId() const { return bodyId_; }

private:
    std::string bodyId_;
};

/**
 * Exception thrown when an observer location is out of range.
 */
class InvalidObserverException : public GeometryException {
public:
    explicit InvalidObserverException(const std::string& msg) : GeometryException(msg) {}
};

/**
 * Exception thrown when vectors from different reference frames are combined
 * without a transform.
 */
class FrameMismatchException : public GeometryException {
public:
    explicit FrameMismatchException(const std::string& msg) : GeometryException(msg) {}
};

/**
 * Exception thrown when a root search loses its bracket or runs out of
 * iterations. This is distinct from a search that legitimately finds nothing.
 */
class NonConvergenceException : public GeometryException {
public:
    explicit NonConvergenceException(const std::string& msg) : GeometryException(msg) {}
};

/**
 * Exception thrown for a malformed Maidenhead locator.
 */
class InvalidGridSquareException : public GeometryException {
public:
    explicit InvalidGridSquareException(const std::string& locator)
        : GeometryException("Invalid grid square: " + locator) {}
};

/**
 * Exception thrown when TLE text cannot be parsed.
 */
class ElementSetParseException : public GeometryException {
public:
    explicit ElementSetParseException(const std::string& msg) : GeometryException(msg) {}
};

/**
 * Exception thrown when orbital elements cannot be propagated.
 */
class InvalidOrbitException : public GeometryException {
public:
    explicit InvalidOrbitException(const std::string& msg) : GeometryException(msg) {}
};

}

#endif
