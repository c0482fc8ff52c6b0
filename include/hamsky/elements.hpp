/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_ELEMENTS_HPP
#define __HAMSKY_ELEMENTS_HPP

#include <hamsky/types.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace hamsky {

// Element sets older than this should be refreshed
constexpr std::chrono::hours DEFAULT_STALENESS_HORIZON{24};

/**
 * Mean orbital elements as carried by a two-line element set.
 * Angles are in degrees.
 */
struct MeanElements {
    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;                    ///< Revolutions per day
    double firstDerivativeMeanMotion = 0.0;     ///< Half the first derivative, rev/day²
    double secondDerivativeMeanMotion = 0.0;    ///< One sixth the second derivative, rev/day³
    double bstarDragTerm = 0.0;
    int revolutionNumberAtEpoch = 0;
};

/**
 * An immutable, parsed TLE-class element set plus the time it was fetched.
 *
 * Usage:
 *   auto set = OrbitalElementSet::parse(tleText, std::chrono::system_clock::now());
 *   if (set.isStale(now)) { ... }
 */
class OrbitalElementSet {
public:
    /**
     * Parse a two- or three-line element set. A non-empty line before line 1
     * is taken as the name.
     *
     * @throws ElementSetParseException if line 1 or line 2 is missing or malformed
     */
    static OrbitalElementSet parse(std::string_view tle, time_point fetchedAt);

    /**
     * Parse an element set, overriding any embedded name.
     */
    static OrbitalElementSet parse(std::string_view name, std::string_view tle, time_point fetchedAt);

    /** NORAD catalog number as a string, used as the body identifier. */
    std::string bodyId() const;

    const std::string& getName() const { return name_; }
    int getNoradID() const { return noradID_; }
    char getClassification() const { return classification_; }
    const std::string& getDesignator() const { return designator_; }
    time_point getEpoch() const { return epoch_; }
    int getElementSetNumber() const { return elementSetNumber_; }
    const MeanElements& getElements() const { return elements_; }
    const std::string& getLine1() const { return line1_; }
    const std::string& getLine2() const { return line2_; }
    time_point getFetchedAt() const { return fetchedAt_; }

    /**
     * Time elapsed since the set was fetched.
     */
    std::chrono::system_clock::duration age(time_point now) const;

    /**
     * Whether the set is older than the staleness horizon.
     */
    bool isStale(time_point now, std::chrono::system_clock::duration horizon = DEFAULT_STALENESS_HORIZON) const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

    /**
     * Get the 3-line TLE representation.
     */
    std::string getTLE() const;

private:
    OrbitalElementSet() = default;

    std::string name_;
    int noradID_ = 0;
    char classification_ = 'U';
    std::string designator_;
    time_point epoch_;
    int elementSetNumber_ = 0;
    MeanElements elements_;
    std::string line1_;
    std::string line2_;
    time_point fetchedAt_;
};

/**
 * TLE line checksum (mod 10 sum of digits, with '-' counting as 1), computed
 * over the first 68 columns.
 */
int calculateChecksum(std::string_view line);

/**
 * Load element sets from a stream of 2- or 3-line entries. Malformed entries
 * are logged and skipped.
 */
std::vector<OrbitalElementSet> loadElementSets(std::istream &s, time_point fetchedAt);

/**
 * Load element sets from a file. The file's modification time is used as the
 * fetch time. A missing file yields an empty list.
 *
 * @throws std::runtime_error if the file exists but cannot be opened
 */
std::vector<OrbitalElementSet> loadElementSets(const std::string &filepath);

}

#endif
