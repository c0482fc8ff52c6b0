/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <hamsky/ephemeris.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/sources.hpp>
#include <hamsky/terminator.hpp>
#include <hamsky/time.hpp>
#include <hamsky/track.hpp>
#include <hamsky/transform.hpp>

#include <chrono>
#include <cmath>
#include <string>

namespace hamsky {
namespace {

using namespace std::chrono_literals;

const time_point SOLSTICE_NOON = parseTime("2025-06-21 12:00:00");

// Sun pinned above a point on the equator, in the earth-fixed frame
class PinnedSun : public BodyEphemeris {
public:
    explicit PinnedSun(double lonInDegrees) {
        double lon = lonInDegrees * DEGREES_TO_RADIANS;
        position_ = {ASTRONOMICAL_UNIT * std::cos(lon), ASTRONOMICAL_UNIT * std::sin(lon), 0.0};
    }

    const std::string& bodyId() const override { return id_; }
    BodyKind kind() const override { return BodyKind::Sun; }
    CartesianVector positionAt(time_point) const override { return {Frame::ECEF, position_}; }

private:
    std::string id_ = "sun";
    Vec3 position_;
};

// ============================================================================
// subSolarPoint Tests
// ============================================================================

TEST(SubSolarPointTest, JuneSolstice) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    GeodeticPosition point = subSolarPoint(sun, SOLSTICE_NOON);

    EXPECT_NEAR(point.latInDegrees, 23.44, 0.02);
    // Solar noon at Greenwich is about two minutes after 12:00 UTC
    EXPECT_NEAR(point.lonInDegrees, 0.5, 1.0);
}

TEST(SubSolarPointTest, DecemberSolstice) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    GeodeticPosition point = subSolarPoint(sun, parseTime("2025-12-21 15:03:00"));
    EXPECT_NEAR(point.latInDegrees, -23.44, 0.02);
}

TEST(SolarElevationTest, ZenithAtSubSolarPoint) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    CartesianVector position = sun.positionAt(SOLSTICE_NOON);
    GeodeticPosition point = subSolarPoint(sun, SOLSTICE_NOON);

    // Geocentric and geodetic latitude differ by a fraction of a degree at 23 degrees
    double elevation = solarElevation(position, point.latInDegrees, point.lonInDegrees, SOLSTICE_NOON);
    EXPECT_GT(elevation, 89.5);
}

// ============================================================================
// traceTerminator Tests
// ============================================================================

TEST(TraceTerminatorTest, TooFewPointsThrows) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    EXPECT_THROW(traceTerminator(sun, SOLSTICE_NOON, 1), std::invalid_argument);
    EXPECT_THROW(traceTerminator(sun, SOLSTICE_NOON, 0), std::invalid_argument);
}

TEST(TraceTerminatorTest, EvenlySpacedLongitudes) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    auto polyline = traceTerminator(sun, SOLSTICE_NOON, 72);

    ASSERT_EQ(polyline.points.size(), 72u);
    EXPECT_EQ(polyline.time, SOLSTICE_NOON);
    EXPECT_DOUBLE_EQ(polyline.stepInDegrees, 5.0);
    for (std::size_t i = 0; i < polyline.points.size(); ++i) {
        EXPECT_DOUBLE_EQ(polyline.points[i].lonInDegrees, -180.0 + 5.0 * static_cast<double>(i));
    }
    EXPECT_LT(polyline.points.back().lonInDegrees, 180.0);
}

TEST(TraceTerminatorTest, PointsLieOnTheHorizon) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    CartesianVector position = sun.positionAt(SOLSTICE_NOON);
    auto polyline = traceTerminator(sun, SOLSTICE_NOON);

    ASSERT_EQ(polyline.points.size(), 360u);
    for (const auto &point : polyline.points) {
        // Every meridian crosses the terminator at the solstice
        ASSERT_TRUE(point.bracketed);
        EXPECT_GE(point.latInDegrees, -90.0);
        EXPECT_LE(point.latInDegrees, 90.0);
        double elevation = solarElevation(position, point.latInDegrees, point.lonInDegrees, SOLSTICE_NOON);
        EXPECT_NEAR(elevation, 0.0, 1e-3);
    }
}

TEST(TraceTerminatorTest, SolsticeShape) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    auto polyline = traceTerminator(sun, SOLSTICE_NOON);

    // Midnight meridian: the terminator reaches the Arctic circle
    EXPECT_NEAR(polyline.points[0].latInDegrees, 66.56, 0.6);
    // Noon meridian: the terminator reaches the Antarctic circle
    EXPECT_NEAR(polyline.points[180].latInDegrees, -66.56, 0.6);
}

TEST(TraceTerminatorTest, UnbracketedMeridiansWalkNorth) {
    PinnedSun sun(0.0);
    auto polyline = traceTerminator(sun, SOLSTICE_NOON, 4);

    ASSERT_EQ(polyline.points.size(), 4u);

    // On the noon meridian the Sun is up in the middle and down at both poles
    const auto &noon = polyline.points[2];
    EXPECT_DOUBLE_EQ(noon.lonInDegrees, 0.0);
    EXPECT_FALSE(noon.bracketed);
    EXPECT_NEAR(noon.latInDegrees, 90.0, 1e-3);
}

TEST(TraceTerminatorTest, SunOverPoleGivesEquator) {
    class PolarSun : public BodyEphemeris {
    public:
        const std::string& bodyId() const override { return id_; }
        BodyKind kind() const override { return BodyKind::Sun; }
        CartesianVector positionAt(time_point) const override {
            return {Frame::ECEF, {0.0, 0.0, ASTRONOMICAL_UNIT}};
        }
    private:
        std::string id_ = "sun";
    };

    PolarSun sun;
    auto polyline = traceTerminator(sun, SOLSTICE_NOON, 8);

    for (const auto &point : polyline.points) {
        EXPECT_TRUE(point.bracketed);
        EXPECT_NEAR(point.latInDegrees, 0.0, 0.01);
    }
}

// ============================================================================
// groundTrack Tests
// ============================================================================

TEST(GroundTrackTest, IncludesBothEnds) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    auto track = groundTrack(sun, SOLSTICE_NOON, 6h, 7);

    ASSERT_EQ(track.size(), 7u);
    EXPECT_EQ(track.front().time, SOLSTICE_NOON);
    EXPECT_EQ(track.back().time, SOLSTICE_NOON + 6h);
    for (std::size_t i = 1; i < track.size(); ++i) {
        EXPECT_EQ(track[i].time - track[i - 1].time, std::chrono::system_clock::duration(1h));
    }
}

TEST(GroundTrackTest, SunMovesWest) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    auto track = groundTrack(sun, SOLSTICE_NOON, 2h, 3);

    // The sub-solar point moves 15 degrees west per hour
    EXPECT_NEAR(normalizeLongitude(track[1].position.lonInDegrees - track[0].position.lonInDegrees), -15.0, 0.1);
    EXPECT_NEAR(normalizeLongitude(track[2].position.lonInDegrees - track[1].position.lonInDegrees), -15.0, 0.1);
}

TEST(GroundTrackTest, InvalidArgumentsThrow) {
    SolarSystemEphemeris sun(BodyKind::Sun);
    EXPECT_THROW(groundTrack(sun, SOLSTICE_NOON, 1h, 1), std::invalid_argument);
    EXPECT_THROW(groundTrack(sun, SOLSTICE_NOON, 0h, 10), std::invalid_argument);
}

TEST(SubPointTest, EquatorialSample) {
    BodyPositionSample sample{"test", SOLSTICE_NOON, {Frame::ECEF, {WGS84_A + 400.0, 0.0, 0.0}}};
    GeodeticPosition point = subPoint(sample);

    EXPECT_NEAR(point.latInDegrees, 0.0, 1e-9);
    EXPECT_NEAR(point.lonInDegrees, 0.0, 1e-9);
    EXPECT_NEAR(point.altInMeters, 400000.0, 1e-3);
}

}
}
