/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <hamsky/catalog.hpp>
#include <hamsky/ephemeris.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/propagator.hpp>
#include <hamsky/sources.hpp>
#include <hamsky/time.hpp>
#include <hamsky/track.hpp>
#include <hamsky/transform.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>

namespace hamsky {
namespace {

using namespace std::chrono_literals;

constexpr const char* ISS_TLE =
    "ISS (ZARYA)\n"
    "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993\n"
    "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";

constexpr const char* NOAA19_TLE =
    "NOAA 19\n"
    "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999\n"
    "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

const time_point FETCHED_AT = parseTime("2025-11-30 00:00:00");

// ============================================================================
// solveKepler Tests
// ============================================================================

TEST(SolveKeplerTest, CircularOrbit) {
    EXPECT_NEAR(solveKepler(1.234, 0.0), 1.234, 1e-12);
}

TEST(SolveKeplerTest, SatisfiesKeplersEquation) {
    for (double e : {0.001, 0.1, 0.5, 0.9, 0.99}) {
        for (double M : {0.1, 1.0, 2.5, 3.1, 5.0}) {
            double E = solveKepler(M, e);
            EXPECT_NEAR(E - e * std::sin(E), M, 1e-10) << "e=" << e << " M=" << M;
        }
    }
}

TEST(SolveKeplerTest, WrapsMeanAnomaly) {
    double E1 = solveKepler(1.0, 0.3);
    double E2 = solveKepler(1.0 + 4.0 * M_PI, 0.3);
    EXPECT_NEAR(E1, E2, 1e-10);
}

// ============================================================================
// KeplerPropagator Tests
// ============================================================================

TEST(KeplerPropagatorTest, ISSRadiusAtEpoch) {
    auto iss = OrbitalElementSet::parse(ISS_TLE, FETCHED_AT);
    KeplerPropagator propagator;

    CartesianVector position = propagator.propagate(iss, iss.getEpoch());

    EXPECT_EQ(position.frame, Frame::ECI);
    // Semi-major axis from 15.49 rev/day is about 6797 km
    EXPECT_NEAR(position.position.magnitude(), 6797.0, 10.0);
}

TEST(KeplerPropagatorTest, ISSStaysInLowEarthOrbit) {
    auto iss = OrbitalElementSet::parse(ISS_TLE, FETCHED_AT);
    KeplerPropagator propagator;

    for (int minutes = 0; minutes <= 24 * 60; minutes += 37) {
        time_point t = iss.getEpoch() + std::chrono::minutes(minutes);
        BodyPositionSample sample{"25544", t, propagator.propagate(iss, t)};
        GeodeticPosition point = subPoint(sample);

        EXPECT_GT(point.altInMeters, 380000.0);
        EXPECT_LT(point.altInMeters, 460000.0);
        // Geodetic latitude stays within a fraction of a degree of the inclination
        EXPECT_LE(std::abs(point.latInDegrees), 52.0);
    }
}

TEST(KeplerPropagatorTest, NOAA19IsPolar) {
    auto noaa = OrbitalElementSet::parse(NOAA19_TLE, FETCHED_AT);
    KeplerPropagator propagator;

    double maxLat = 0.0;
    // One orbit is about 102 minutes
    for (int minutes = 0; minutes < 110; ++minutes) {
        time_point t = noaa.getEpoch() + std::chrono::minutes(minutes);
        GeodeticPosition point = subPoint({"33591", t, propagator.propagate(noaa, t)});
        maxLat = std::max(maxLat, std::abs(point.latInDegrees));
    }
    EXPECT_GT(maxLat, 80.0);
}

TEST(KeplerPropagatorTest, OrbitalPeriod) {
    auto iss = OrbitalElementSet::parse(ISS_TLE, FETCHED_AT);
    KeplerPropagator propagator;

    // After one revolution the satellite is back near its starting point in
    // the inertial frame (J2 drift moves it some tens of kilometers)
    auto period = std::chrono::duration<double>(86400.0 / iss.getElements().meanMotion);
    time_point start = iss.getEpoch();
    time_point end = start + std::chrono::duration_cast<std::chrono::system_clock::duration>(period);

    Vec3 p0 = propagator.propagate(iss, start).position;
    Vec3 p1 = propagator.propagate(iss, end).position;
    EXPECT_LT((p1 - p0).magnitude(), 150.0);
}

// ============================================================================
// Sun / Moon Ephemeris Tests
// ============================================================================

TEST(SunPositionTest, DistanceIsAboutOneAU) {
    double perihelion = sunPosition(parseTime("2025-01-04 13:28:00")).position.magnitude();
    double aphelion = sunPosition(parseTime("2025-07-03 19:55:00")).position.magnitude();

    EXPECT_NEAR(perihelion / ASTRONOMICAL_UNIT, 0.98333, 0.0005);
    EXPECT_NEAR(aphelion / ASTRONOMICAL_UNIT, 1.01665, 0.0005);
}

TEST(SunPositionTest, EquinoxAndSolstice) {
    auto equinox = equatorialCoordinates(sunPosition(parseTime("2025-03-20 09:01:00")));
    EXPECT_NEAR(equinox.declinationInDegrees, 0.0, 0.02);
    EXPECT_NEAR(std::min(equinox.rightAscensionInHours, 24.0 - equinox.rightAscensionInHours), 0.0, 0.01);

    auto solstice = equatorialCoordinates(sunPosition(parseTime("2025-06-21 02:42:00")));
    EXPECT_NEAR(solstice.declinationInDegrees, 23.436, 0.02);
    EXPECT_NEAR(solstice.rightAscensionInHours, 6.0, 0.01);
}

TEST(MoonPositionTest, DistanceRange) {
    for (int day = 0; day < 30; ++day) {
        time_point t = parseTime("2025-11-01 00:00:00") + std::chrono::days(day);
        double distance = moonPosition(t).position.magnitude();
        EXPECT_GT(distance, 356000.0);
        EXPECT_LT(distance, 407000.0);
    }
}

TEST(MoonPhaseTest, FullAndNewMoon) {
    // Full moon 2025-11-05 13:19 UTC, new moon 2025-11-20 06:47 UTC
    MoonPhase full = moonPhase(parseTime("2025-11-05 13:19:00"));
    EXPECT_EQ(full.name, "Full Moon");
    EXPECT_GT(full.illuminationPercent, 97.0);

    MoonPhase newMoon = moonPhase(parseTime("2025-11-20 06:47:00"));
    EXPECT_EQ(newMoon.name, "New Moon");
    EXPECT_LT(newMoon.illuminationPercent, 3.0);
}

TEST(MoonPhaseTest, Names) {
    EXPECT_EQ(moonPhaseName(0.0), "New Moon");
    EXPECT_EQ(moonPhaseName(350.0), "New Moon");
    EXPECT_EQ(moonPhaseName(45.0), "Waxing Crescent");
    EXPECT_EQ(moonPhaseName(90.0), "First Quarter");
    EXPECT_EQ(moonPhaseName(135.0), "Waxing Gibbous");
    EXPECT_EQ(moonPhaseName(180.0), "Full Moon");
    EXPECT_EQ(moonPhaseName(225.0), "Waning Gibbous");
    EXPECT_EQ(moonPhaseName(270.0), "Last Quarter");
    EXPECT_EQ(moonPhaseName(315.0), "Waning Crescent");
    EXPECT_EQ(moonPhaseName(-45.0), "Waning Crescent");
}

// ============================================================================
// Position Source Tests
// ============================================================================

class PositionSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.update({OrbitalElementSet::parse(ISS_TLE, FETCHED_AT)});
        source.add(std::make_shared<SolarSystemSource>());
        source.add(std::make_shared<SatelliteSource>(catalog, std::make_shared<KeplerPropagator>()));
    }

    ElementSetCatalog catalog;
    CompositeSource source;
};

TEST_F(PositionSourceTest, ResolvesSolarSystemBodies) {
    auto sun = source.resolve("SUN");
    EXPECT_EQ(sun->bodyId(), "sun");
    EXPECT_EQ(sun->kind(), BodyKind::Sun);
    EXPECT_EQ(sun->elementSet(), nullptr);

    EXPECT_EQ(source.bodyKind("Moon"), BodyKind::Moon);
}

TEST_F(PositionSourceTest, ResolvesSatellitesByIdAndName) {
    auto byId = source.resolve("25544");
    auto byName = source.resolve("iss (zarya)");

    EXPECT_EQ(byId->bodyId(), "25544");
    EXPECT_EQ(byName->bodyId(), "25544");
    EXPECT_EQ(byId->kind(), BodyKind::Satellite);
    ASSERT_NE(byId->elementSet(), nullptr);
    EXPECT_EQ(byId->elementSet()->getFetchedAt(), FETCHED_AT);
}

TEST_F(PositionSourceTest, UnknownBodyThrows) {
    EXPECT_FALSE(source.knows("jupiter"));
    EXPECT_THROW(source.resolve("jupiter"), UnknownBodyException);
    EXPECT_THROW(source.positionAt("33591", FETCHED_AT), UnknownBodyException);

    try {
        source.resolve("jupiter");
        FAIL() << "Expected UnknownBodyException";
    } catch (const UnknownBodyException &e) {
        EXPECT_EQ(e.bodyId(), "jupiter");
    }
}

TEST_F(PositionSourceTest, SampleCarriesIdAndTime) {
    BodyPositionSample sample = source.positionAt("25544", FETCHED_AT);
    EXPECT_EQ(sample.bodyId, "25544");
    EXPECT_EQ(sample.time, FETCHED_AT);
    EXPECT_EQ(sample.position.frame, Frame::ECI);
}

TEST_F(PositionSourceTest, ListsAllBodies) {
    auto bodies = source.bodies();
    ASSERT_EQ(bodies.size(), 3u);
    EXPECT_EQ(bodies[0], "sun");
    EXPECT_EQ(bodies[1], "moon");
    EXPECT_EQ(bodies[2], "25544");
}

TEST_F(PositionSourceTest, ResolvedEphemerisKeepsItsElementSet) {
    auto before = source.resolve("25544");

    // Refresh the catalog with a newer fetch
    catalog.update({OrbitalElementSet::parse(ISS_TLE, FETCHED_AT + 6h)});
    auto after = source.resolve("25544");

    EXPECT_EQ(before->elementSet()->getFetchedAt(), FETCHED_AT);
    EXPECT_EQ(after->elementSet()->getFetchedAt(), FETCHED_AT + 6h);
}

TEST_F(PositionSourceTest, ElementSetForSolarBodyIsNull) {
    EXPECT_EQ(source.elementSetFor("sun"), nullptr);
    EXPECT_NE(source.elementSetFor("25544"), nullptr);
}

TEST(SolarSystemSourceTest, OnlySunAndMoon) {
    SolarSystemSource source;
    EXPECT_TRUE(source.knows("sun"));
    EXPECT_TRUE(source.knows("MOON"));
    EXPECT_FALSE(source.knows("25544"));
    EXPECT_THROW(source.resolve("25544"), UnknownBodyException);
}

TEST(SolarSystemEphemerisTest, RejectsSatelliteKind) {
    EXPECT_THROW(SolarSystemEphemeris(BodyKind::Satellite), std::invalid_argument);
}

}
}
