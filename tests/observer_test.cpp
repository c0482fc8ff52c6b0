/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <hamsky/errors.hpp>
#include <hamsky/observer.hpp>
#include <hamsky/time.hpp>
#include <hamsky/transform.hpp>

#include <cmath>
#include <vector>

namespace hamsky {
namespace {

const time_point TEST_TIME = parseTime("2025-06-21 12:00:00");

// ============================================================================
// toENU Tests
// ============================================================================

TEST(ToENUTest, TargetDirectlyAbove) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    CartesianVector target{Frame::ECEF, {6378.137 + 400.0, 0.0, 0.0}};

    Vec3 enu = toENU(observer, target, TEST_TIME);

    EXPECT_NEAR(enu.x, 0.0, 1e-6);   // East
    EXPECT_NEAR(enu.y, 0.0, 1e-6);   // North
    EXPECT_NEAR(enu.z, 400.0, 1e-6); // Up
}

TEST(ToENUTest, TargetToEast) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    CartesianVector target{Frame::ECEF, {6378.137, 500.0, 0.0}};

    Vec3 enu = toENU(observer, target, TEST_TIME);

    EXPECT_NEAR(enu.x, 500.0, 1e-6);
    EXPECT_NEAR(enu.y, 0.0, 1e-6);
}

TEST(ToENUTest, TargetToNorth) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    CartesianVector target{Frame::ECEF, {6378.137, 0.0, 500.0}};

    Vec3 enu = toENU(observer, target, TEST_TIME);

    EXPECT_NEAR(enu.x, 0.0, 1e-6);
    EXPECT_NEAR(enu.y, 500.0, 1e-6);
}

TEST(ToENUTest, RangePreservation) {
    GeodeticPosition observer{28.6, 57.3, 100000.0};
    CartesianVector target{Frame::ECEF, {7000.0, 1000.0, 2000.0}};

    double rangeECEF = target.relativeTo(geodeticToECEF(observer)).magnitude();
    double rangeENU = toENU(observer, target, TEST_TIME).magnitude();

    EXPECT_NEAR(rangeENU, rangeECEF, 1e-9);
}

TEST(ToENUTest, InertialTargetMatchesEarthFixedTarget) {
    GeodeticPosition observer{40.0, -75.0, 50.0};
    CartesianVector ecef{Frame::ECEF, {1200.0, -4800.0, 4600.0}};
    CartesianVector eci = ecefToECI(ecef, TEST_TIME);

    Vec3 fromECEF = toENU(observer, ecef, TEST_TIME);
    Vec3 fromECI = toENU(observer, eci, TEST_TIME);

    EXPECT_NEAR(fromECI.x, fromECEF.x, 1e-6);
    EXPECT_NEAR(fromECI.y, fromECEF.y, 1e-6);
    EXPECT_NEAR(fromECI.z, fromECEF.z, 1e-6);
}

// ============================================================================
// observe Tests
// ============================================================================

TEST(ObserveTest, OverheadIsNinetyNotNaN) {
    std::vector<GeodeticPosition> observers = {
        {0.0, 0.0, 0.0},
        {45.0, -120.0, 1500.0},
        {-70.0, 33.0, 0.0},
        {90.0, 0.0, 0.0},
    };

    for (const auto &observer : observers) {
        GeodeticPosition above = observer;
        above.altInMeters += 400000.0;
        TopocentricFix fix = observe(observer, geodeticToECEF(above), TEST_TIME);

        EXPECT_FALSE(std::isnan(fix.elevationInDegrees));
        EXPECT_FALSE(std::isnan(fix.azimuthInDegrees));
        EXPECT_NEAR(fix.elevationInDegrees, 90.0, 1e-4);
        EXPECT_NEAR(fix.rangeInKilometers, 400.0, 1e-6);
    }
}

TEST(ObserveTest, CoincidentTargetIsDegenerate) {
    GeodeticPosition observer{51.5, -0.1, 20.0};
    TopocentricFix fix = observe(observer, geodeticToECEF(observer), TEST_TIME);

    EXPECT_DOUBLE_EQ(fix.elevationInDegrees, 90.0);
    EXPECT_DOUBLE_EQ(fix.azimuthInDegrees, 0.0);
    EXPECT_LT(fix.rangeInKilometers, DEGENERATE_RANGE);
}

TEST(ObserveTest, AzimuthNorth) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    TopocentricFix fix = observe(observer, {Frame::ECEF, {6378.137, 0.0, 1000.0}}, TEST_TIME);
    EXPECT_NEAR(fix.azimuthInDegrees, 0.0, 1e-6);
}

TEST(ObserveTest, AzimuthEast) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    TopocentricFix fix = observe(observer, {Frame::ECEF, {6378.137, 1000.0, 0.0}}, TEST_TIME);
    EXPECT_NEAR(fix.azimuthInDegrees, 90.0, 1e-6);
    EXPECT_NEAR(fix.elevationInDegrees, 0.0, 1e-6);
}

TEST(ObserveTest, AzimuthWestIsNormalized) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    TopocentricFix fix = observe(observer, {Frame::ECEF, {6378.137, -1000.0, 0.0}}, TEST_TIME);
    EXPECT_NEAR(fix.azimuthInDegrees, 270.0, 1e-6);
}

TEST(ObserveTest, AnglesInValidRange) {
    GeodeticPosition observer{28.6, 57.3, 0.0};
    std::vector<Vec3> targets = {
        {7000.0, 1000.0, 500.0},
        {-7000.0, 1000.0, -500.0},
        {1000.0, -7000.0, 500.0},
        {1000.0, 1000.0, 7000.0},
    };

    for (const auto &target : targets) {
        TopocentricFix fix = observe(observer, {Frame::ECEF, target}, TEST_TIME);
        EXPECT_GE(fix.azimuthInDegrees, 0.0);
        EXPECT_LT(fix.azimuthInDegrees, 360.0);
        EXPECT_GE(fix.elevationInDegrees, -90.0);
        EXPECT_LE(fix.elevationInDegrees, 90.0);
        EXPECT_GT(fix.rangeInKilometers, 0.0);
    }
}

TEST(ObserveTest, SampleCarriesTime) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    BodyPositionSample sample{"test", TEST_TIME, {Frame::ECEF, {7000.0, 0.0, 0.0}}};
    TopocentricFix fix = observe(observer, sample);
    EXPECT_EQ(fix.time, TEST_TIME);
    EXPECT_NEAR(fix.elevationInDegrees, 90.0, 1e-6);
}

TEST(ObserveTest, BelowHorizonForFarSide) {
    GeodeticPosition observer{0.0, 0.0, 0.0};
    TopocentricFix fix = observe(observer, {Frame::ECEF, {-7000.0, 0.0, 0.0}}, TEST_TIME);
    EXPECT_NEAR(fix.elevationInDegrees, -90.0, 1e-6);
}

TEST(ObserveTest, RejectsInvalidObserver) {
    CartesianVector target{Frame::ECEF, {7000.0, 0.0, 0.0}};

    EXPECT_THROW(observe({135.0, 0.0, 0.0}, target, TEST_TIME), InvalidObserverException);
    EXPECT_THROW(observe({0.0, 270.0, 0.0}, target, TEST_TIME), InvalidObserverException);
    EXPECT_THROW(observe({0.0, 0.0, -5000.0}, target, TEST_TIME), InvalidObserverException);
    EXPECT_THROW(observe({NAN, 0.0, 0.0}, {"test", TEST_TIME, target}), InvalidObserverException);
}

TEST(ObserveTest, UncheckedMatchesChecked) {
    GeodeticPosition observer{28.6, 57.3, 0.0};
    CartesianVector target{Frame::ECEF, {7000.0, 1000.0, 500.0}};

    TopocentricFix checked = observe(observer, target, TEST_TIME);
    TopocentricFix unchecked = observeUnchecked(observer, target, TEST_TIME);
    EXPECT_DOUBLE_EQ(checked.azimuthInDegrees, unchecked.azimuthInDegrees);
    EXPECT_DOUBLE_EQ(checked.elevationInDegrees, unchecked.elevationInDegrees);
    EXPECT_DOUBLE_EQ(checked.rangeInKilometers, unchecked.rangeInKilometers);
}

// ============================================================================
// isVisible Tests
// ============================================================================

TEST(IsVisibleTest, AboveThreshold) {
    TopocentricFix fix{0.0, 11.5, 1000.0, TEST_TIME};
    EXPECT_TRUE(isVisible(fix, 5.7));
}

TEST(IsVisibleTest, BelowThreshold) {
    TopocentricFix fix{0.0, 2.9, 1000.0, TEST_TIME};
    EXPECT_FALSE(isVisible(fix, 5.7));
}

TEST(IsVisibleTest, ExactlyAtThreshold) {
    TopocentricFix fix{0.0, 10.0, 1000.0, TEST_TIME};
    EXPECT_TRUE(isVisible(fix, 10.0));
}

TEST(IsVisibleTest, DefaultThresholdIsHorizon) {
    TopocentricFix above{0.0, 0.01, 1000.0, TEST_TIME};
    TopocentricFix below{0.0, -0.01, 1000.0, TEST_TIME};
    EXPECT_TRUE(isVisible(above));
    EXPECT_FALSE(isVisible(below));
}

}
}
