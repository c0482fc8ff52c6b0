/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <hamsky/errors.hpp>
#include <hamsky/maidenhead.hpp>

#include <cctype>
#include <cmath>
#include <string>
#include <vector>

namespace hamsky {
namespace {

// ARRL headquarters, W1AW
const GeodeticPosition W1AW{41.714775, -72.727260, 0.0};

// ============================================================================
// encodeGrid Tests
// ============================================================================

TEST(EncodeGridTest, KnownLocations) {
    EXPECT_EQ(encodeGrid(W1AW, 2), "FN");
    EXPECT_EQ(encodeGrid(W1AW, 4), "FN31");
    EXPECT_EQ(encodeGrid(W1AW), "FN31PR");
    EXPECT_EQ(encodeGrid({40.75, -73.0, 0.0}, 4), "FN30");
    EXPECT_EQ(encodeGrid({40.7128, -74.0060, 0.0}, 4), "FN20");
    EXPECT_EQ(encodeGrid({51.5074, -0.1278, 0.0}, 6), "IO91WM");
    EXPECT_EQ(encodeGrid({-33.8688, 151.2093, 0.0}, 4), "QF56");
}

TEST(EncodeGridTest, OutputIsUpperCase) {
    std::string grid = encodeGrid(W1AW, 8);
    ASSERT_EQ(grid.size(), 8u);
    for (char c : grid) {
        EXPECT_FALSE(std::islower(static_cast<unsigned char>(c)));
    }
}

TEST(EncodeGridTest, CornersStayInRange) {
    EXPECT_EQ(encodeGrid({-90.0, -180.0, 0.0}), "AA00AA");
    EXPECT_EQ(encodeGrid({90.0, 180.0, 0.0}), "RR99XX");
    EXPECT_EQ(encodeGrid({90.0, 180.0, 0.0}, 8), "RR99XX99");
}

TEST(EncodeGridTest, UnsupportedPrecisionThrows) {
    EXPECT_THROW(encodeGrid(W1AW, 0), std::invalid_argument);
    EXPECT_THROW(encodeGrid(W1AW, 3), std::invalid_argument);
    EXPECT_THROW(encodeGrid(W1AW, 5), std::invalid_argument);
    EXPECT_THROW(encodeGrid(W1AW, 10), std::invalid_argument);
}

TEST(EncodeGridTest, OutOfRangePositionThrows) {
    EXPECT_THROW(encodeGrid({91.0, 0.0, 0.0}), InvalidObserverException);
    EXPECT_THROW(encodeGrid({0.0, 181.0, 0.0}), InvalidObserverException);
    EXPECT_THROW(encodeGrid({NAN, 0.0, 0.0}), InvalidObserverException);
}

// ============================================================================
// decodeGrid Tests
// ============================================================================

TEST(DecodeGridTest, ReturnsCellCenter) {
    GeodeticPosition center = decodeGrid("FN30");
    EXPECT_DOUBLE_EQ(center.latInDegrees, 40.5);
    EXPECT_DOUBLE_EQ(center.lonInDegrees, -73.0);

    GeodeticPosition field = decodeGrid("JJ");
    EXPECT_DOUBLE_EQ(field.latInDegrees, 5.0);
    EXPECT_DOUBLE_EQ(field.lonInDegrees, 10.0);
}

TEST(DecodeGridTest, IgnoresCase) {
    GeodeticPosition upper = decodeGrid("FN31PR");
    GeodeticPosition lower = decodeGrid("fn31pr");
    EXPECT_DOUBLE_EQ(upper.latInDegrees, lower.latInDegrees);
    EXPECT_DOUBLE_EQ(upper.lonInDegrees, lower.lonInDegrees);
}

TEST(DecodeGridTest, RoundTripWithinHalfCell) {
    std::vector<GeodeticPosition> positions = {
        W1AW,
        {-33.8688, 151.2093, 0.0},
        {64.1466, -21.9426, 0.0},
        {-0.0001, 0.0001, 0.0},
    };

    for (int precision : {2, 4, 6, 8}) {
        GridCellSize size = gridCellSize(precision);
        for (const auto &position : positions) {
            GeodeticPosition center = decodeGrid(encodeGrid(position, precision));
            EXPECT_LE(std::abs(center.latInDegrees - position.latInDegrees), size.latInDegrees / 2.0 + 1e-9)
                << "precision " << precision;
            EXPECT_LE(std::abs(center.lonInDegrees - position.lonInDegrees), size.lonInDegrees / 2.0 + 1e-9)
                << "precision " << precision;
        }
    }
}

TEST(DecodeGridTest, InvalidLocatorThrows) {
    EXPECT_THROW(decodeGrid(""), InvalidGridSquareException);
    EXPECT_THROW(decodeGrid("F"), InvalidGridSquareException);
    EXPECT_THROW(decodeGrid("SN30"), InvalidGridSquareException);
    EXPECT_THROW(decodeGrid("FN3"), InvalidGridSquareException);
}

// ============================================================================
// isValidGrid Tests
// ============================================================================

TEST(IsValidGridTest, AcceptsWellFormedLocators) {
    EXPECT_TRUE(isValidGrid("AA"));
    EXPECT_TRUE(isValidGrid("FN"));
    EXPECT_TRUE(isValidGrid("FN31"));
    EXPECT_TRUE(isValidGrid("FN31pr"));
    EXPECT_TRUE(isValidGrid("FN31PR44"));
    EXPECT_TRUE(isValidGrid("RR99XX99"));
}

TEST(IsValidGridTest, RejectsMalformedLocators) {
    EXPECT_FALSE(isValidGrid(""));
    EXPECT_FALSE(isValidGrid("F"));
    EXPECT_FALSE(isValidGrid("A1"));
    EXPECT_FALSE(isValidGrid("ZZ99"));
    EXPECT_FALSE(isValidGrid("FN3"));
    EXPECT_FALSE(isValidGrid("FN31PR4"));
    EXPECT_FALSE(isValidGrid("FN31PR4400"));
    EXPECT_FALSE(isValidGrid("SN31"));      // Field letters stop at R
    EXPECT_FALSE(isValidGrid("FNA1"));      // Square must be digits
    EXPECT_FALSE(isValidGrid("FN31PY"));    // Subsquare letters stop at X
    EXPECT_FALSE(isValidGrid("FN31PRA4"));  // Extended must be digits
    EXPECT_FALSE(isValidGrid("FN 31"));
}

// ============================================================================
// gridCellSize / gridDistance Tests
// ============================================================================

TEST(GridCellSizeTest, KnownSizes) {
    EXPECT_DOUBLE_EQ(gridCellSize(2).lonInDegrees, 20.0);
    EXPECT_DOUBLE_EQ(gridCellSize(2).latInDegrees, 10.0);
    EXPECT_DOUBLE_EQ(gridCellSize(4).lonInDegrees, 2.0);
    EXPECT_DOUBLE_EQ(gridCellSize(4).latInDegrees, 1.0);
    EXPECT_DOUBLE_EQ(gridCellSize(6).lonInDegrees * 60.0, 5.0);
    EXPECT_DOUBLE_EQ(gridCellSize(6).latInDegrees * 60.0, 2.5);
    EXPECT_THROW(gridCellSize(7), std::invalid_argument);
}

TEST(GridDistanceTest, SameSquareIsZero) {
    GreatCircle gc = gridDistance("FN31", "fn31");
    EXPECT_DOUBLE_EQ(gc.distanceInKilometers, 0.0);
}

TEST(GridDistanceTest, FN31ToIO91) {
    // Square centers (41.5, -71) and (51.5, -1)
    GreatCircle gc = gridDistance("FN31", "IO91");
    EXPECT_NEAR(gc.distanceInKilometers, 5260.6, 1.0);
    EXPECT_NEAR(gc.bearingInDegrees, 52.7, 0.1);
}

TEST(GridDistanceTest, InvalidLocatorThrows) {
    EXPECT_THROW(gridDistance("FN31", "ZZ99"), InvalidGridSquareException);
}

}
}
