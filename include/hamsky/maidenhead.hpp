/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_MAIDENHEAD_HPP
#define __HAMSKY_MAIDENHEAD_HPP

#include <hamsky/transform.hpp>
#include <hamsky/types.hpp>

#include <string>
#include <string_view>

namespace hamsky {

/**
 * Size of a grid cell at a given precision, in degrees.
 */
struct GridCellSize {
    double latInDegrees;
    double lonInDegrees;
};

/**
 * Cell size for a precision of 2, 4, 6 or 8 characters.
 *
 *   2: field      20° x 10°
 *   4: square      2° x 1°
 *   6: subsquare   5' x 2.5'
 *   8: extended  30" x 15"
 *
 * @throws std::invalid_argument for any other precision
 */
GridCellSize gridCellSize(int precision);

/**
 * Encode a position as a Maidenhead locator (e.g. "FN30AS").
 *
 * Field letters are A-R, square digits 0-9, subsquare letters A-X and
 * extended digits 0-9. Positions on the eastern or northern edge (lon 180,
 * lat 90) fall into the last cell.
 *
 * @param position Position to encode (altitude is ignored)
 * @param precision Number of characters: 2, 4, 6 or 8
 * @throws std::invalid_argument if the precision is not supported
 * @throws InvalidObserverException if the position is out of range
 */
std::string encodeGrid(const GeodeticPosition &position, int precision = 6);

/**
 * Decode a locator to the center of its cell. Case is ignored.
 *
 * @throws InvalidGridSquareException if the locator is not valid
 */
GeodeticPosition decodeGrid(std::string_view locator);

/**
 * Check a locator: even length of 2 to 8 with each character in the
 * alphabet for its position. Case is ignored.
 */
bool isValidGrid(std::string_view locator);

/**
 * Great-circle distance and bearing between the centers of two cells.
 *
 * @throws InvalidGridSquareException if either locator is not valid
 */
GreatCircle gridDistance(std::string_view from, std::string_view to);

}

#endif
