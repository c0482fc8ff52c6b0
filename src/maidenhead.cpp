/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/maidenhead.hpp>
#include <hamsky/errors.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace hamsky {

namespace {

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

bool inRange(char c, char first, char last) {
    return c >= first && c <= last;
}

// Index of the cell containing value, clamped to [0, count)
int cellIndex(double value, double cellWidth, int count) {
    int index = static_cast<int>(std::floor(value / cellWidth));
    return std::clamp(index, 0, count - 1);
}

}

GridCellSize gridCellSize(int precision) {
    switch (precision) {
        case 2:
            return {10.0, 20.0};
        case 4:
            return {1.0, 2.0};
        case 6:
            return {1.0 / 24.0, 1.0 / 12.0};
        case 8:
            return {1.0 / 240.0, 1.0 / 120.0};
        default:
            throw std::invalid_argument(fmt::format("Precision must be 2, 4, 6, or 8, got {}", precision));
    }
}

std::string encodeGrid(const GeodeticPosition &position, int precision) {
    // Throws for unsupported precisions
    gridCellSize(precision);
    validateObserver({position.latInDegrees, position.lonInDegrees, 0.0});

    // Shift to non-negative ranges
    double lon = position.lonInDegrees + 180.0;
    double lat = position.latInDegrees + 90.0;

    std::string grid;
    grid.reserve(precision);

    // Field (letters) - 20 x 10 degrees
    int lonField = cellIndex(lon, 20.0, 18);
    int latField = cellIndex(lat, 10.0, 18);
    grid += static_cast<char>('A' + lonField);
    grid += static_cast<char>('A' + latField);
    lon -= lonField * 20.0;
    lat -= latField * 10.0;

    if (precision >= 4) {
        // Square (digits) - 2 x 1 degrees
        int lonSquare = cellIndex(lon, 2.0, 10);
        int latSquare = cellIndex(lat, 1.0, 10);
        grid += static_cast<char>('0' + lonSquare);
        grid += static_cast<char>('0' + latSquare);
        lon -= lonSquare * 2.0;
        lat -= latSquare * 1.0;
    }

    if (precision >= 6) {
        // Subsquare (letters) - 5 x 2.5 minutes
        int lonSub = cellIndex(lon, 1.0 / 12.0, 24);
        int latSub = cellIndex(lat, 1.0 / 24.0, 24);
        grid += static_cast<char>('A' + lonSub);
        grid += static_cast<char>('A' + latSub);
        lon -= lonSub / 12.0;
        lat -= latSub / 24.0;
    }

    if (precision == 8) {
        // Extended (digits) - 30 x 15 seconds
        grid += static_cast<char>('0' + cellIndex(lon, 1.0 / 120.0, 10));
        grid += static_cast<char>('0' + cellIndex(lat, 1.0 / 240.0, 10));
    }

    return grid;
}

GeodeticPosition decodeGrid(std::string_view locator) {
    if (!isValidGrid(locator)) {
        throw InvalidGridSquareException(std::string(locator));
    }

    std::string grid;
    std::ranges::transform(locator, std::back_inserter(grid), upper);

    double lon = (grid[0] - 'A') * 20.0 - 180.0;
    double lat = (grid[1] - 'A') * 10.0 - 90.0;

    if (grid.size() >= 4) {
        lon += (grid[2] - '0') * 2.0;
        lat += (grid[3] - '0') * 1.0;
    }

    if (grid.size() >= 6) {
        lon += (grid[4] - 'A') / 12.0;
        lat += (grid[5] - 'A') / 24.0;
    }

    if (grid.size() == 8) {
        lon += (grid[6] - '0') / 120.0;
        lat += (grid[7] - '0') / 240.0;
    }

    // Center of the finest cell
    GridCellSize size = gridCellSize(static_cast<int>(grid.size()));
    return {lat + size.latInDegrees / 2.0, lon + size.lonInDegrees / 2.0, 0.0};
}

bool isValidGrid(std::string_view locator) {
    if (locator.size() < 2 || locator.size() > 8 || locator.size() % 2 != 0) {
        return false;
    }

    for (std::size_t i = 0; i < locator.size(); ++i) {
        char c = upper(locator[i]);
        bool valid;
        switch (i) {
            case 0:
            case 1:
                valid = inRange(c, 'A', 'R');
                break;
            case 4:
            case 5:
                valid = inRange(c, 'A', 'X');
                break;
            default:
                valid = inRange(c, '0', '9');
                break;
        }
        if (!valid) {
            return false;
        }
    }
    return true;
}

GreatCircle gridDistance(std::string_view from, std::string_view to) {
    return greatCircle(decodeGrid(from), decodeGrid(to));
}

}
