/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/elements.hpp>
#include <hamsky/errors.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <ranges>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <date/date.h>
#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

namespace hamsky {

namespace {

constexpr std::size_t TLE_LINE_LENGTH = 69;

// Helper function to trim leading spaces from a string_view
std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Helper function to trim trailing whitespace from a string_view
std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(" \r\t");
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

// Helper function to convert substring to numeric type
template <typename T>
T toNumber(std::string_view str) {
    T value;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw ElementSetParseException("Couldn't convert value: '" + std::string(str) + "'");
    }
    return value;
}

// Parse a signed decimal with an implied leading zero (" .00008010" or "-.00012345")
double fromImpliedDecimal(std::string_view str) {
    str = trimLeft(str);
    bool negative = false;
    if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
        negative = str[0] == '-';
        str.remove_prefix(1);
    }
    std::string normalized = str.starts_with('.') ? "0" + std::string(str) : std::string(str);
    double value = toNumber<double>(normalized);
    return negative ? -value : value;
}

// Parse TLE exponential notation: "11606-4" -> 0.11606e-4, "-11606-4" -> -0.11606e-4
double fromExponentialString(std::string_view str) {
    str = trimLeft(str);
    bool negative = false;
    if (!str.empty() && (str[0] == '-' || str[0] == '+')) {
        negative = str[0] == '-';
        str.remove_prefix(1);
    }

    auto pos = str.find_first_of("+-");
    if (pos == std::string_view::npos || pos == 0) {
        throw ElementSetParseException("Invalid exponential format: " + std::string(str));
    }

    double base = toNumber<double>("0." + std::string(str.substr(0, pos)));
    int exponent = toNumber<int>(str.substr(pos + 1));
    if (str[pos] == '-') {
        exponent = -exponent;
    }
    double value = base * std::pow(10.0, exponent);
    return negative ? -value : value;
}

// Parse epoch from TLE format (YYDDD.DDDDDDDD)
time_point parseEpoch(std::string_view epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(trimLeft(epochStr.substr(0, 2)));
    double dayOfYear = toNumber<double>(trimLeft(epochStr.substr(2)));

    // Two-digit years 57-99 are 1957-1999
    if (y < 57) {
        y += 2000;
    } else {
        y += 1900;
    }

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto date = date::sys_days{date::year{y}/date::January/1} + date::days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return date + time;
}

void requireLength(std::string_view line, int lineNumber) {
    if (line.size() < TLE_LINE_LENGTH - 1) {
        throw ElementSetParseException("TLE line " + std::to_string(lineNumber) + " is too short: '"
            + std::string(line) + "'");
    }
}

}

OrbitalElementSet OrbitalElementSet::parse(std::string_view name, std::string_view tle, time_point fetchedAt) {
    OrbitalElementSet set = parse(tle, fetchedAt);
    set.name_ = std::string(trimLeft(trimRight(name)));
    return set;
}

OrbitalElementSet OrbitalElementSet::parse(std::string_view tle, time_point fetchedAt) {
    OrbitalElementSet set;
    set.fetchedAt_ = fetchedAt;

    bool firstLineParsed = false;
    bool secondLineParsed = false;
    for (auto line : tle | std::views::split('\n')) {
        std::string lineStr;
        std::ranges::copy(line, std::back_inserter(lineStr));
        std::string_view lineView = trimLeft(trimRight(lineStr));
        if (lineView.starts_with("1 ")) {
            requireLength(lineView, 1);
            set.line1_ = std::string(lineView);
            // NORAD ID is columns 3-7
            set.noradID_ = toNumber<int>(trimLeft(lineView.substr(2, 5)));
            // Classification is column 8
            set.classification_ = lineView[7];
            // Designator is columns 10-17
            set.designator_ = std::string(trimRight(lineView.substr(9, 8)));
            // Epoch is columns 19-32
            set.epoch_ = parseEpoch(lineView.substr(18, 14));
            // First Derivative of Mean Motion is columns 34-43
            set.elements_.firstDerivativeMeanMotion = fromImpliedDecimal(lineView.substr(33, 10));
            // Second Derivative of Mean Motion is columns 45-52 (exponential format)
            set.elements_.secondDerivativeMeanMotion = fromExponentialString(lineView.substr(44, 8));
            // Bstar Drag Term is columns 54-61 (exponential format)
            set.elements_.bstarDragTerm = fromExponentialString(lineView.substr(53, 8));
            // Element Set Number is columns 65-68
            set.elementSetNumber_ = toNumber<int>(trimLeft(lineView.substr(64, 4)));
            firstLineParsed = true;
        } else if (lineView.starts_with("2 ")) {
            requireLength(lineView, 2);
            set.line2_ = std::string(lineView);
            // Inclination is columns 9-16
            set.elements_.inclination = toNumber<double>(trimLeft(lineView.substr(8, 8)));
            // RAAN is columns 18-25
            set.elements_.rightAscensionOfAscendingNode = toNumber<double>(trimLeft(lineView.substr(17, 8)));
            // Eccentricity is columns 27-33 (decimal implied)
            set.elements_.eccentricity = toNumber<double>("0." + std::string(trimLeft(lineView.substr(26, 7))));
            // Argument of perigee is columns 35-42
            set.elements_.argumentOfPerigee = toNumber<double>(trimLeft(lineView.substr(34, 8)));
            // Mean Anomaly is columns 44-51
            set.elements_.meanAnomaly = toNumber<double>(trimLeft(lineView.substr(43, 8)));
            // Mean Motion is columns 53-63
            set.elements_.meanMotion = toNumber<double>(trimLeft(lineView.substr(52, 11)));
            // Revolution number at epoch is columns 64-68
            set.elements_.revolutionNumberAtEpoch = toNumber<int>(trimLeft(lineView.substr(63, 5)));
            secondLineParsed = true;
        } else if (!firstLineParsed && !secondLineParsed && !lineView.empty()) {
            // A line before line 1 is the name
            set.name_ = std::string(lineView);
        }

        if (firstLineParsed && secondLineParsed) {
            break;
        }
    }

    if (!firstLineParsed || !secondLineParsed) {
        throw ElementSetParseException("Element set is missing line " + std::string(firstLineParsed ? "2" : "1"));
    }

    for (const auto *line : {&set.line1_, &set.line2_}) {
        if (line->size() >= TLE_LINE_LENGTH) {
            int expected = (*line)[TLE_LINE_LENGTH - 1] - '0';
            if (expected != calculateChecksum(*line)) {
                warn("Checksum mismatch in element set {}: '{}'", set.noradID_, *line);
            }
        }
    }

    return set;
}

std::string OrbitalElementSet::bodyId() const {
    return std::to_string(noradID_);
}

std::chrono::system_clock::duration OrbitalElementSet::age(time_point now) const {
    return now - fetchedAt_;
}

bool OrbitalElementSet::isStale(time_point now, std::chrono::system_clock::duration horizon) const {
    return age(now) > horizon;
}

void OrbitalElementSet::printInfo(std::ostream &os) const {
    os << getName() << std::endl;
    os << "  NORAD ID: " << getNoradID() << std::endl;
    os << "  Classification: " << getClassification() << std::endl;
    os << "  Designator: " << getDesignator() << std::endl;
    auto epoch = date::floor<std::chrono::seconds>(getEpoch());
    os << "  Epoch: " << date::format("%F %T UTC", epoch) << std::endl;
    auto fetched = date::floor<std::chrono::seconds>(getFetchedAt());
    os << "  Fetched: " << date::format("%F %T UTC", fetched) << std::endl;
    os << "  Element Set Number: " << getElementSetNumber() << std::endl;
    os << "  Inclination: " << elements_.inclination << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << elements_.rightAscensionOfAscendingNode << " deg" << std::endl;
    os << "  Eccentricity: " << elements_.eccentricity << std::endl;
    os << "  Argument of Perigee: " << elements_.argumentOfPerigee << " deg" << std::endl;
    os << "  Mean Anomaly: " << elements_.meanAnomaly << " deg" << std::endl;
    os << "  Mean Motion: " << elements_.meanMotion << " revs per day" << std::endl;
    os << "  Bstar Drag Term: " << elements_.bstarDragTerm << std::endl;
    os << "  Revolution Number at Epoch: " << elements_.revolutionNumberAtEpoch << std::endl;
    os << std::endl;
}

std::string OrbitalElementSet::getTLE() const {
    std::ostringstream tleStream;
    if (!name_.empty()) {
        tleStream << name_ << '\n';
    }
    tleStream << line1_ << '\n' << line2_ << '\n';
    return tleStream.str();
}

int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line.substr(0, TLE_LINE_LENGTH - 1)) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

// Load element sets from stream using the standard 3-line TLE format
std::vector<OrbitalElementSet> loadElementSets(std::istream &s, time_point fetchedAt) {
    std::vector<OrbitalElementSet> sets;
    bool haveFirstLine = false;
    std::string line, line1, nameLine;
    int lineNumber = 0;
    int skipped = 0;

    while (std::getline(s, line)) {
        ++lineNumber;
        std::string_view trimmed = trimLeft(trimRight(line));
        if (trimmed.empty()) continue;

        if (trimmed.starts_with("1 ")) {
            line1 = std::string(trimmed);
            haveFirstLine = true;
        } else if (trimmed.starts_with("2 ")) {
            if (!haveFirstLine) {
                warn("Line {}: element set line 2 without line 1, skipping", lineNumber);
                ++skipped;
                nameLine.clear();
                continue;
            }
            try {
                sets.push_back(OrbitalElementSet::parse(nameLine + '\n' + line1 + '\n' + std::string(trimmed), fetchedAt));
            } catch (const ElementSetParseException &e) {
                warn("Line {}: skipping malformed element set: {}", lineNumber, e.what());
                ++skipped;
            }
            haveFirstLine = false;
            line1.clear();
            nameLine.clear();
        } else {
            nameLine = std::string(trimmed);
        }
    }

    debug("Loaded {} element sets, skipped {}", sets.size(), skipped);
    return sets;
}

std::vector<OrbitalElementSet> loadElementSets(const std::string &filepath) {
    info("Loading element sets from file: {}", filepath);
    if (!std::filesystem::exists(filepath)) {
        warn("Element set file does not exist: {}", filepath);
        return {};
    }
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open element set file: " + filepath);
    }

    auto modified = std::filesystem::last_write_time(filepath);
    auto fetchedAt = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(modified));

    auto sets = loadElementSets(file, fetchedAt);
    info("Loaded {} element sets.", sets.size());
    return sets;
}

}
