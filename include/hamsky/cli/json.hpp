/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_CLI_JSON_HPP
#define __HAMSKY_CLI_JSON_HPP

#include <hamsky/elements.hpp>
#include <hamsky/engine.hpp>
#include <hamsky/ephemeris.hpp>
#include <hamsky/events.hpp>
#include <hamsky/terminator.hpp>
#include <hamsky/track.hpp>
#include <hamsky/transform.hpp>
#include <hamsky/types.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <optional>
#include <string>
#include <vector>

namespace hamsky::cli {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// Timestamps are written as "YYYY-MM-DD HH:MM:SS UTC" strings

void writeTime(JsonWriter &writer, time_point tp);

void writePosition(JsonWriter &writer, const GeodeticPosition &position);

void writeFix(JsonWriter &writer, const TopocentricFix &fix);

void writeGreatCircle(JsonWriter &writer, const GreatCircle &gc);

void writePass(JsonWriter &writer, const Pass &pass);

void writeRiseSet(JsonWriter &writer, const RiseSetTimes &times);

void writeTerminator(JsonWriter &writer, const TerminatorPolyline &polyline);

void writeTrack(JsonWriter &writer, const std::vector<TrackPoint> &track);

void writeMoonPhase(JsonWriter &writer, const MoonPhase &phase);

void writeElementSet(JsonWriter &writer, const OrbitalElementSet &set);

/**
 * Writes a "stale" key: null when the data is fresh, otherwise an object
 * describing the element set's age. Must be called inside an object.
 */
void writeStaleness(JsonWriter &writer, const std::optional<StalenessWarning> &staleness);

}

#endif
