/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/cli/json.hpp>
#include <hamsky/time.hpp>

#include <chrono>

namespace hamsky::cli {

namespace {

void writeOptionalTime(JsonWriter &writer, const std::optional<time_point> &tp) {
    if (tp) {
        writeTime(writer, *tp);
    } else {
        writer.Null();
    }
}

void writeEvent(JsonWriter &writer, const std::optional<PassEvent> &event) {
    if (!event) {
        writer.Null();
        return;
    }
    writer.StartObject();
    writer.Key("time");
    writeTime(writer, event->time);
    writer.Key("azimuth");
    writer.Double(event->azimuthInDegrees);
    writer.Key("elevation");
    writer.Double(event->elevationInDegrees);
    writer.EndObject();
}

double toSeconds(std::chrono::system_clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

}

void writeTime(JsonWriter &writer, time_point tp) {
    writer.String(formatTime(tp).c_str());
}

void writePosition(JsonWriter &writer, const GeodeticPosition &position) {
    writer.StartObject();
    writer.Key("lat");
    writer.Double(position.latInDegrees);
    writer.Key("lon");
    writer.Double(position.lonInDegrees);
    writer.Key("alt");
    writer.Double(position.altInMeters);
    writer.EndObject();
}

void writeFix(JsonWriter &writer, const TopocentricFix &fix) {
    writer.StartObject();
    writer.Key("time");
    writeTime(writer, fix.time);
    writer.Key("azimuth");
    writer.Double(fix.azimuthInDegrees);
    writer.Key("elevation");
    writer.Double(fix.elevationInDegrees);
    writer.Key("range");
    writer.Double(fix.rangeInKilometers);
    writer.EndObject();
}

void writeGreatCircle(JsonWriter &writer, const GreatCircle &gc) {
    writer.StartObject();
    writer.Key("distance");
    writer.Double(gc.distanceInKilometers);
    writer.Key("bearing");
    writer.Double(gc.bearingInDegrees);
    writer.EndObject();
}

void writePass(JsonWriter &writer, const Pass &pass) {
    writer.StartObject();
    writer.Key("body");
    writer.String(pass.bodyId.c_str());
    writer.Key("rise");
    writeEvent(writer, pass.rise);
    writer.Key("culminate");
    writeEvent(writer, pass.culminate);
    writer.Key("set");
    writeEvent(writer, pass.set);
    writer.Key("maxElevation");
    writer.Double(pass.maxElevationInDegrees);
    writer.Key("start");
    writeTime(writer, pass.start);
    writer.Key("end");
    writeTime(writer, pass.end);
    writer.Key("duration");
    writer.Double(toSeconds(pass.duration()));
    writer.Key("partial");
    writer.Bool(pass.partial);
    writer.EndObject();
}

void writeRiseSet(JsonWriter &writer, const RiseSetTimes &times) {
    writer.StartObject();
    writer.Key("rise");
    writeOptionalTime(writer, times.rise);
    writer.Key("set");
    writeOptionalTime(writer, times.set);
    writer.Key("transit");
    writeTime(writer, times.transit);
    writer.Key("transitElevation");
    writer.Double(times.transitElevationInDegrees);
    writer.Key("alwaysUp");
    writer.Bool(times.alwaysUp);
    writer.Key("alwaysDown");
    writer.Bool(times.alwaysDown);
    writer.Key("dayLength");
    if (auto length = times.dayLength()) {
        writer.Double(toSeconds(*length));
    } else {
        writer.Null();
    }
    writer.EndObject();
}

void writeTerminator(JsonWriter &writer, const TerminatorPolyline &polyline) {
    writer.StartObject();
    writer.Key("time");
    writeTime(writer, polyline.time);
    writer.Key("step");
    writer.Double(polyline.stepInDegrees);
    writer.Key("points");
    writer.StartArray();
    for (const auto &point : polyline.points) {
        // [lat, lon] pairs, unbracketed points flagged with a third element
        writer.StartArray();
        writer.Double(point.latInDegrees);
        writer.Double(point.lonInDegrees);
        if (!point.bracketed) {
            writer.Bool(false);
        }
        writer.EndArray();
    }
    writer.EndArray();
    writer.EndObject();
}

void writeTrack(JsonWriter &writer, const std::vector<TrackPoint> &track) {
    writer.StartArray();
    for (const auto &point : track) {
        writer.StartObject();
        writer.Key("time");
        writeTime(writer, point.time);
        writer.Key("lat");
        writer.Double(point.position.latInDegrees);
        writer.Key("lon");
        writer.Double(point.position.lonInDegrees);
        writer.Key("altKm");
        writer.Double(point.position.altInMeters / 1000.0);
        writer.EndObject();
    }
    writer.EndArray();
}

void writeMoonPhase(JsonWriter &writer, const MoonPhase &phase) {
    writer.StartObject();
    writer.Key("phaseAngle");
    writer.Double(phase.phaseAngleInDegrees);
    writer.Key("illumination");
    writer.Double(phase.illuminationPercent);
    writer.Key("name");
    writer.String(phase.name.c_str());
    writer.EndObject();
}

void writeElementSet(JsonWriter &writer, const OrbitalElementSet &set) {
    const auto &elements = set.getElements();
    writer.StartObject();
    writer.Key("id");
    writer.Int(set.getNoradID());
    writer.Key("name");
    writer.String(set.getName().c_str());
    writer.Key("designator");
    writer.String(set.getDesignator().c_str());
    writer.Key("epoch");
    writeTime(writer, set.getEpoch());
    writer.Key("fetchedAt");
    writeTime(writer, set.getFetchedAt());
    writer.Key("inclination");
    writer.Double(elements.inclination);
    writer.Key("raan");
    writer.Double(elements.rightAscensionOfAscendingNode);
    writer.Key("eccentricity");
    writer.Double(elements.eccentricity);
    writer.Key("argumentOfPerigee");
    writer.Double(elements.argumentOfPerigee);
    writer.Key("meanAnomaly");
    writer.Double(elements.meanAnomaly);
    writer.Key("meanMotion");
    writer.Double(elements.meanMotion);
    writer.Key("line1");
    writer.String(set.getLine1().c_str());
    writer.Key("line2");
    writer.String(set.getLine2().c_str());
    writer.EndObject();
}

void writeStaleness(JsonWriter &writer, const std::optional<StalenessWarning> &staleness) {
    writer.Key("stale");
    if (!staleness) {
        writer.Null();
        return;
    }
    writer.StartObject();
    writer.Key("fetchedAt");
    writeTime(writer, staleness->fetchedAt);
    writer.Key("ageHours");
    writer.Double(std::chrono::duration<double, std::ratio<3600>>(staleness->age).count());
    writer.Key("horizonHours");
    writer.Double(std::chrono::duration<double, std::ratio<3600>>(staleness->horizon).count());
    writer.EndObject();
}

}
