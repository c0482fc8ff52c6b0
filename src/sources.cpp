/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/sources.hpp>
#include <hamsky/ephemeris.hpp>
#include <hamsky/errors.hpp>

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

using spdlog::debug;

namespace hamsky {

static std::string toLower(const std::string &str) {
    std::string result = str;
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

SolarSystemEphemeris::SolarSystemEphemeris(BodyKind kind) : kind_(kind) {
    switch (kind) {
        case BodyKind::Sun:
            bodyId_ = "sun";
            break;
        case BodyKind::Moon:
            bodyId_ = "moon";
            break;
        default:
            throw std::invalid_argument("SolarSystemEphemeris supports only the Sun and Moon");
    }
}

CartesianVector SolarSystemEphemeris::positionAt(time_point tp) const {
    return kind_ == BodyKind::Sun ? sunPosition(tp) : moonPosition(tp);
}

SatelliteEphemeris::SatelliteEphemeris(std::shared_ptr<const OrbitalElementSet> set,
                                       std::shared_ptr<const Propagator> propagator)
    : set_(std::move(set)), propagator_(std::move(propagator)) {
    if (!set_ || !propagator_) {
        throw std::invalid_argument("SatelliteEphemeris requires an element set and a propagator");
    }
    bodyId_ = set_->bodyId();
}

CartesianVector SatelliteEphemeris::positionAt(time_point tp) const {
    return propagator_->propagate(*set_, tp);
}

SolarSystemSource::SolarSystemSource()
    : sun_(std::make_shared<SolarSystemEphemeris>(BodyKind::Sun)),
      moon_(std::make_shared<SolarSystemEphemeris>(BodyKind::Moon)) {}

std::shared_ptr<const BodyEphemeris> SolarSystemSource::resolve(const std::string &bodyId) const {
    auto id = toLower(bodyId);
    if (id == "sun") {
        return sun_;
    }
    if (id == "moon") {
        return moon_;
    }
    throw UnknownBodyException(bodyId);
}

bool SolarSystemSource::knows(const std::string &bodyId) const {
    auto id = toLower(bodyId);
    return id == "sun" || id == "moon";
}

std::vector<std::string> SolarSystemSource::bodies() const {
    return {"sun", "moon"};
}

SatelliteSource::SatelliteSource(const ElementSetCatalog &catalog, std::shared_ptr<const Propagator> propagator)
    : catalog_(catalog), propagator_(std::move(propagator)) {}

std::shared_ptr<const BodyEphemeris> SatelliteSource::resolve(const std::string &bodyId) const {
    auto set = catalog_.find(bodyId);
    if (!set) {
        throw UnknownBodyException(bodyId);
    }
    debug("Resolved '{}' to element set {} ({})", bodyId, set->getNoradID(), set->getName());
    return std::make_shared<SatelliteEphemeris>(set, propagator_);
}

bool SatelliteSource::knows(const std::string &bodyId) const {
    return catalog_.find(bodyId) != nullptr;
}

std::vector<std::string> SatelliteSource::bodies() const {
    std::vector<std::string> ids;
    auto snapshot = catalog_.snapshot();
    for (const auto &[id, set] : *snapshot) {
        ids.push_back(set->bodyId());
    }
    return ids;
}

void CompositeSource::add(std::shared_ptr<const PositionSource> source) {
    sources_.push_back(std::move(source));
}

std::shared_ptr<const BodyEphemeris> CompositeSource::resolve(const std::string &bodyId) const {
    for (const auto &source : sources_) {
        if (source->knows(bodyId)) {
            return source->resolve(bodyId);
        }
    }
    throw UnknownBodyException(bodyId);
}

bool CompositeSource::knows(const std::string &bodyId) const {
    return std::ranges::any_of(sources_, [&bodyId](const auto &source) { return source->knows(bodyId); });
}

std::vector<std::string> CompositeSource::bodies() const {
    std::vector<std::string> ids;
    for (const auto &source : sources_) {
        auto more = source->bodies();
        ids.insert(ids.end(), more.begin(), more.end());
    }
    return ids;
}

}
