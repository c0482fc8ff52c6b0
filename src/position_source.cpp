/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/position_source.hpp>

namespace hamsky {

std::ostream& operator<<(std::ostream &os, const BodyKind &kind) {
    switch (kind) {
        case BodyKind::Sun:
            os << "Sun";
            break;
        case BodyKind::Moon:
            os << "Moon";
            break;
        case BodyKind::Satellite:
            os << "Satellite";
            break;
    }
    return os;
}

std::shared_ptr<const OrbitalElementSet> BodyEphemeris::elementSet() const {
    return nullptr;
}

BodyPositionSample BodyEphemeris::sampleAt(time_point tp) const {
    return {bodyId(), tp, positionAt(tp)};
}

BodyPositionSample PositionSource::positionAt(const std::string &bodyId, time_point tp) const {
    return resolve(bodyId)->sampleAt(tp);
}

std::shared_ptr<const OrbitalElementSet> PositionSource::elementSetFor(const std::string &bodyId) const {
    return resolve(bodyId)->elementSet();
}

BodyKind PositionSource::bodyKind(const std::string &bodyId) const {
    return resolve(bodyId)->kind();
}

}
