/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/types.hpp>
#include <hamsky/errors.hpp>

#include <sstream>

namespace hamsky {

std::ostream& operator<<(std::ostream &os, const Frame &frame) {
    switch (frame) {
        case Frame::ECEF:
            os << "ECEF";
            break;
        case Frame::ECI:
            os << "ECI";
            break;
    }
    return os;
}

Vec3 CartesianVector::relativeTo(const CartesianVector &origin) const {
    if (frame != origin.frame) {
        std::ostringstream msg;
        msg << "Cannot combine " << frame << " vector with " << origin.frame << " vector";
        throw FrameMismatchException(msg.str());
    }
    return position - origin.position;
}

}
