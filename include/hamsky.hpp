/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_HPP
#define __HAMSKY_HPP

#include <hamsky/config.hpp>
#include <hamsky/errors.hpp>
#include <hamsky/transform.hpp>
#include <hamsky/observer.hpp>
#include <hamsky/elements.hpp>
#include <hamsky/catalog.hpp>
#include <hamsky/sources.hpp>
#include <hamsky/ephemeris.hpp>
#include <hamsky/events.hpp>
#include <hamsky/terminator.hpp>
#include <hamsky/track.hpp>
#include <hamsky/maidenhead.hpp>
#include <hamsky/engine.hpp>

#endif
