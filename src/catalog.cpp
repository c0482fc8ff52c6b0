/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <hamsky/catalog.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

#include <spdlog/spdlog.h>

using spdlog::debug;
using spdlog::info;

namespace hamsky {

static bool equalsIgnoreCase(const std::string &a, const std::string &b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::toupper(x) == std::toupper(y);
    });
}

ElementSetCatalog::ElementSetCatalog() : sets_(std::make_shared<const Map>()) {}

void ElementSetCatalog::update(std::vector<OrbitalElementSet> sets) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<Map>(*sets_);
    for (auto &set : sets) {
        int id = set.getNoradID();
        (*next)[id] = std::make_shared<const OrbitalElementSet>(std::move(set));
    }
    sets_ = std::move(next);
    ++version_;
    info("Element set catalog updated: {} entries (version {}).", sets_->size(), version_);
}

void ElementSetCatalog::replace(std::vector<OrbitalElementSet> sets) {
    auto next = std::make_shared<Map>();
    for (auto &set : sets) {
        int id = set.getNoradID();
        (*next)[id] = std::make_shared<const OrbitalElementSet>(std::move(set));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sets_ = std::move(next);
    ++version_;
    info("Element set catalog replaced: {} entries (version {}).", sets_->size(), version_);
}

ElementSetCatalog::Snapshot ElementSetCatalog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sets_;
}

ElementSetCatalog::Entry ElementSetCatalog::find(const std::string &bodyId) const {
    return findElementSet(*snapshot(), bodyId);
}

std::size_t ElementSetCatalog::size() const {
    return snapshot()->size();
}

std::uint64_t ElementSetCatalog::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

ElementSetCatalog::Entry findElementSet(const ElementSetCatalog::Map &sets, const std::string &bodyId) {
    int noradID = 0;
    auto [ptr, ec] = std::from_chars(bodyId.data(), bodyId.data() + bodyId.size(), noradID);
    if (ec == std::errc() && ptr == bodyId.data() + bodyId.size()) {
        auto it = sets.find(noradID);
        return it == sets.end() ? nullptr : it->second;
    }

    for (const auto &[id, set] : sets) {
        if (equalsIgnoreCase(set->getName(), bodyId)) {
            return set;
        }
    }
    debug("No element set matches '{}'", bodyId);
    return nullptr;
}

}
