/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __HAMSKY_CATALOG_HPP
#define __HAMSKY_CATALOG_HPP

#include <hamsky/elements.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hamsky {

/**
 * Thread-safe store of the latest element set per satellite.
 *
 * The catalog holds an immutable map behind a shared pointer. Readers take a
 * snapshot (a copy of the pointer) and never see it change. Writers build a
 * new map and swap it in. The mutex only guards the pointer itself, so it is
 * never held while a computation runs.
 */
class ElementSetCatalog {
public:
    using Entry = std::shared_ptr<const OrbitalElementSet>;
    using Map = std::map<int, Entry>;
    using Snapshot = std::shared_ptr<const Map>;

    ElementSetCatalog();
    ~ElementSetCatalog() = default;

    // Non-copyable, non-movable (due to mutex)
    ElementSetCatalog(const ElementSetCatalog&) = delete;
    ElementSetCatalog& operator=(const ElementSetCatalog&) = delete;
    ElementSetCatalog(ElementSetCatalog&&) = delete;
    ElementSetCatalog& operator=(ElementSetCatalog&&) = delete;

    /**
     * Merge element sets into the catalog, replacing entries with the same
     * NORAD ID. Existing snapshots are not affected.
     */
    void update(std::vector<OrbitalElementSet> sets);

    /**
     * Replace the whole catalog.
     */
    void replace(std::vector<OrbitalElementSet> sets);

    /**
     * Get the current contents. The snapshot never changes.
     */
    Snapshot snapshot() const;

    /**
     * Find an element set by NORAD ID ("25544") or by name, ignoring case.
     * @return The element set, or null if not found
     */
    Entry find(const std::string &bodyId) const;

    std::size_t size() const;

    /**
     * Incremented every time the contents change.
     */
    std::uint64_t version() const;

private:
    mutable std::mutex mutex_;
    Snapshot sets_;
    std::uint64_t version_ = 0;
};

/**
 * Find an element set in a snapshot by NORAD ID or name, ignoring case.
 */
ElementSetCatalog::Entry findElementSet(const ElementSetCatalog::Map &sets, const std::string &bodyId);

}

#endif
