/*
 * EventCatalog.h
 *
 * Purpose:
 *   Declares EventCatalog, the immutable set of event definitions loaded from YAML.
 *
 * Model:
 *   - Entries are keyed by lower-case id and iterated in lexicographic id order. This order is
 *     the tie-break when several events are eligible on the same day.
 *   - Loading replaces the whole set. Invalid entries stay in the set flagged as malformed.
 *
 * Failure policy:
 *   - A missing or unparsable document is logged and leaves the catalog empty; load functions
 *     return false but never throw.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "events/EventDefinition.h"

namespace YAML { class Node; }

class EventCatalog {
public:
    using Map = std::map<std::string, EventDefinition>;

    /*
     * Loads the catalog from a YAML file ("events:" mapping).
     *
     * Returns:
     *   true if the file was read and parsed (individual entries may still be malformed).
     */
    bool loadFromFile(const std::string& path);

    // Same as loadFromFile, reading the document from memory.
    bool loadFromString(const std::string& yaml);

    // Case-insensitive lookup. Returns nullptr if the id is unknown.
    const EventDefinition* find(const std::string& id) const;

    const Map& events() const { return m_events; }
    std::size_t size() const { return m_events.size(); }
    bool empty() const { return m_events.empty(); }

    // Number of entries flagged malformed during the last load.
    std::size_t malformedCount() const;

    static std::string normalizeId(const std::string& id);

private:
    void loadFromNode(const YAML::Node& root);
    static EventDefinition parseEntry(const std::string& id, const YAML::Node& node);

    Map m_events;
};
