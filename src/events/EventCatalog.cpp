/*
 * EventCatalog.cpp
 *
 * Purpose:
 *   Implements YAML loading and validation of event definitions.
 *
 * Validation (each failure logs a warning and flags the entry malformed):
 *   - type must be FIXED_DATE, ANNUAL or RANDOM.
 *   - trigger-date must match the kind ("d/m/y" or "d/m"); Random ignores it.
 *   - conditions.chance must be in [0,100].
 *   - conditions.seasons entries must name a season.
 *   - duration-days must be -1 or >= 1.
 *   - command and season lists must hold plain strings; numbers must be integers.
 *   - field reads never throw, so one bad entry cannot empty the catalog.
 */

#include "events/EventCatalog.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <yaml-cpp/yaml.h>

namespace {

// Non-scalar items are skipped and reported through ok.
std::vector<std::string> ReadStringList(const YAML::Node& node, bool& ok) {
    std::vector<std::string> out;
    if (!node || !node.IsSequence()) return out;
    for (const auto& item : node) {
        if (item.IsScalar()) {
            out.push_back(item.Scalar());
        } else {
            ok = false;
        }
    }
    return out;
}

// Absent keeps fallback; present but not an integer clears ok.
int ReadInt(const YAML::Node& node, int fallback, bool& ok) {
    if (!node) return fallback;
    int value = fallback;
    if (!YAML::convert<int>::decode(node, value)) {
        ok = false;
        return fallback;
    }
    return value;
}

void Warn(const std::string& id, const std::string& what) {
    std::cerr << "[Events] Warning: event '" << id << "' " << what
              << "; it will never start automatically.\n";
}

} // namespace

std::string EventCatalog::normalizeId(const std::string& id) {
    std::string out = id;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool EventCatalog::loadFromFile(const std::string& path) {
    m_events.clear();
    try {
        loadFromNode(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        std::cerr << "[Events] Failed to open event catalog: " << path << "\n";
        return false;
    } catch (const YAML::Exception& e) {
        std::cerr << "[Events] Failed to parse event catalog " << path << ": " << e.what() << "\n";
        m_events.clear();
        return false;
    }
    std::cout << "[Events] Loaded " << m_events.size() << " events from " << path << "\n";
    return true;
}

bool EventCatalog::loadFromString(const std::string& yaml) {
    m_events.clear();
    try {
        loadFromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        std::cerr << "[Events] Failed to parse event catalog: " << e.what() << "\n";
        m_events.clear();
        return false;
    }
    return true;
}

const EventDefinition* EventCatalog::find(const std::string& id) const {
    auto it = m_events.find(normalizeId(id));
    return it == m_events.end() ? nullptr : &it->second;
}

std::size_t EventCatalog::malformedCount() const {
    return static_cast<std::size_t>(std::count_if(
        m_events.begin(), m_events.end(),
        [](const Map::value_type& kv) { return kv.second.malformed; }));
}

void EventCatalog::loadFromNode(const YAML::Node& root) {
    const YAML::Node section = root["events"];
    if (!section || !section.IsMap()) return;

    for (const auto& kv : section) {
        const std::string id = normalizeId(kv.first.as<std::string>(""));
        if (id.empty()) {
            std::cerr << "[Events] Warning: event with a non-string id; skipped.\n";
            continue;
        }
        if (!kv.second.IsMap()) {
            std::cerr << "[Events] Warning: event '" << id << "' is not a mapping; skipped.\n";
            continue;
        }
        m_events[id] = parseEntry(id, kv.second);
    }
}

EventDefinition EventCatalog::parseEntry(const std::string& id, const YAML::Node& node) {
    EventDefinition ev;
    ev.id = id;
    ev.displayName = node["display-name"].as<std::string>("Unnamed Event");
    ev.triggerSpec = node["trigger-date"].as<std::string>("");
    bool durationOk = true;
    ev.durationDays = ReadInt(node["duration-days"], 1, durationOk);
    if (!durationOk) {
        Warn(id, "has a duration-days that is not a number");
        ev.malformed = true;
    }
    bool listsOk = true;
    ev.startActions = ReadStringList(node["start-commands"], listsOk);
    ev.endActions = ReadStringList(node["end-commands"], listsOk);
    if (!listsOk) {
        Warn(id, "has a command that is not a string");
        ev.malformed = true;
    }

    const std::string type = node["type"].as<std::string>("RANDOM");
    if (!ParseEventKind(type, ev.kind)) {
        Warn(id, "has unknown type '" + type + "'");
        ev.malformed = true;
    }

    const YAML::Node conditions = node["conditions"];
    if (conditions && conditions.IsMap()) {
        bool chanceOk = true;
        ev.chancePercent = ReadInt(conditions["chance"], 0, chanceOk);
        if (!chanceOk) {
            Warn(id, "has a chance that is not a number");
            ev.malformed = true;
        }
        bool seasonsOk = true;
        const std::vector<std::string> seasons = ReadStringList(conditions["seasons"], seasonsOk);
        if (!seasonsOk) {
            Warn(id, "has a season entry that is not a string");
            ev.malformed = true;
        }
        for (const std::string& name : seasons) {
            Season s;
            if (ParseSeason(name, s)) {
                ev.eligibleSeasons.insert(s);
            } else {
                Warn(id, "lists unknown season '" + name + "'");
                ev.malformed = true;
            }
        }
    }

    if (ev.chancePercent < 0 || ev.chancePercent > 100) {
        Warn(id, "has chance outside [0,100]");
        ev.chancePercent = std::max(0, std::min(ev.chancePercent, 100));
        ev.malformed = true;
    }

    if (ev.durationDays != -1 && ev.durationDays < 1) {
        Warn(id, "has invalid duration-days " + std::to_string(ev.durationDays));
        ev.durationDays = 1;
        ev.malformed = true;
    }

    if (!ev.malformed && ev.kind != EventKind::Random &&
        !ParseTriggerDate(ev.triggerSpec, ev.kind, ev.trigger)) {
        Warn(id, "has trigger-date '" + ev.triggerSpec + "' not valid for " + EventKindName(ev.kind));
        ev.malformed = true;
    }

    return ev;
}
