/*
 * EventDefinition.cpp
 *
 * Purpose:
 *   Implements event-kind naming and trigger-date parsing.
 */

#include "events/EventDefinition.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Strict integer parse: the whole (trimmed) token must be digits with an optional sign.
bool ParseInt(const std::string& token, int& out) {
    std::size_t begin = token.find_first_not_of(" \t");
    std::size_t end = token.find_last_not_of(" \t");
    if (begin == std::string::npos) return false;
    std::string t = token.substr(begin, end - begin + 1);

    std::size_t i = (t[0] == '-' || t[0] == '+') ? 1 : 0;
    if (i == t.size()) return false;
    for (std::size_t k = i; k < t.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(t[k]))) return false;
    }
    try {
        out = std::stoi(t);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

bool ParseEventKind(const std::string& name, EventKind& out) {
    const std::string key = ToUpper(name);
    if (key == "FIXED_DATE") { out = EventKind::FixedDate; return true; }
    if (key == "ANNUAL")     { out = EventKind::Annual;    return true; }
    if (key == "RANDOM")     { out = EventKind::Random;    return true; }
    return false;
}

const char* EventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::FixedDate: return "FIXED_DATE";
        case EventKind::Annual:    return "ANNUAL";
        case EventKind::Random:    return "RANDOM";
    }
    return "RANDOM";
}

bool ParseTriggerDate(const std::string& spec, EventKind kind, TriggerDate& out) {
    std::vector<std::string> parts;
    std::stringstream ss(spec);
    std::string part;
    while (std::getline(ss, part, '/')) parts.push_back(part);

    std::size_t expected = 0;
    switch (kind) {
        case EventKind::FixedDate: expected = 3; break;
        case EventKind::Annual:    expected = 2; break;
        case EventKind::Random:    return false;
    }
    if (parts.size() != expected) return false;

    TriggerDate t;
    if (!ParseInt(parts[0], t.day) || !ParseInt(parts[1], t.month)) return false;
    if (expected == 3 && !ParseInt(parts[2], t.year)) return false;

    out = t;
    return true;
}
