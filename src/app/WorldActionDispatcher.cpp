/*
 * WorldActionDispatcher.cpp
 *
 * Purpose:
 *   Implements the demo host's action interpreter.
 */

#include "app/WorldActionDispatcher.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void WorldActionDispatcher::dispatch(const std::string& action) {
    std::istringstream in(action);
    std::string verb;
    in >> verb;
    verb = ToLower(verb);

    if (verb == "weather") {
        std::string kind;
        in >> kind;
        kind = ToLower(kind);
        if (kind == "clear") {
            m_world.setWeather(Weather::Clear);
        } else if (kind == "rain") {
            m_world.setWeather(Weather::Rain);
        } else if (kind == "thunder") {
            m_world.setWeather(Weather::Thunder);
        } else {
            std::cerr << "[Actions] Warning: unknown weather '" << kind << "' in: " << action << "\n";
            return;
        }
    } else if (verb == "time") {
        std::string sub;
        long long ticks = 0;
        in >> sub >> ticks;
        if (ToLower(sub) != "add" || in.fail() || ticks < 0) {
            std::cerr << "[Actions] Warning: malformed time action: " << action << "\n";
            return;
        }
        m_world.advanceBy(ticks);
    } else if (verb == "say") {
        std::string text;
        std::getline(in >> std::ws, text);
        std::cout << "[Broadcast] " << text << "\n";
    } else {
        std::cerr << "[Actions] Warning: unknown action: " << action << "\n";
        return;
    }

    ++m_executed;
    std::cout << "[Actions] " << action << "\n";
}
