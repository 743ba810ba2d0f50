/*
 * Season.cpp
 *
 * Purpose:
 *   Implements the month -> season table and season naming helpers.
 */

#include "calendar/Season.h"

#include <algorithm>
#include <cctype>

Season SeasonForMonth(int month) {
    switch (month) {
        case 12: case 1: case 2:  return Season::Winter;
        case 3:  case 4: case 5:  return Season::Spring;
        case 6:  case 7: case 8:  return Season::Summer;
        default:                  return Season::Autumn; // 9, 10, 11
    }
}

const char* SeasonName(Season season) {
    switch (season) {
        case Season::Winter: return "Winter";
        case Season::Spring: return "Spring";
        case Season::Summer: return "Summer";
        case Season::Autumn: return "Autumn";
    }
    return "Autumn";
}

const char* SeasonConfigKey(Season season) {
    switch (season) {
        case Season::Winter: return "winter";
        case Season::Spring: return "spring";
        case Season::Summer: return "summer";
        case Season::Autumn: return "autumn";
    }
    return "autumn";
}

bool ParseSeason(const std::string& name, Season& out) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (Season s : kAllSeasons) {
        if (key == SeasonConfigKey(s)) {
            out = s;
            return true;
        }
    }
    return false;
}
