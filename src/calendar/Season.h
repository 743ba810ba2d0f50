/*
 * Season.h
 *
 * Purpose:
 *   Declares the four calendar seasons and the month -> season mapping.
 *
 * Model:
 *   - {12,1,2} Winter, {3,4,5} Spring, {6,7,8} Summer, {9,10,11} Autumn.
 *   - Any other month value maps to Autumn (the table has no gaps for 1..12).
 */

#pragma once

#include <array>
#include <string>

enum class Season : int { Winter = 0, Spring = 1, Summer = 2, Autumn = 3 };

// All seasons in index order; handy for per-season tables.
constexpr std::array<Season, 4> kAllSeasons = {
    Season::Winter, Season::Spring, Season::Summer, Season::Autumn
};

// Maps a month in [1,12] to its season.
Season SeasonForMonth(int month);

// Display name ("Winter").
const char* SeasonName(Season season);

// Lower-case key used in configuration files ("winter").
const char* SeasonConfigKey(Season season);

/*
 * Parses a season name, case-insensitive ("WINTER", "winter", "Winter").
 *
 * Returns:
 *   true and writes out on success; false for unknown names (out untouched).
 */
bool ParseSeason(const std::string& name, Season& out);

// Index of the season into per-season arrays.
inline std::size_t SeasonIndex(Season season) { return static_cast<std::size_t>(season); }
