/*
 * CropGrowth.h
 *
 * Purpose:
 *   Declares CropGrowthPolicy, the seasonal farming rule: crops listed for the current season grow
 *   normally, any other crop grows only with the configured out-of-season chance.
 *
 * Notes:
 *   - Crop names are compared case-insensitively.
 *   - Draws use an internal std::mt19937; results are not reproducible across runs.
 */

#pragma once

#include <array>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "calendar/Season.h"

class CropGrowthPolicy {
public:
    /*
     * Parameters:
     *   crops               : Per-season crop names indexed by SeasonIndex().
     *   outOfSeasonChance   : Probability in [0,1] that an out-of-season growth step is allowed.
     */
    CropGrowthPolicy(const std::array<std::vector<std::string>, 4>& crops, double outOfSeasonChance);

    bool isInSeason(const std::string& crop, Season season) const;

    // true if a growth step for crop may proceed in season.
    bool allowGrowth(const std::string& crop, Season season);

    double outOfSeasonChance() const { return m_chance; }

private:
    std::array<std::set<std::string>, 4> m_crops;
    double m_chance;

    std::mt19937 m_rng;
    std::uniform_real_distribution<double> m_u01{0.0, 1.0};
};
