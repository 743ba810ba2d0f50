/*
 * CropGrowth.cpp
 *
 * Purpose:
 *   Implements the seasonal crop growth decision (in season always, otherwise by chance).
 */

#include "environment/CropGrowth.h"

#include <algorithm>
#include <cctype>

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

CropGrowthPolicy::CropGrowthPolicy(const std::array<std::vector<std::string>, 4>& crops,
                                   double outOfSeasonChance)
    : m_chance(outOfSeasonChance) {
    for (std::size_t i = 0; i < crops.size(); ++i) {
        for (const std::string& c : crops[i]) m_crops[i].insert(Lower(c));
    }
    std::random_device rd;
    m_rng.seed(rd());
}

bool CropGrowthPolicy::isInSeason(const std::string& crop, Season season) const {
    return m_crops[SeasonIndex(season)].count(Lower(crop)) > 0;
}

bool CropGrowthPolicy::allowGrowth(const std::string& crop, Season season) {
    if (isInSeason(crop, season)) return true;
    return m_u01(m_rng) < m_chance;
}
