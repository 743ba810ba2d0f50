/*
 * SeasonalRateTable.h
 *
 * Purpose:
 *   Converts per-season day/night durations (real seconds) into host ticks per clock invocation.
 *
 * Model:
 *   dayRate   = kSunsetTicks                    / daySeconds   * intervalSeconds
 *   nightRate = (kDayCycleTicks - kSunsetTicks) / nightSeconds * intervalSeconds
 *
 * Notes:
 *   - Only the two rates of the last refreshed season are kept.
 */

#pragma once

#include <array>

#include "calendar/Season.h"

// Real-time length of each phase for one season.
struct PhaseDurations {
    double daySeconds = 600.0;
    double nightSeconds = 600.0;
};

using SeasonDurations = std::array<PhaseDurations, 4>;

class SeasonalRateTable {
public:
    /*
     * Parameters:
     *   durations       : Per-season phase durations indexed by SeasonIndex(). Values must be > 0.
     *   intervalSeconds : Real seconds between two clock invocations.
     */
    explicit SeasonalRateTable(const SeasonDurations& durations, double intervalSeconds = 1.0);

    // Recomputes both rates for the given season.
    void refresh(Season season);

    double dayRate() const { return m_dayRate; }
    double nightRate() const { return m_nightRate; }
    double rateFor(bool isDay) const { return isDay ? m_dayRate : m_nightRate; }

    Season season() const { return m_season; }

private:
    SeasonDurations m_durations;
    double m_interval;

    Season m_season = Season::Winter;
    double m_dayRate = 0.0;
    double m_nightRate = 0.0;
};
