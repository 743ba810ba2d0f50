/*
 * SeasonalRateTable.cpp
 *
 * Purpose:
 *   Converts the configured day/night lengths of a season into host ticks per clock invocation.
 */

#include "environment/SeasonalRateTable.h"

#include "environment/HostWorld.h"

SeasonalRateTable::SeasonalRateTable(const SeasonDurations& durations, double intervalSeconds)
    : m_durations(durations), m_interval(intervalSeconds) {
    refresh(m_season);
}

void SeasonalRateTable::refresh(Season season) {
    const PhaseDurations& d = m_durations[SeasonIndex(season)];
    m_season = season;
    m_dayRate = static_cast<double>(kSunsetTicks) / d.daySeconds * m_interval;
    m_nightRate = static_cast<double>(kDayCycleTicks - kSunsetTicks) / d.nightSeconds * m_interval;
}
