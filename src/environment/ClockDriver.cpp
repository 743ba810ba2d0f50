/*
 * ClockDriver.cpp
 *
 * Purpose:
 *   Implements the periodic clock task: fractional tick accumulation, day catch-up and
 *   month/season boundary handling.
 *
 * Notes:
 *   - Catch-up is not capped: a large host jump replays every elapsed day, and each replayed day
 *     may end one event and start another.
 */

#include "environment/ClockDriver.h"

#include <cmath>
#include <iostream>

ClockDriver::ClockDriver(HostWorld* world,
                         CalendarDate& date,
                         EventScheduler& scheduler,
                         SeasonalRateTable& rates,
                         StatusDisplay& display,
                         CalendarNotifier& notifier,
                         bool debug)
    : m_world(world),
      m_date(date),
      m_scheduler(scheduler),
      m_rates(rates),
      m_display(display),
      m_notifier(notifier),
      m_debug(debug) {
    m_lastCheckedSeason = m_date.season();
    updateSeasonalRates();

    if (!m_world) {
        std::cerr << "[Clock] No host world found; the calendar clock is disabled.\n";
        m_enabled = false;
        return;
    }
    m_lastCheckedTotalDays = m_world->totalDays();
}

void ClockDriver::restore(const State& state) {
    m_tickAccumulator = state.tickAccumulator;
    m_lastCheckedTotalDays = state.lastCheckedTotalDays;
    m_lastCheckedSeason = state.lastCheckedSeason;
}

void ClockDriver::acceptTimeSkip() {
    m_tickAccumulator = 0.0;
}

void ClockDriver::forceUpdate() {
    updateSeasonalRates();
    checkSeasonChange("manually");
    m_display.refresh();
}

void ClockDriver::run() {
    if (!m_enabled) return;

    const bool isDay = m_world->timeOfDay() < kSunsetTicks;
    m_tickAccumulator += m_rates.rateFor(isDay);

    const double whole = std::floor(m_tickAccumulator);
    if (whole >= 1.0) {
        m_world->advanceBy(static_cast<std::int64_t>(whole));
        m_tickAccumulator -= whole;
    }

    const std::int64_t currentTotalDays = m_world->totalDays();
    if (currentTotalDays > m_lastCheckedTotalDays) {
        const std::int64_t daysPassed = currentTotalDays - m_lastCheckedTotalDays;
        for (std::int64_t i = 0; i < daysPassed; ++i) {
            m_date.advance();
            std::cout << "[Clock] A new day begins: " << m_date.toString() << "\n";
            m_notifier.dayAdvanced(m_date);
            m_scheduler.onNewDay();
        }
        m_lastCheckedTotalDays = currentTotalDays;

        if (m_date.month() != m_cachedMonth) {
            updateSeasonalRates();
            checkSeasonChange("naturally");
        }
    }

    if (m_debug) {
        std::cout << "[Clock] t=" << m_world->fullTime() << " acc=" << m_tickAccumulator
                  << " rate=" << m_rates.rateFor(isDay) << "\n";
    }

    m_display.refresh();
}

void ClockDriver::updateSeasonalRates() {
    m_cachedMonth = m_date.month();
    m_rates.refresh(m_date.season());
}

void ClockDriver::checkSeasonChange(const char* reason) {
    const Season newSeason = m_date.season();
    if (newSeason == m_lastCheckedSeason) return;

    std::cout << "[Clock] Season changed " << reason << " from " << SeasonName(m_lastCheckedSeason)
              << " to " << SeasonName(newSeason) << "\n";
    const Season oldSeason = m_lastCheckedSeason;
    m_lastCheckedSeason = newSeason;
    m_notifier.seasonChanged(oldSeason, newSeason);
}
