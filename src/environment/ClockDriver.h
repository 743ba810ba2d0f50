/*
 * ClockDriver.h
 *
 * Purpose:
 *   Declares ClockDriver, the periodic task that drives host time at the seasonal rate and turns
 *   host day boundaries into calendar days.
 *
 * Per invocation (run()):
 *   1) Phase: day while timeOfDay < kSunsetTicks, night otherwise.
 *   2) tickAccumulator += phase rate (ticks per invocation).
 *   3) Apply floor(tickAccumulator) ticks to the host, keep the fraction. The rounding error never
 *      exceeds one tick, whatever the number of invocations.
 *   4) For every host day elapsed since lastCheckedTotalDays: CalendarDate::advance(),
 *      dayAdvanced notification, EventScheduler::onNewDay(), in that order.
 *   5) On a month change: refresh the rate table; on a season change: seasonChanged(old,new),
 *      exactly once.
 *   6) Refresh the status display.
 *
 * Failure policy:
 *   - Constructed without a host world, the driver logs an error and stays disabled; run() is a
 *     no-op. forceUpdate() still refreshes rates and season.
 */

#pragma once

#include <cstdint>

#include "calendar/CalendarDate.h"
#include "core/CalendarListener.h"
#include "environment/HostWorld.h"
#include "environment/SeasonalRateTable.h"
#include "events/EventScheduler.h"
#include "ui/StatusDisplay.h"

class ClockDriver {
public:
    // Fields carried across a reload.
    struct State {
        double tickAccumulator = 0.0;
        std::int64_t lastCheckedTotalDays = 0;
        Season lastCheckedSeason = Season::Winter;
    };

    ClockDriver(HostWorld* world,
                CalendarDate& date,
                EventScheduler& scheduler,
                SeasonalRateTable& rates,
                StatusDisplay& display,
                CalendarNotifier& notifier,
                bool debug = false);

    // One periodic invocation.
    void run();

    /*
     * The host jumped time forward on its own (sleep).
     *
     * Behavior:
     *   - Resets the fractional accumulator only. The day baseline is kept, so the next run()
     *     still replays the skipped days.
     */
    void acceptTimeSkip();

    /*
     * Applies an operator change immediately instead of on the next run().
     *
     * Behavior:
     *   - Refreshes the rate table from the current month, emits a season change if the season
     *     differs from the last observed one, then refreshes the display.
     */
    void forceUpdate();

    State state() const { return State{m_tickAccumulator, m_lastCheckedTotalDays, m_lastCheckedSeason}; }

    // Restores a snapshot taken from a previous driver instance. A season that differs from the
    // current date's is reported by the next forceUpdate() or run().
    void restore(const State& state);

    bool isEnabled() const { return m_enabled; }

    // Stops further invocations (teardown); run() becomes a no-op.
    void cancel() { m_enabled = false; }

    double tickAccumulator() const { return m_tickAccumulator; }
    std::int64_t lastCheckedTotalDays() const { return m_lastCheckedTotalDays; }
    Season lastCheckedSeason() const { return m_lastCheckedSeason; }

private:
    void updateSeasonalRates();
    void checkSeasonChange(const char* reason);

    HostWorld* m_world;
    CalendarDate& m_date;
    EventScheduler& m_scheduler;
    SeasonalRateTable& m_rates;
    StatusDisplay& m_display;
    CalendarNotifier& m_notifier;
    bool m_debug;

    bool m_enabled = true;

    // Unapplied fractional tick progress, [0,1).
    double m_tickAccumulator = 0.0;
    std::int64_t m_lastCheckedTotalDays = 0;
    Season m_lastCheckedSeason = Season::Winter;
    int m_cachedMonth = 1;
};
