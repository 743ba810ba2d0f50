/*
 * CalendarSystem.h
 *
 * Purpose:
 *   Declares CalendarSystem, the composition root that builds, runs, reloads and tears down the
 *   calendar components for one host world.
 *
 * Components (rebuilt on every startup/reload):
 *   AlmanacConfig, CalendarDate, EventCatalog, SeasonalRateTable, StatusDisplay, EventScheduler,
 *   ClockDriver, CropGrowthPolicy.
 * Kept across rebuilds:
 *   CalendarNotifier (listeners), status viewers, CalendarStore (data file bookkeeping).
 *
 * Lifecycle:
 *   startup()  -> tick() ... / operator entry points ... -> shutdown()
 *   reload() snapshots the owned state (date, clock accumulator and day baseline, active event),
 *   saves it, rebuilds from fresh configuration and re-applies the snapshot. If the data file was
 *   edited on disk since the last save/load, the on-disk record wins over the snapshot.
 *
 * Threading:
 *   - Single-threaded. All entry points must be called from the host's main loop.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "calendar/CalendarDate.h"
#include "core/ActionDispatcher.h"
#include "core/CalendarListener.h"
#include "core/CalendarStore.h"
#include "core/Config.h"
#include "environment/ClockDriver.h"
#include "environment/CropGrowth.h"
#include "environment/HostWorld.h"
#include "environment/SeasonalRateTable.h"
#include "events/EventCatalog.h"
#include "events/EventScheduler.h"
#include "ui/StatusDisplay.h"

class CalendarSystem {
public:
    /*
     * Parameters:
     *   configPath : Main YAML configuration file.
     *   world      : Host world; may be nullptr (the clock then stays disabled).
     *   actions    : Executor for event start/end actions. Must outlive the system.
     */
    CalendarSystem(std::string configPath, HostWorld* world, ActionDispatcher& actions);
    ~CalendarSystem();

    CalendarSystem(const CalendarSystem&) = delete;
    CalendarSystem& operator=(const CalendarSystem&) = delete;

    /*
     * Loads configuration, calendar and catalog, takes control of the host daylight cycle and
     * builds every component.
     *
     * Returns:
     *   false if the configuration failed to parse (defaults are used and the system still runs).
     */
    bool startup();

    // Saves state and tears everything down; returns daylight control to the host.
    void shutdown();

    // Snapshot, save, rebuild from fresh configuration, re-apply snapshot.
    void reload();

    // One clock invocation.
    void tick();

    /*
     * Re-derives everything after an operator changed the date.
     *
     * Behavior:
     *   - ClockDriver::forceUpdate(), then EventScheduler::handleDateChange(), then a display
     *     refresh.
     */
    void applyDateChange();

    /*
     * Sleep hand-off.
     *
     * handleSleepProgress returns true when enough players sleep and the host now owns the cycle.
     * handleWake returns true when the host reached the morning window [0,1000) and control was
     * taken back (the clock accumulator is reset).
     */
    bool handleSleepProgress(int sleeping, int total);
    bool handleWake();

    // Writes the current state to the data file.
    bool save();

    void addListener(CalendarListener* listener) { m_notifier.addListener(listener); }
    void removeListener(CalendarListener* listener) { m_notifier.removeListener(listener); }

    // Status viewers survive reloads.
    void addViewer(StatusSink* viewer);
    void removeViewer(StatusSink* viewer);

    bool isRunning() const { return m_systems != nullptr; }

    // Accessors; valid only while running.
    CalendarDate& date() { return m_systems->date; }
    const CalendarDate& date() const { return m_systems->date; }
    const AlmanacConfig& config() const { return m_systems->config; }
    const EventCatalog& catalog() const { return m_systems->catalog; }
    EventScheduler& scheduler() { return *m_systems->scheduler; }
    ClockDriver& clock() { return *m_systems->clock; }
    StatusDisplay& display() { return *m_systems->display; }
    SeasonalRateTable& rates() { return *m_systems->rates; }
    CropGrowthPolicy& crops() { return *m_systems->crops; }

    CalendarNotifier& notifier() { return m_notifier; }
    HostWorld* world() const { return m_world; }

private:
    struct Systems {
        AlmanacConfig config;
        CalendarDate date;
        EventCatalog catalog;
        std::unique_ptr<SeasonalRateTable> rates;
        std::unique_ptr<StatusDisplay> display;
        std::unique_ptr<EventScheduler> scheduler;
        std::unique_ptr<ClockDriver> clock;
        std::unique_ptr<CropGrowthPolicy> crops;
    };

    struct Snapshot {
        CalendarDate date;
        ClockDriver::State clock;
        std::string activeEventId;
        int activeDaysRemaining = 0;
    };

    // Config + catalog; returns the config parse result.
    bool loadConfiguration(Systems& sys);
    void loadCalendar(Systems& sys, StoredCalendar& stored);
    void buildComponents(Systems& sys);
    void useStore(const std::string& path);
    void teardown();

    Snapshot takeSnapshot() const;
    StoredCalendar makeRecord() const;
    std::int64_t worldTicks() const { return m_world ? m_world->fullTime() : 0; }

    std::string m_configPath;
    HostWorld* m_world;
    ActionDispatcher& m_actions;

    CalendarNotifier m_notifier;
    std::vector<StatusSink*> m_viewers;
    std::unique_ptr<CalendarStore> m_store;
    std::unique_ptr<Systems> m_systems;
};
