/*
 * CalendarSystem.cpp
 *
 * Purpose:
 *   Implements calendar lifecycle: startup, shutdown, reload and the operator/sleep entry points.
 *
 * Calendar load order:
 *   1) Data file (offline days since saved-ticks are replayed silently).
 *   2) Legacy calendar section of the main config, migrated once into the data file.
 *   3) First start at 1 January year 1, replaying the world's elapsed days silently.
 */

#include "app/CalendarSystem.h"

#include <algorithm>
#include <iostream>
#include <utility>

CalendarSystem::CalendarSystem(std::string configPath, HostWorld* world, ActionDispatcher& actions)
    : m_configPath(std::move(configPath)), m_world(world), m_actions(actions) {}

CalendarSystem::~CalendarSystem() {
    shutdown();
}

bool CalendarSystem::startup() {
    if (m_systems) return true;

    auto sys = std::make_unique<Systems>();
    const bool configOk = loadConfiguration(*sys);
    useStore(sys->config.dataFile);

    if (m_world) m_world->setDaylightCycle(false);

    StoredCalendar stored;
    loadCalendar(*sys, stored);
    buildComponents(*sys);

    if (!stored.activeEventId.empty() &&
        !sys->scheduler->restoreActiveEvent(stored.activeEventId, stored.activeDaysRemaining)) {
        std::cerr << "[Calendar] Warning: saved active event '" << stored.activeEventId
                  << "' is not in the catalog; dropped\n";
    }

    m_systems = std::move(sys);
    m_notifier.systemsStarted(m_systems->date, m_systems->date.season());
    m_systems->display->refresh();

    std::cout << "[Calendar] Started on " << m_systems->date.toString() << " ("
              << SeasonName(m_systems->date.season()) << ")\n";
    return configOk;
}

void CalendarSystem::shutdown() {
    if (!m_systems) return;

    save();
    teardown();
    if (m_world) m_world->setDaylightCycle(true);
    std::cout << "[Calendar] Stopped\n";
}

void CalendarSystem::reload() {
    if (!m_systems) {
        startup();
        return;
    }
    std::cout << "[Calendar] Reloading...\n";

    const bool diskWins = m_store->modifiedExternally();

    auto sys = std::make_unique<Systems>();
    loadConfiguration(*sys);

    // An active event that no longer exists ends under the old definitions, once.
    if (const EventDefinition* active = m_systems->scheduler->activeEvent()) {
        if (!sys->catalog.find(active->id)) {
            std::cout << "[Calendar] Active event '" << active->id << "' was removed from the catalog\n";
            m_systems->scheduler->endActiveEvent();
        }
    }

    // The stored record replaces the live slot; a live event it does not carry ends here.
    if (diskWins) {
        if (const EventDefinition* active = m_systems->scheduler->activeEvent()) {
            StoredCalendar onDisk;
            const bool readable = CalendarStore(sys->config.dataFile).load(onDisk);
            if (!readable || EventCatalog::normalizeId(onDisk.activeEventId) != active->id) {
                std::cout << "[Calendar] Active event '" << active->id
                          << "' is not in the edited data file; ending it\n";
                m_systems->scheduler->endActiveEvent();
            }
        }
    }

    const Snapshot snap = takeSnapshot();
    if (diskWins) {
        std::cout << "[Calendar] " << m_store->path() << " changed on disk; using the stored date\n";
    } else {
        save();
    }
    teardown();

    useStore(sys->config.dataFile);

    StoredCalendar stored;
    if (diskWins) {
        loadCalendar(*sys, stored);
    } else {
        sys->date = snap.date;
        stored.activeEventId = snap.activeEventId;
        stored.activeDaysRemaining = snap.activeDaysRemaining;
    }
    buildComponents(*sys);

    ClockDriver::State clockState = snap.clock;
    if (diskWins) clockState.lastCheckedTotalDays = sys->clock->lastCheckedTotalDays();
    sys->clock->restore(clockState);

    if (!stored.activeEventId.empty() &&
        !sys->scheduler->restoreActiveEvent(stored.activeEventId, stored.activeDaysRemaining)) {
        std::cerr << "[Calendar] Warning: active event '" << stored.activeEventId
                  << "' could not be restored\n";
    }

    m_systems = std::move(sys);
    m_notifier.systemsStarted(m_systems->date, m_systems->date.season());
    m_systems->clock->forceUpdate();
    std::cout << "[Calendar] Reloaded on " << m_systems->date.toString() << "\n";
}

void CalendarSystem::tick() {
    if (!m_systems) return;
    m_systems->clock->run();
}

void CalendarSystem::applyDateChange() {
    if (!m_systems) return;
    m_systems->clock->forceUpdate();
    m_systems->scheduler->handleDateChange();
    m_systems->display->refresh();
}

bool CalendarSystem::handleSleepProgress(int sleeping, int total) {
    if (!m_systems || !m_world || total <= 0) return false;

    const double pct = static_cast<double>(sleeping) / static_cast<double>(total) * 100.0;
    if (pct < m_systems->config.sleepingPercentage) return false;

    std::cout << "[Calendar] " << static_cast<int>(pct)
              << "% of players are sleeping; handing the daylight cycle to the host\n";
    m_world->setDaylightCycle(true);
    return true;
}

bool CalendarSystem::handleWake() {
    if (!m_systems || !m_world) return false;

    const std::int64_t t = m_world->timeOfDay();
    if (t < 0 || t >= 1000) return false;

    std::cout << "[Calendar] Morning reached; taking back the daylight cycle\n";
    m_world->setDaylightCycle(false);
    m_systems->clock->acceptTimeSkip();
    return true;
}

bool CalendarSystem::save() {
    if (!m_systems || !m_store) return false;
    return m_store->save(makeRecord());
}

void CalendarSystem::addViewer(StatusSink* viewer) {
    if (!viewer) return;
    if (std::find(m_viewers.begin(), m_viewers.end(), viewer) == m_viewers.end()) {
        m_viewers.push_back(viewer);
    }
    if (m_systems) m_systems->display->addViewer(viewer);
}

void CalendarSystem::removeViewer(StatusSink* viewer) {
    m_viewers.erase(std::remove(m_viewers.begin(), m_viewers.end(), viewer), m_viewers.end());
    if (m_systems) m_systems->display->removeViewer(viewer);
}

bool CalendarSystem::loadConfiguration(Systems& sys) {
    const bool ok = LoadConfigFile(m_configPath, sys.config);
    sys.catalog.loadFromFile(sys.config.eventsFile);
    return ok;
}

void CalendarSystem::loadCalendar(Systems& sys, StoredCalendar& stored) {
    const std::int64_t now = worldTicks();

    if (m_store->load(stored)) {
        const std::int64_t days = CatchUpOfflineDays(stored.date, stored.savedTicks, now);
        if (days > 0) {
            std::cout << "[Calendar] Catching up " << days << " days passed while offline\n";
        }
        sys.date = stored.date;
        return;
    }

    stored = StoredCalendar{};
    const LegacyCalendar& legacy = sys.config.legacy;
    if (legacy.present) {
        CalendarDate d;
        if (d.setYear(legacy.year) && d.setMonth(legacy.month) && d.setDay(legacy.day)) {
            CatchUpOfflineDays(d, legacy.savedTicks, now);
            sys.date = d;
            stored.date = d;
            stored.savedTicks = now;
            std::cout << "[Calendar] Migrating legacy calendar record to " << m_store->path() << "\n";
            m_store->save(stored);
            return;
        }
        std::cerr << "[Calendar] Warning: legacy calendar record is invalid; ignored\n";
    }

    sys.date = CalendarDate();
    const std::int64_t initialDays = now / kDayCycleTicks;
    if (initialDays > 0) {
        std::cout << "[Calendar] First start: syncing with " << initialDays
                  << " days already passed in the world\n";
        for (std::int64_t i = 0; i < initialDays; ++i) sys.date.advance();
    }
    stored.date = sys.date;
}

void CalendarSystem::buildComponents(Systems& sys) {
    sys.rates = std::make_unique<SeasonalRateTable>(sys.config.timeCycle, sys.config.intervalSeconds);
    sys.display = std::make_unique<StatusDisplay>(sys.date, m_world, sys.config.status);
    sys.scheduler = std::make_unique<EventScheduler>(sys.date, sys.catalog, m_actions, m_notifier);
    sys.clock = std::make_unique<ClockDriver>(m_world, sys.date, *sys.scheduler, *sys.rates,
                                              *sys.display, m_notifier, sys.config.debugMode);
    sys.crops = std::make_unique<CropGrowthPolicy>(sys.config.seasonalCrops,
                                                   sys.config.outOfSeasonGrowthChance);

    for (StatusSink* viewer : m_viewers) sys.display->addViewer(viewer);
}

void CalendarSystem::useStore(const std::string& path) {
    if (!m_store || m_store->path() != path) {
        m_store = std::make_unique<CalendarStore>(path);
    }
}

void CalendarSystem::teardown() {
    if (!m_systems) return;
    m_systems->clock->cancel();
    m_systems->display->removeAllViewers();
    m_notifier.systemsStopped();
    m_systems.reset();
}

CalendarSystem::Snapshot CalendarSystem::takeSnapshot() const {
    Snapshot snap;
    snap.date = m_systems->date;
    snap.clock = m_systems->clock->state();
    if (const EventDefinition* active = m_systems->scheduler->activeEvent()) {
        snap.activeEventId = active->id;
        snap.activeDaysRemaining = m_systems->scheduler->daysRemaining();
    }
    return snap;
}

StoredCalendar CalendarSystem::makeRecord() const {
    StoredCalendar rec;
    rec.date = m_systems->date;
    rec.savedTicks = worldTicks();
    if (const EventDefinition* active = m_systems->scheduler->activeEvent()) {
        rec.activeEventId = active->id;
        rec.activeDaysRemaining = m_systems->scheduler->daysRemaining();
    }
    return rec;
}
