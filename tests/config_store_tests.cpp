/*
Configuration loading and calendar persistence tests.
*/
#include "core/CalendarStore.h"
#include "core/Config.h"

#include <chrono>

#include "TestSupport.h"

static int test_config_defaults(void)
{
    AlmanacConfig cfg;
    EXPECT(LoadConfigString("{}", cfg), "empty document");
    EXPECT(!cfg.debugMode, "debug off");
    EXPECT(cfg.intervalSeconds == 1.0, "default interval");
    EXPECT(cfg.timeCycle[0].daySeconds == 600.0 && cfg.timeCycle[3].nightSeconds == 600.0, "default durations");
    EXPECT(cfg.sleepingPercentage == 100, "default sleeping percentage");
    EXPECT(cfg.outOfSeasonGrowthChance == 0.25, "default growth chance");
    EXPECT(cfg.status.enabled && cfg.status.showProgressBar, "status defaults");
    EXPECT(!cfg.legacy.present, "no legacy section");
    return 0;
}

static int test_config_values(void)
{
    AlmanacConfig cfg;
    EXPECT(LoadConfigString(
        "debug-mode: true\n"
        "clock: { interval-seconds: 0.5 }\n"
        "time-cycle:\n"
        "  summer: { day-duration-seconds: 900, night-duration-seconds: 300 }\n"
        "status: { format: \"{date}\", weather-rain: \"Wet\" }\n"
        "sleep-mechanics: { players-sleeping-percentage: 50 }\n"
        "seasonal-farming:\n"
        "  out-of-season-growth-chance: 0.1\n"
        "  crops: { spring: [Wheat, carrots] }\n"
        "files: { data: state.yml }\n"
        "calendar: { day: 5, month: 6, year: 7, saved-ticks: 48000 }\n", cfg), "document parses");

    EXPECT(cfg.debugMode, "debug on");
    EXPECT(cfg.intervalSeconds == 0.5, "interval");
    EXPECT(cfg.timeCycle[SeasonIndex(Season::Summer)].daySeconds == 900.0, "summer day");
    EXPECT(cfg.timeCycle[SeasonIndex(Season::Summer)].nightSeconds == 300.0, "summer night");
    EXPECT(cfg.timeCycle[SeasonIndex(Season::Winter)].daySeconds == 600.0, "winter default kept");
    EXPECT(cfg.status.format == "{date}" && cfg.status.weatherRain == "Wet", "status settings");
    EXPECT(cfg.sleepingPercentage == 50, "sleeping percentage");
    EXPECT(cfg.outOfSeasonGrowthChance == 0.1, "growth chance");
    EXPECT(cfg.seasonalCrops[SeasonIndex(Season::Spring)].size() == 2, "spring crops");
    EXPECT(cfg.dataFile == "state.yml", "data file");
    EXPECT(cfg.legacy.present && cfg.legacy.day == 5 && cfg.legacy.month == 6 &&
           cfg.legacy.year == 7 && cfg.legacy.savedTicks == 48000, "legacy calendar");
    return 0;
}

static int test_config_invalid_values(void)
{
    AlmanacConfig cfg;
    EXPECT(LoadConfigString(
        "clock: { interval-seconds: -2 }\n"
        "time-cycle: { winter: { day-duration-seconds: 0 } }\n"
        "sleep-mechanics: { players-sleeping-percentage: 250 }\n"
        "seasonal-farming: { out-of-season-growth-chance: 3 }\n", cfg), "document parses");
    EXPECT(cfg.intervalSeconds == 1.0, "negative interval replaced");
    EXPECT(cfg.timeCycle[0].daySeconds == 600.0, "zero duration replaced");
    EXPECT(cfg.sleepingPercentage == 100, "percentage replaced");
    EXPECT(cfg.outOfSeasonGrowthChance == 0.25, "chance replaced");

    EXPECT(!LoadConfigString("clock: [broken", cfg), "syntax error reported");
    EXPECT(cfg.intervalSeconds == 1.0, "defaults after a syntax error");
    return 0;
}

static int test_config_file_paths(void)
{
    ScratchDir dir("config_paths");
    dir.write("config.yml", "files: { data: state.yml, events: /abs/events.yml }\n");

    AlmanacConfig cfg;
    EXPECT(LoadConfigFile(dir.file("config.yml"), cfg), "file loads");
    EXPECT(cfg.dataFile == dir.file("state.yml"), "relative path resolved next to the config");
    EXPECT(cfg.eventsFile == "/abs/events.yml", "absolute path kept");

    AlmanacConfig missing;
    EXPECT(LoadConfigFile(dir.file("missing.yml"), missing), "missing file yields defaults");
    EXPECT(missing.dataFile == dir.file("data.yml"), "default data file next to the config");
    return 0;
}

static int test_store_round_trip(void)
{
    ScratchDir dir("store");
    CalendarStore store(dir.file("data.yml"));
    EXPECT(!store.exists(), "no file yet");

    StoredCalendar in;
    EXPECT(!store.load(in), "missing file does not load");

    in.date = CalendarDate(29, 2, 2024);
    in.savedTicks = 123456;
    in.activeEventId = "harvest";
    in.activeDaysRemaining = 2;
    EXPECT(store.save(in), "save succeeds");
    EXPECT(!store.modifiedExternally(), "own write is not external");

    StoredCalendar out;
    CalendarStore other(dir.file("data.yml"));
    EXPECT(other.load(out), "load succeeds");
    EXPECT(out.date == in.date && out.savedTicks == 123456, "date and ticks");
    EXPECT(out.activeEventId == "harvest" && out.activeDaysRemaining == 2, "active event");
    return 0;
}

static int test_store_rejects_bad_files(void)
{
    ScratchDir dir("store_bad");
    StoredCalendar out;

    dir.write("a.yml", "calendar: { day: 31, month: 2, year: 1 }\n");
    EXPECT(!CalendarStore(dir.file("a.yml")).load(out), "impossible date rejected");

    dir.write("b.yml", "calendar: [1, 2\n");
    EXPECT(!CalendarStore(dir.file("b.yml")).load(out), "syntax error rejected");

    dir.write("c.yml", "other: 1\n");
    EXPECT(!CalendarStore(dir.file("c.yml")).load(out), "missing calendar section rejected");

    CalendarStore unwritable(dir.file("no/such/dir/data.yml"));
    EXPECT(!unwritable.save(StoredCalendar{}), "save into a missing directory fails");
    return 0;
}

static int test_external_modification(void)
{
    ScratchDir dir("store_external");
    CalendarStore store(dir.file("data.yml"));
    EXPECT(store.save(StoredCalendar{}), "save");

    const auto t = std::filesystem::last_write_time(dir.file("data.yml"));
    std::filesystem::last_write_time(dir.file("data.yml"), t + std::chrono::seconds(10));
    EXPECT(store.modifiedExternally(), "changed mtime is detected");
    return 0;
}

static int test_offline_catch_up(void)
{
    CalendarDate d(30, 12, 1);
    EXPECT(CatchUpOfflineDays(d, 1000, 1000 + 3 * kDayCycleTicks + 500) == 3, "three whole days");
    EXPECT(d == CalendarDate(2, 1, 2), "date advanced over the year boundary");
    EXPECT(CatchUpOfflineDays(d, 5000, 1000) == 0, "counter behind the save replays nothing");
    EXPECT(d == CalendarDate(2, 1, 2), "date unchanged");
    return 0;
}

int main(void)
{
    if (test_config_defaults() != 0) return 1;
    if (test_config_values() != 0) return 1;
    if (test_config_invalid_values() != 0) return 1;
    if (test_config_file_paths() != 0) return 1;
    if (test_store_round_trip() != 0) return 1;
    if (test_store_rejects_bad_files() != 0) return 1;
    if (test_external_modification() != 0) return 1;
    if (test_offline_catch_up() != 0) return 1;
    return 0;
}
