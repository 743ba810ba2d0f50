/*
 * Config.h
 *
 * Purpose:
 *   Declares AlmanacConfig, the read-only settings consumed by the calendar systems, and its YAML
 *   loader.
 *
 * Keys (all optional; defaults below):
 *   debug-mode                                   : bool
 *   clock.interval-seconds                       : real seconds per clock invocation (> 0)
 *   time-cycle.<season>.day-duration-seconds     : > 0
 *   time-cycle.<season>.night-duration-seconds   : > 0
 *   status.enabled / show-progress-bar / format / weather-clear / weather-rain / weather-storm
 *   sleep-mechanics.players-sleeping-percentage  : [0,100]
 *   seasonal-farming.out-of-season-growth-chance : [0,1]
 *   seasonal-farming.crops.<season>              : list of crop names
 *   files.data / files.events                    : paths, relative to the config file
 *   calendar.{day,month,year,saved-ticks}        : legacy date store (read once for migration)
 *
 * Failure policy:
 *   - Invalid values are logged and replaced by their defaults.
 *   - A missing file yields all defaults (logged). A parse error yields all defaults and false.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "environment/SeasonalRateTable.h"
#include "ui/StatusDisplay.h"

// Date record found in the legacy store (calendar section of the main config).
struct LegacyCalendar {
    bool present = false;
    int day = 1;
    int month = 1;
    int year = 1;
    std::int64_t savedTicks = 0;
};

struct AlmanacConfig {
    bool debugMode = false;
    double intervalSeconds = 1.0;
    SeasonDurations timeCycle{};

    StatusSettings status;

    int sleepingPercentage = 100;

    double outOfSeasonGrowthChance = 0.25;
    std::array<std::vector<std::string>, 4> seasonalCrops;

    std::string dataFile = "data.yml";
    std::string eventsFile = "events.yml";

    LegacyCalendar legacy;
};

/*
 * Loads configuration from a YAML file.
 *
 * Parameters:
 *   path : Config file path. files.data / files.events are resolved relative to its directory.
 *   out  : Receives the loaded (or default) configuration.
 *
 * Returns:
 *   false on a parse error; true otherwise (including a missing file).
 */
bool LoadConfigFile(const std::string& path, AlmanacConfig& out);

// Same as LoadConfigFile for an in-memory document; paths are left as written.
bool LoadConfigString(const std::string& yaml, AlmanacConfig& out);
