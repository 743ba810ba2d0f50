/*
 * Config.cpp
 *
 * Purpose:
 *   Implements YAML parsing of AlmanacConfig.
 */

#include "core/Config.h"

#include <filesystem>
#include <iostream>

#include <yaml-cpp/yaml.h>

namespace {

// Child lookup that tolerates missing intermediate sections.
YAML::Node Child(const YAML::Node& node, const std::string& key) {
    if (!node || !node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    return node[key];
}

double ReadPositive(const YAML::Node& node, const std::string& key, double fallback) {
    const double v = node.as<double>(fallback);
    if (v <= 0.0) {
        std::cerr << "[Config] Warning: " << key << " must be > 0 (got " << v << "), using "
                  << fallback << "\n";
        return fallback;
    }
    return v;
}

void ParseDocument(const YAML::Node& root, AlmanacConfig& cfg) {
    cfg.debugMode = Child(root, "debug-mode").as<bool>(false);
    cfg.intervalSeconds = ReadPositive(Child(Child(root, "clock"), "interval-seconds"), "clock.interval-seconds", 1.0);

    const YAML::Node cycle = Child(root, "time-cycle");
    for (Season s : kAllSeasons) {
        const std::string key = SeasonConfigKey(s);
        PhaseDurations& d = cfg.timeCycle[SeasonIndex(s)];
        d.daySeconds = ReadPositive(Child(Child(cycle, key), "day-duration-seconds"),
                                    "time-cycle." + key + ".day-duration-seconds", 600.0);
        d.nightSeconds = ReadPositive(Child(Child(cycle, key), "night-duration-seconds"),
                                      "time-cycle." + key + ".night-duration-seconds", 600.0);
    }

    const YAML::Node status = Child(root, "status");
    StatusSettings defaults;
    cfg.status.enabled = Child(status, "enabled").as<bool>(defaults.enabled);
    cfg.status.showProgressBar = Child(status, "show-progress-bar").as<bool>(defaults.showProgressBar);
    cfg.status.format = Child(status, "format").as<std::string>(defaults.format);
    cfg.status.weatherClear = Child(status, "weather-clear").as<std::string>(defaults.weatherClear);
    cfg.status.weatherRain = Child(status, "weather-rain").as<std::string>(defaults.weatherRain);
    cfg.status.weatherStorm = Child(status, "weather-storm").as<std::string>(defaults.weatherStorm);

    int pct = Child(Child(root, "sleep-mechanics"), "players-sleeping-percentage").as<int>(100);
    if (pct < 0 || pct > 100) {
        std::cerr << "[Config] Warning: players-sleeping-percentage out of range, using 100\n";
        pct = 100;
    }
    cfg.sleepingPercentage = pct;

    const YAML::Node farming = Child(root, "seasonal-farming");
    double chance = Child(farming, "out-of-season-growth-chance").as<double>(0.25);
    if (chance < 0.0 || chance > 1.0) {
        std::cerr << "[Config] Warning: out-of-season-growth-chance out of range, using 0.25\n";
        chance = 0.25;
    }
    cfg.outOfSeasonGrowthChance = chance;
    for (Season s : kAllSeasons) {
        const YAML::Node crops = Child(Child(farming, "crops"), SeasonConfigKey(s));
        if (!crops || !crops.IsSequence()) continue;
        for (const auto& c : crops) cfg.seasonalCrops[SeasonIndex(s)].push_back(c.as<std::string>());
    }

    cfg.dataFile = Child(Child(root, "files"), "data").as<std::string>(cfg.dataFile);
    cfg.eventsFile = Child(Child(root, "files"), "events").as<std::string>(cfg.eventsFile);

    const YAML::Node legacy = Child(root, "calendar");
    if (legacy && legacy.IsMap() && legacy["day"]) {
        cfg.legacy.present = true;
        cfg.legacy.day = legacy["day"].as<int>(1);
        cfg.legacy.month = legacy["month"].as<int>(1);
        cfg.legacy.year = legacy["year"].as<int>(1);
        cfg.legacy.savedTicks = legacy["saved-ticks"].as<std::int64_t>(0);
    }
}

} // namespace

bool LoadConfigString(const std::string& yaml, AlmanacConfig& out) {
    AlmanacConfig cfg;
    try {
        ParseDocument(YAML::Load(yaml), cfg);
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] Failed to parse configuration: " << e.what() << "\n";
        out = AlmanacConfig{};
        return false;
    }
    out = cfg;
    return true;
}

bool LoadConfigFile(const std::string& path, AlmanacConfig& out) {
    namespace fs = std::filesystem;
    AlmanacConfig cfg;

    try {
        ParseDocument(YAML::LoadFile(path), cfg);
    } catch (const YAML::BadFile&) {
        std::cerr << "[Config] Config file not found: " << path << ", using defaults\n";
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] Failed to parse " << path << ": " << e.what() << ", using defaults\n";
        cfg = AlmanacConfig{};
        const fs::path base = fs::path(path).parent_path();
        cfg.dataFile = (base / cfg.dataFile).string();
        cfg.eventsFile = (base / cfg.eventsFile).string();
        out = cfg;
        return false;
    }

    const fs::path base = fs::path(path).parent_path();
    if (fs::path(cfg.dataFile).is_relative()) cfg.dataFile = (base / cfg.dataFile).string();
    if (fs::path(cfg.eventsFile).is_relative()) cfg.eventsFile = (base / cfg.eventsFile).string();

    out = cfg;
    return true;
}
