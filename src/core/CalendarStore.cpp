/*
 * CalendarStore.cpp
 *
 * Purpose:
 *   Implements persistence of the calendar date and active event (yaml-cpp emitter + loader).
 *
 * Notes:
 *   - Writes go to "<path>.tmp" first and are renamed over the target.
 */

#include "core/CalendarStore.h"

#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "environment/HostWorld.h"

bool CalendarStore::exists() const {
    std::error_code ec;
    return std::filesystem::exists(m_path, ec);
}

bool CalendarStore::load(StoredCalendar& out) {
    if (!exists()) return false;

    try {
        const YAML::Node root = YAML::LoadFile(m_path);
        const YAML::Node cal = root["calendar"];
        if (!cal || !cal.IsMap() || !cal["day"]) {
            std::cerr << "[Store] " << m_path << " has no calendar section\n";
            return false;
        }

        StoredCalendar data;
        data.date = CalendarDate(cal["day"].as<int>(), cal["month"].as<int>(1), cal["year"].as<int>(1));
        data.savedTicks = cal["saved-ticks"].as<std::int64_t>(0);

        const CalendarDate& d = data.date;
        if (d.month() < 1 || d.month() > 12 || d.year() < 1 ||
            d.day() < 1 || d.day() > d.daysInCurrentMonth()) {
            std::cerr << "[Store] " << m_path << " holds an invalid date " << d.day() << "/"
                      << d.month() << "/" << d.year() << "\n";
            return false;
        }

        const YAML::Node active = root["active-event"];
        if (active && active.IsMap()) {
            data.activeEventId = active["id"].as<std::string>("");
            data.activeDaysRemaining = active["days-remaining"].as<int>(0);
        }
        out = data;
    } catch (const YAML::Exception& e) {
        std::cerr << "[Store] Failed to read " << m_path << ": " << e.what() << "\n";
        return false;
    }

    rememberWriteTime();
    return true;
}

bool CalendarStore::save(const StoredCalendar& data) {
    YAML::Emitter em;
    em << YAML::BeginMap;
    em << YAML::Key << "calendar" << YAML::Value << YAML::BeginMap;
    em << YAML::Key << "day" << YAML::Value << data.date.day();
    em << YAML::Key << "month" << YAML::Value << data.date.month();
    em << YAML::Key << "year" << YAML::Value << data.date.year();
    em << YAML::Key << "saved-ticks" << YAML::Value << static_cast<long long>(data.savedTicks);
    em << YAML::EndMap;
    if (!data.activeEventId.empty()) {
        em << YAML::Key << "active-event" << YAML::Value << YAML::BeginMap;
        em << YAML::Key << "id" << YAML::Value << data.activeEventId;
        em << YAML::Key << "days-remaining" << YAML::Value << data.activeDaysRemaining;
        em << YAML::EndMap;
    }
    em << YAML::EndMap;

    if (!em.good()) {
        std::cerr << "[Store] Failed to serialize calendar: " << em.GetLastError() << "\n";
        return false;
    }

    const std::string tmp = m_path + ".tmp";
    {
        std::ofstream outFile(tmp, std::ios::out | std::ios::trunc);
        if (!outFile) {
            std::cerr << "[Store] Failed to open " << tmp << " for writing\n";
            return false;
        }
        outFile << em.c_str() << "\n";
        if (!outFile) {
            std::cerr << "[Store] Failed to write " << tmp << "\n";
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, m_path, ec);
    if (ec) {
        std::cerr << "[Store] Failed to replace " << m_path << ": " << ec.message() << "\n";
        std::filesystem::remove(tmp, ec);
        return false;
    }

    rememberWriteTime();
    std::cout << "[Store] Calendar saved: " << data.date.toString() << "\n";
    return true;
}

bool CalendarStore::modifiedExternally() const {
    if (!m_hasWriteTime) return false;
    std::error_code ec;
    const auto now = std::filesystem::last_write_time(m_path, ec);
    if (ec) return false;
    return now != m_writeTime;
}

void CalendarStore::rememberWriteTime() {
    std::error_code ec;
    const auto t = std::filesystem::last_write_time(m_path, ec);
    m_hasWriteTime = !ec;
    if (!ec) m_writeTime = t;
}

std::int64_t CatchUpOfflineDays(CalendarDate& date, std::int64_t savedTicks, std::int64_t currentTicks) {
    if (currentTicks <= savedTicks) return 0;
    const std::int64_t days = (currentTicks - savedTicks) / kDayCycleTicks;
    for (std::int64_t i = 0; i < days; ++i) date.advance();
    return days;
}
