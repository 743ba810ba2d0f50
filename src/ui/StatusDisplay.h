/*
 * StatusDisplay.h
 *
 * Purpose:
 *   Declares StatusDisplay, the cached status line (date | season | weather | time) and day
 *   progress shown to every registered viewer.
 *
 * Caching model:
 *   - The static prefix (date, season and weather text) is rebuilt only when day, month, year,
 *     thunder or rain changed since the previous refresh, or when the prefix is still empty.
 *   - The time-of-day and progress ratio are recomputed on every refresh.
 *
 * Ownership / lifetime:
 *   - Reads the CalendarDate and HostWorld by reference/pointer; both must outlive it.
 *   - Viewers (StatusSink) are non-owning and must be removed before they are destroyed.
 */

#pragma once

#include <string>
#include <vector>

#include "calendar/CalendarDate.h"
#include "environment/HostWorld.h"

struct StatusSettings {
    bool enabled = true;
    bool showProgressBar = true;

    // Placeholders: {date}, {season}, {weather}, {time}.
    std::string format = "{date} | {season} | {weather} | {time}";

    std::string weatherClear = "Clear";
    std::string weatherRain = "Rain";
    std::string weatherStorm = "Storm";
};

// A surface that shows the status line (window title, overlay, per-player bar).
class StatusSink {
public:
    virtual ~StatusSink() = default;
    virtual void showStatus(const std::string& title, double progress) = 0;
};

class StatusDisplay {
public:
    /*
     * Parameters:
     *   date     : Calendar state to display.
     *   world    : Host world providing the time-of-day and weather. May be nullptr, in which
     *              case refresh() does nothing.
     *   settings : Format and labels.
     */
    StatusDisplay(const CalendarDate& date, const HostWorld* world, StatusSettings settings);

    /*
     * Recomputes the status line and pushes it to all viewers.
     *
     * Notes:
     *   - No-op when disabled or when no host world is attached.
     */
    void refresh();

    void addViewer(StatusSink* viewer);
    void removeViewer(StatusSink* viewer);
    void removeAllViewers() { m_viewers.clear(); }

    const std::string& title() const { return m_title; }
    double progress() const { return m_progress; }

    const std::string& cachedPrefix() const { return m_prefix; }

    // Number of prefix rebuilds since construction.
    int prefixRebuilds() const { return m_prefixRebuilds; }

    const StatusSettings& settings() const { return m_settings; }

    // "HH:MM" for a tick position within the day (tick 0 = 06:00).
    static std::string formatClock(long long timeOfDay);

private:
    void rebuildPrefix(bool thundering, bool raining);

    const CalendarDate& m_date;
    const HostWorld* m_world;
    StatusSettings m_settings;
    std::vector<StatusSink*> m_viewers;

    std::string m_prefix;
    int m_lastDay = -1;
    int m_lastMonth = -1;
    int m_lastYear = -1;
    bool m_lastThunder = false;
    bool m_lastRain = false;
    int m_prefixRebuilds = 0;

    std::string m_title;
    double m_progress = 0.0;
};
