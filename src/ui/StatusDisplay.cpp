/*
 * StatusDisplay.cpp
 *
 * Purpose:
 *   Implements the status line cache and its per-tick refresh.
 *
 * Notes:
 *   - The prefix keeps the {time} placeholder; refresh() substitutes it every call.
 */

#include "ui/StatusDisplay.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

StatusDisplay::StatusDisplay(const CalendarDate& date, const HostWorld* world, StatusSettings settings)
    : m_date(date), m_world(world), m_settings(std::move(settings)) {}

void StatusDisplay::addViewer(StatusSink* viewer) {
    if (!viewer) return;
    if (std::find(m_viewers.begin(), m_viewers.end(), viewer) != m_viewers.end()) return;
    m_viewers.push_back(viewer);
}

void StatusDisplay::removeViewer(StatusSink* viewer) {
    m_viewers.erase(std::remove(m_viewers.begin(), m_viewers.end(), viewer), m_viewers.end());
}

std::string StatusDisplay::formatClock(long long timeOfDay) {
    const long long hour = (timeOfDay / 1000 + 6) % 24;
    const long long minute = static_cast<long long>((timeOfDay % 1000) / 1000.0 * 60.0);

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << hour << ":" << std::setw(2) << minute;
    return ss.str();
}

void StatusDisplay::refresh() {
    if (!m_settings.enabled || !m_world) return;

    const bool thundering = m_world->isThundering();
    const bool raining = m_world->hasStorm();

    const bool dateChanged = m_date.day() != m_lastDay ||
                             m_date.month() != m_lastMonth ||
                             m_date.year() != m_lastYear;
    const bool weatherChanged = thundering != m_lastThunder || raining != m_lastRain;

    if (dateChanged || weatherChanged || m_prefix.empty()) {
        rebuildPrefix(thundering, raining);
    }

    const std::int64_t t = m_world->timeOfDay();
    m_title = m_prefix;
    ReplaceAll(m_title, "{time}", formatClock(t));

    double progress = m_settings.showProgressBar
                          ? static_cast<double>(t) / static_cast<double>(kDayCycleTicks)
                          : 0.0;
    m_progress = std::max(0.0, std::min(1.0, progress));

    for (StatusSink* viewer : m_viewers) {
        viewer->showStatus(m_title, m_progress);
    }
}

void StatusDisplay::rebuildPrefix(bool thundering, bool raining) {
    m_lastDay = m_date.day();
    m_lastMonth = m_date.month();
    m_lastYear = m_date.year();
    m_lastThunder = thundering;
    m_lastRain = raining;

    const std::string& weather = thundering ? m_settings.weatherStorm
                               : raining    ? m_settings.weatherRain
                                            : m_settings.weatherClear;

    std::string prefix = m_settings.format;
    ReplaceAll(prefix, "{date}", m_date.toString());
    ReplaceAll(prefix, "{season}", SeasonName(m_date.season()));
    ReplaceAll(prefix, "{weather}", weather);

    // Non-empty prefix marks the cache as built, even for an empty format.
    m_prefix = prefix.empty() ? std::string(" ") : prefix;
    ++m_prefixRebuilds;
}
