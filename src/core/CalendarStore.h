/*
 * CalendarStore.h
 *
 * Purpose:
 *   Declares CalendarStore, the YAML data file that persists the calendar between runs.
 *
 * File layout:
 *   calendar:
 *     day: 12
 *     month: 3
 *     year: 2
 *     saved-ticks: 1234567      # host tick counter at save time
 *   active-event:               # optional
 *     id: harvest_festival
 *     days-remaining: 2
 *
 * Failure policy:
 *   - load() returns false for a missing or unreadable file (logged unless simply absent).
 *   - save() logs I/O failures and returns false; it never throws.
 *
 * External edits:
 *   - The store remembers the file's modification time after each successful load/save.
 *     modifiedExternally() reports whether the file changed on disk since then.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

#include "calendar/CalendarDate.h"

struct StoredCalendar {
    CalendarDate date;
    std::int64_t savedTicks = 0;

    // Empty when no event was active.
    std::string activeEventId;
    int activeDaysRemaining = 0;
};

class CalendarStore {
public:
    explicit CalendarStore(std::string path) : m_path(std::move(path)) {}

    bool exists() const;
    bool load(StoredCalendar& out);
    bool save(const StoredCalendar& data);

    bool modifiedExternally() const;

    const std::string& path() const { return m_path; }

private:
    void rememberWriteTime();

    std::string m_path;
    bool m_hasWriteTime = false;
    std::filesystem::file_time_type m_writeTime{};
};

/*
 * Replays whole host days elapsed since savedTicks onto date, silently (calendar only).
 *
 * Returns:
 *   Number of days replayed (0 when currentTicks <= savedTicks).
 */
std::int64_t CatchUpOfflineDays(CalendarDate& date, std::int64_t savedTicks, std::int64_t currentTicks);
