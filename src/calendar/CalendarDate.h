/*
 * CalendarDate.h
 *
 * Purpose:
 *   Declares CalendarDate, the day/month/year triple driven by the clock.
 *
 * Model:
 *   - 1 <= day <= daysInMonth(month, year), 1 <= month <= 12, year >= 1.
 *   - Month lengths follow the 31/30/28 table; February has 29 days in Gregorian leap years.
 *   - season() is a pure function of month (see Season.h).
 *
 * Ownership:
 *   - Mutated only through advance() and the set*() overrides. The setters range-check the
 *     single component they change; the caller re-derives season/rates afterwards.
 */

#pragma once

#include <string>

#include "calendar/Season.h"

class CalendarDate {
public:
    CalendarDate() = default;
    CalendarDate(int day, int month, int year) : m_day(day), m_month(month), m_year(year) {}

    int day() const { return m_day; }
    int month() const { return m_month; }
    int year() const { return m_year; }

    Season season() const { return SeasonForMonth(m_month); }

    // Length of the current month in the current year.
    int daysInCurrentMonth() const { return daysInMonth(m_month, m_year); }

    /*
     * Advances the date by one day.
     *
     * Behavior:
     *   - Day overflow resets day to 1 and increments month.
     *   - Month overflow past 12 resets month to 1 and increments year.
     */
    void advance();

    /*
     * Direct overrides used by operator commands.
     *
     * Returns:
     *   false (and leaves the date unchanged) when value is outside the component's range:
     *     day   : [1, daysInCurrentMonth()]
     *     month : [1, 12]
     *     year  : >= 1
     */
    bool setDay(int value);
    bool setMonth(int value);
    bool setYear(int value);

    // "12 March 2024"
    std::string toString() const;

    static bool isLeapYear(int year);

    // Days in month for the given year. Out-of-range months report 31.
    static int daysInMonth(int month, int year);

    // English month name; "Invalid Month" for values outside [1,12].
    static const char* monthName(int month);

    bool operator==(const CalendarDate& o) const {
        return m_day == o.m_day && m_month == o.m_month && m_year == o.m_year;
    }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }

private:
    int m_day = 1;
    int m_month = 1;
    int m_year = 1;
};
