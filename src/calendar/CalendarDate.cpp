/*
 * CalendarDate.cpp
 *
 * Purpose:
 *   Implements calendar arithmetic: leap years, month lengths and day advancement.
 */

#include "calendar/CalendarDate.h"

#include <array>
#include <sstream>

namespace {

constexpr std::array<int, 12> kDaysPerMonth = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

constexpr std::array<const char*, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

} // namespace

bool CalendarDate::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::daysInMonth(int month, int year) {
    if (month < 1 || month > 12) return 31;
    if (month == 2 && isLeapYear(year)) return 29;
    return kDaysPerMonth[month - 1];
}

const char* CalendarDate::monthName(int month) {
    if (month < 1 || month > 12) return "Invalid Month";
    return kMonthNames[month - 1];
}

void CalendarDate::advance() {
    ++m_day;
    if (m_day > daysInMonth(m_month, m_year)) {
        m_day = 1;
        ++m_month;
        if (m_month > 12) {
            m_month = 1;
            ++m_year;
        }
    }
}

bool CalendarDate::setDay(int value) {
    if (value < 1 || value > daysInCurrentMonth()) return false;
    m_day = value;
    return true;
}

bool CalendarDate::setMonth(int value) {
    if (value < 1 || value > 12) return false;
    m_month = value;
    return true;
}

bool CalendarDate::setYear(int value) {
    if (value < 1) return false;
    m_year = value;
    return true;
}

std::string CalendarDate::toString() const {
    std::ostringstream ss;
    ss << m_day << " " << monthName(m_month) << " " << m_year;
    return ss.str();
}
