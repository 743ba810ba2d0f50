/*
Calendar date and season table tests.
*/
#include "calendar/CalendarDate.h"

#include "TestSupport.h"

static int test_leap_years(void)
{
    EXPECT(CalendarDate::isLeapYear(2024), "2024 is leap");
    EXPECT(!CalendarDate::isLeapYear(2023), "2023 is not leap");
    EXPECT(!CalendarDate::isLeapYear(1900), "1900 is not leap");
    EXPECT(CalendarDate::isLeapYear(2000), "2000 is leap");
    EXPECT(CalendarDate::daysInMonth(2, 2024) == 29, "leap February has 29 days");
    EXPECT(CalendarDate::daysInMonth(2, 2023) == 28, "February has 28 days");
    EXPECT(CalendarDate::daysInMonth(4, 2023) == 30, "April has 30 days");
    EXPECT(CalendarDate::daysInMonth(12, 2023) == 31, "December has 31 days");
    return 0;
}

static int test_advance_through_leap_february(void)
{
    CalendarDate d(28, 2, 2024);
    d.advance();
    EXPECT(d == CalendarDate(29, 2, 2024), "28 Feb 2024 advances to 29 Feb");
    d.advance();
    EXPECT(d == CalendarDate(1, 3, 2024), "29 Feb 2024 advances to 1 Mar");

    CalendarDate n(28, 2, 2023);
    n.advance();
    EXPECT(n == CalendarDate(1, 3, 2023), "28 Feb 2023 advances to 1 Mar");
    return 0;
}

static int test_year_rollover(void)
{
    CalendarDate d(31, 12, 5);
    d.advance();
    EXPECT(d == CalendarDate(1, 1, 6), "31 Dec rolls into the next year");
    EXPECT(d.season() == Season::Winter, "January is winter");
    return 0;
}

static int test_setters_range_check(void)
{
    CalendarDate d(10, 4, 3);
    EXPECT(!d.setDay(31), "April has no day 31");
    EXPECT(d.day() == 10, "failed setDay leaves day unchanged");
    EXPECT(d.setDay(30), "April 30 is valid");
    EXPECT(!d.setMonth(0), "month 0 rejected");
    EXPECT(!d.setMonth(13), "month 13 rejected");
    EXPECT(d.month() == 4, "failed setMonth leaves month unchanged");
    EXPECT(!d.setYear(0), "year 0 rejected");
    EXPECT(d.setYear(1), "year 1 accepted");
    EXPECT(d.setMonth(12), "month 12 accepted");
    EXPECT(d.season() == Season::Winter, "December is winter");
    return 0;
}

static int test_season_table(void)
{
    const Season expected[12] = {
        Season::Winter, Season::Winter, Season::Spring, Season::Spring, Season::Spring, Season::Summer,
        Season::Summer, Season::Summer, Season::Autumn, Season::Autumn, Season::Autumn, Season::Winter
    };
    for (int m = 1; m <= 12; ++m) {
        EXPECT(SeasonForMonth(m) == expected[m - 1], "month to season mapping");
    }

    Season s = Season::Winter;
    EXPECT(ParseSeason("SUMMER", s) && s == Season::Summer, "upper-case season parses");
    EXPECT(ParseSeason("autumn", s) && s == Season::Autumn, "lower-case season parses");
    EXPECT(!ParseSeason("monsoon", s), "unknown season rejected");
    EXPECT(s == Season::Autumn, "failed parse leaves output untouched");
    return 0;
}

static int test_to_string(void)
{
    CalendarDate d(12, 3, 2024);
    EXPECT(d.toString() == "12 March 2024", "date formatting");
    EXPECT(std::string(CalendarDate::monthName(13)) == "Invalid Month", "invalid month name");
    return 0;
}

int main(void)
{
    if (test_leap_years() != 0) return 1;
    if (test_advance_through_leap_february() != 0) return 1;
    if (test_year_rollover() != 0) return 1;
    if (test_setters_range_check() != 0) return 1;
    if (test_season_table() != 0) return 1;
    if (test_to_string() != 0) return 1;
    return 0;
}
