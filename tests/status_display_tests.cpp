/*
Status line cache tests.
*/
#include "ui/StatusDisplay.h"
#include "environment/WorldClock.h"

#include <cmath>

#include "TestSupport.h"

static int test_format_and_progress(void)
{
    CalendarDate date(12, 3, 2024);
    WorldClock world(6000);
    StatusDisplay display(date, &world, StatusSettings{});
    RecordingSink sink;
    display.addViewer(&sink);

    display.refresh();
    EXPECT(display.title() == "12 March 2024 | Spring | Clear | 12:00", "formatted title");
    EXPECT(sink.lastTitle == display.title(), "viewer receives the title");
    EXPECT(std::fabs(sink.lastProgress - 0.25) < 1e-9, "progress is time of day over a day");
    return 0;
}

static int test_prefix_cached(void)
{
    CalendarDate date;
    WorldClock world;
    StatusDisplay display(date, &world, StatusSettings{});

    display.refresh();
    EXPECT(display.prefixRebuilds() == 1, "first refresh builds the prefix");
    for (int i = 0; i < 10; ++i) {
        world.advanceBy(100);
        display.refresh();
    }
    EXPECT(display.prefixRebuilds() == 1, "time changes do not rebuild the prefix");
    EXPECT(display.title().find("07:00") != std::string::npos, "time is still recomputed");

    date.advance();
    display.refresh();
    EXPECT(display.prefixRebuilds() == 2, "date change rebuilds");

    world.setWeather(Weather::Rain);
    display.refresh();
    EXPECT(display.prefixRebuilds() == 3, "rain rebuilds");
    EXPECT(display.title().find("Rain") != std::string::npos, "rain label");

    world.setWeather(Weather::Thunder);
    display.refresh();
    EXPECT(display.prefixRebuilds() == 4, "thunder rebuilds");
    EXPECT(display.title().find("Storm") != std::string::npos, "storm label");

    display.refresh();
    EXPECT(display.prefixRebuilds() == 4, "unchanged state keeps the cache");
    return 0;
}

static int test_custom_settings(void)
{
    CalendarDate date(1, 8, 3);
    WorldClock world(kSunsetTicks);
    StatusSettings settings;
    settings.format = "{season}: {time}";
    settings.showProgressBar = false;
    StatusDisplay display(date, &world, settings);
    RecordingSink sink;
    display.addViewer(&sink);

    display.refresh();
    EXPECT(display.title() == "Summer: 19:00", "custom format");
    EXPECT(sink.lastProgress == 0.0, "progress hidden");

    StatusSettings empty;
    empty.format = "";
    StatusDisplay blank(date, &world, empty);
    blank.refresh();
    blank.refresh();
    EXPECT(blank.prefixRebuilds() == 1, "empty format is still cached");
    return 0;
}

static int test_disabled_and_viewers(void)
{
    CalendarDate date;
    WorldClock world;
    StatusSettings off;
    off.enabled = false;
    StatusDisplay disabled(date, &world, off);
    RecordingSink sink;
    disabled.addViewer(&sink);
    disabled.refresh();
    EXPECT(sink.updates == 0, "disabled display pushes nothing");

    StatusDisplay noWorld(date, nullptr, StatusSettings{});
    noWorld.addViewer(&sink);
    noWorld.refresh();
    EXPECT(sink.updates == 0, "no host world, no refresh");

    StatusDisplay display(date, &world, StatusSettings{});
    display.addViewer(&sink);
    display.addViewer(&sink);
    display.refresh();
    EXPECT(sink.updates == 1, "viewer registered once");
    display.removeViewer(&sink);
    display.refresh();
    EXPECT(sink.updates == 1, "removed viewer gets nothing");
    return 0;
}

static int test_format_clock(void)
{
    EXPECT(StatusDisplay::formatClock(0) == "06:00", "tick 0 is 06:00");
    EXPECT(StatusDisplay::formatClock(18000) == "00:00", "midnight");
    EXPECT(StatusDisplay::formatClock(23999) == "05:59", "end of day");
    EXPECT(StatusDisplay::formatClock(1500) == "07:30", "half hour");
    return 0;
}

int main(void)
{
    if (test_format_and_progress() != 0) return 1;
    if (test_prefix_cached() != 0) return 1;
    if (test_custom_settings() != 0) return 1;
    if (test_disabled_and_viewers() != 0) return 1;
    if (test_format_clock() != 0) return 1;
    return 0;
}
