/*
Event catalog loading and trigger parsing tests.
*/
#include "events/EventCatalog.h"

#include "TestSupport.h"

static const char* kCatalog =
    "events:\n"
    "  Harvest:\n"
    "    display-name: \"Harvest Festival\"\n"
    "    type: ANNUAL\n"
    "    trigger-date: \"20/9\"\n"
    "    duration-days: 3\n"
    "    start-commands: [\"say harvest\"]\n"
    "    end-commands: [\"say done\"]\n"
    "  storm:\n"
    "    type: random\n"
    "    conditions:\n"
    "      chance: 40\n"
    "      seasons: [WINTER, autumn]\n"
    "    duration-days: -1\n"
    "  bad_kind:\n"
    "    type: WEEKLY\n"
    "  bad_trigger:\n"
    "    type: FIXED_DATE\n"
    "    trigger-date: \"25/12\"\n"
    "  bad_chance:\n"
    "    conditions:\n"
    "      chance: 150\n"
    "  bad_duration:\n"
    "    duration-days: 0\n"
    "  bad_season:\n"
    "    conditions:\n"
    "      seasons: [MONSOON]\n";

static int test_parse_entries(void)
{
    EventCatalog catalog;
    EXPECT(catalog.loadFromString(kCatalog), "catalog parses");
    EXPECT(catalog.size() == 7, "every entry is kept");

    const EventDefinition* harvest = catalog.find("HARVEST");
    EXPECT(harvest != nullptr, "lookup is case-insensitive");
    EXPECT(harvest->id == "harvest", "ids are stored lower-case");
    EXPECT(harvest->displayName == "Harvest Festival", "display name");
    EXPECT(harvest->kind == EventKind::Annual, "annual kind");
    EXPECT(harvest->trigger.day == 20 && harvest->trigger.month == 9, "annual trigger parsed");
    EXPECT(harvest->durationDays == 3, "duration");
    EXPECT(harvest->startActions.size() == 1 && harvest->endActions.size() == 1, "actions");
    EXPECT(!harvest->malformed, "valid entry is not malformed");

    const EventDefinition* storm = catalog.find("storm");
    EXPECT(storm != nullptr, "storm present");
    EXPECT(storm->kind == EventKind::Random, "kind is case-insensitive");
    EXPECT(storm->chancePercent == 40, "chance");
    EXPECT(storm->eligibleSeasons.count(Season::Winter) == 1, "winter eligible");
    EXPECT(storm->eligibleSeasons.count(Season::Autumn) == 1, "autumn eligible");
    EXPECT(storm->isIndefinite(), "duration -1 is indefinite");
    EXPECT(storm->displayName == "Unnamed Event", "default display name");
    return 0;
}

static int test_malformed_entries(void)
{
    EventCatalog catalog;
    EXPECT(catalog.loadFromString(kCatalog), "catalog parses");
    EXPECT(catalog.malformedCount() == 5, "five malformed entries");

    EXPECT(catalog.find("bad_kind")->malformed, "unknown type");
    EXPECT(catalog.find("bad_trigger")->malformed, "fixed date needs d/m/y");
    EXPECT(catalog.find("bad_chance")->malformed, "chance above 100");
    EXPECT(catalog.find("bad_chance")->chancePercent == 100, "chance clamped");
    EXPECT(catalog.find("bad_duration")->malformed, "duration 0");
    EXPECT(catalog.find("bad_duration")->durationDays == 1, "duration reset to 1");
    EXPECT(catalog.find("bad_season")->malformed, "unknown season");
    return 0;
}

static int test_unreadable_entry_keeps_the_rest(void)
{
    EventCatalog catalog;
    EXPECT(catalog.loadFromString(
               "events:\n"
               "  good: { type: ANNUAL, trigger-date: \"1/1\" }\n"
               "  nested_command: { type: ANNUAL, trigger-date: \"2/1\", start-commands: [ {a: b} ] }\n"
               "  nested_season: { conditions: { chance: 10, seasons: [ [SUMMER] ] } }\n"
               "  bad_number: { type: ANNUAL, trigger-date: \"3/1\", duration-days: soon }\n"),
           "catalog still loads");
    EXPECT(catalog.size() == 4, "every entry kept");
    EXPECT(catalog.find("good") && !catalog.find("good")->malformed, "valid entry survives");
    EXPECT(catalog.find("nested_command")->malformed, "non-string command");
    EXPECT(catalog.find("nested_command")->startActions.empty(), "nested command dropped");
    EXPECT(catalog.find("nested_season")->malformed, "non-string season");
    EXPECT(catalog.find("bad_number")->malformed, "unconvertible duration");
    EXPECT(catalog.malformedCount() == 3, "three malformed entries");
    return 0;
}

static int test_iteration_order(void)
{
    EventCatalog catalog;
    EXPECT(catalog.loadFromString("events:\n  zeta: {}\n  Alpha: {}\n  mid: {}\n"), "catalog parses");
    std::vector<std::string> ids;
    for (const auto& kv : catalog.events()) ids.push_back(kv.first);
    EXPECT(ids.size() == 3, "three entries");
    EXPECT(ids[0] == "alpha" && ids[1] == "mid" && ids[2] == "zeta", "lexicographic id order");
    return 0;
}

static int test_load_failures(void)
{
    EventCatalog catalog;
    EXPECT(catalog.loadFromString("events:\n  a: {}\n"), "first load");
    EXPECT(!catalog.loadFromString("events: [unclosed"), "syntax error reported");
    EXPECT(catalog.empty(), "failed load leaves the catalog empty");
    EXPECT(!catalog.loadFromFile("/nonexistent/almanac/events.yml"), "missing file reported");
    EXPECT(catalog.loadFromString("other: 1\n"), "document without events section");
    EXPECT(catalog.empty(), "no events section yields an empty catalog");
    return 0;
}

static int test_trigger_parsing(void)
{
    TriggerDate t;
    EXPECT(ParseTriggerDate("25/12/2024", EventKind::FixedDate, t), "fixed date");
    EXPECT(t.day == 25 && t.month == 12 && t.year == 2024, "fixed date components");
    EXPECT(!ParseTriggerDate("25/12", EventKind::FixedDate, t), "fixed date needs year");
    EXPECT(ParseTriggerDate("1/3", EventKind::Annual, t), "annual");
    EXPECT(!ParseTriggerDate("1/3/5", EventKind::Annual, t), "annual takes two parts");
    EXPECT(!ParseTriggerDate("x/3", EventKind::Annual, t), "non-numeric day");
    EXPECT(!ParseTriggerDate("", EventKind::Random, t), "random takes no trigger");
    return 0;
}

int main(void)
{
    if (test_parse_entries() != 0) return 1;
    if (test_malformed_entries() != 0) return 1;
    if (test_unreadable_entry_keeps_the_rest() != 0) return 1;
    if (test_iteration_order() != 0) return 1;
    if (test_load_failures() != 0) return 1;
    if (test_trigger_parsing() != 0) return 1;
    return 0;
}
