/*
 * EventDefinition.h
 *
 * Purpose:
 *   Declares the immutable description of a schedulable calendar event.
 *
 * Kinds:
 *   - FixedDate : triggerSpec "d/m/y"; starts on exactly that date.
 *   - Annual    : triggerSpec "d/m";   starts on that day and month of any year.
 *   - Random    : starts when today's season is eligible and a [0,100) draw is below chancePercent.
 *
 * Notes:
 *   - durationDays is -1 for events that never end on their own, otherwise >= 1.
 *   - malformed marks an entry whose configuration failed validation; such entries are never
 *     eligible for automatic start but can still be started by id.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "calendar/Season.h"

enum class EventKind : int { FixedDate = 0, Annual = 1, Random = 2 };

// Parsed trigger date. year is 0 for Annual triggers.
struct TriggerDate {
    int day = 0;
    int month = 0;
    int year = 0;
};

struct EventDefinition {
    std::string id;
    std::string displayName;
    EventKind kind = EventKind::Random;
    std::string triggerSpec;
    int chancePercent = 0;
    std::set<Season> eligibleSeasons;
    int durationDays = 1;
    std::vector<std::string> startActions;
    std::vector<std::string> endActions;

    TriggerDate trigger;
    bool malformed = false;

    bool isIndefinite() const { return durationDays == -1; }
};

// "FIXED_DATE", "ANNUAL", "RANDOM" (case-insensitive).
bool ParseEventKind(const std::string& name, EventKind& out);
const char* EventKindName(EventKind kind);

/*
 * Parses a trigger specification for the given kind.
 *
 * Parameters:
 *   spec : "d/m/y" for FixedDate, "d/m" for Annual. Random kinds take no trigger.
 *   kind : Event kind, selects the number of expected components.
 *   out  : Receives the parsed date on success.
 *
 * Returns:
 *   false if the component count does not match the kind or a component is not an integer.
 */
bool ParseTriggerDate(const std::string& spec, EventKind kind, TriggerDate& out);
