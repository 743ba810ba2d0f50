/*
 * EventScheduler.h
 *
 * Purpose:
 *   Declares EventScheduler, the single-active-event state machine evaluated once per calendar day.
 *
 * States:
 *   - Idle   : no active slot.
 *   - Active : one {event, daysRemaining} slot. daysRemaining counts down once per new day and
 *              the event ends when it reaches 0. Indefinite events (durationDays == -1) only end
 *              through endActiveEvent(), handleDateChange() or forceStartEvent().
 *
 * Transitions dispatch the event's start/end actions through ActionDispatcher and emit
 * eventStarted/eventEnded on the notifier. Every end goes through endActiveEvent(), so end
 * actions run exactly once per activation.
 *
 * Ownership / lifetime:
 *   - Holds references to the date, catalog, dispatcher and notifier; all must outlive it.
 *   - The active slot stores a copy of the definition, so it stays valid across catalog reloads.
 */

#pragma once

#include <optional>
#include <random>
#include <string>

#include "calendar/CalendarDate.h"
#include "core/ActionDispatcher.h"
#include "core/CalendarListener.h"
#include "events/EventCatalog.h"

class EventScheduler {
public:
    EventScheduler(const CalendarDate& date,
                   const EventCatalog& catalog,
                   ActionDispatcher& actions,
                   CalendarNotifier& notifier);

    /*
     * Daily evaluation.
     *
     * Behavior:
     *   1) If Active: decrement daysRemaining when positive; end the event if it reached 0 and
     *      the event is not indefinite.
     *   2) If Idle (possibly just ended): start the first eligible event in catalog order.
     *      At most one event starts per call.
     */
    void onNewDay();

    /*
     * Discontinuous date change (operator command).
     *
     * Behavior:
     *   - Ends any active event regardless of remaining duration, then runs onNewDay() for the
     *     new date.
     */
    void handleDateChange();

    /*
     * Starts an event by id, bypassing eligibility.
     *
     * Returns:
     *   false if the id is unknown (no state change). Otherwise an active event is ended first
     *   and the requested one is started.
     */
    bool forceStartEvent(const std::string& id);

    /*
     * Ends the active event, dispatching its end actions.
     *
     * Returns:
     *   true if an event was active.
     */
    bool endActiveEvent();

    /*
     * Re-installs an active slot from a snapshot without dispatching start actions.
     *
     * Returns:
     *   false if the id is not in the catalog or an event is already active.
     */
    bool restoreActiveEvent(const std::string& id, int daysRemaining);

    // Eligibility predicate for the current date. Random kinds consume one draw.
    bool isEligible(const EventDefinition& event);

    bool hasActiveEvent() const { return m_active.has_value(); }

    // nullptr when Idle.
    const EventDefinition* activeEvent() const { return m_active ? &m_active->event : nullptr; }

    // 0 when Idle; -1 for indefinite events.
    int daysRemaining() const { return m_active ? m_active->daysRemaining : 0; }

private:
    struct ActiveSlot {
        EventDefinition event;
        int daysRemaining = 0;
    };

    void startEvent(const EventDefinition& event);
    void dispatchAll(const std::vector<std::string>& actions);

    const CalendarDate& m_date;
    const EventCatalog& m_catalog;
    ActionDispatcher& m_actions;
    CalendarNotifier& m_notifier;

    std::optional<ActiveSlot> m_active;

    // Random-event draws; seeded from std::random_device.
    std::mt19937 m_rng;
    std::uniform_int_distribution<int> m_percent{0, 99};
};
