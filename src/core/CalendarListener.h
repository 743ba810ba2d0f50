/*
 * CalendarListener.h
 *
 * Purpose:
 *   Declares the notification seam between the calendar core and its collaborators
 *   (effects, status renderers, localisation, tests).
 *
 * Types:
 *   - CalendarListener : observer interface; every hook has an empty default.
 *   - CalendarNotifier : fan-out of notifications to registered listeners.
 *
 * Ownership / lifetime:
 *   - The notifier stores raw, non-owning pointers. A listener must be removed (or outlive the
 *     notifier) before it is destroyed.
 *   - Notifications are synchronous and delivered in registration order.
 */

#pragma once

#include <vector>

#include "calendar/CalendarDate.h"

struct EventDefinition;

class CalendarListener {
public:
    virtual ~CalendarListener() = default;

    // A new calendar day was reached by the clock (not emitted for offline catch-up).
    virtual void onDayAdvanced(const CalendarDate& date) { (void)date; }

    // Emitted exactly once per season boundary, including operator-driven ones.
    virtual void onSeasonChanged(Season oldSeason, Season newSeason) { (void)oldSeason; (void)newSeason; }

    virtual void onEventStarted(const EventDefinition& event) { (void)event; }
    virtual void onEventEnded(const EventDefinition& event) { (void)event; }

    // Systems were (re)built; collaborators apply the state of the current season.
    virtual void onSystemsStarted(const CalendarDate& date, Season season) { (void)date; (void)season; }

    // Systems are being torn down; collaborators stop their running effects.
    virtual void onSystemsStopped() {}
};

class CalendarNotifier {
public:
    void addListener(CalendarListener* listener);
    void removeListener(CalendarListener* listener);

    void dayAdvanced(const CalendarDate& date) const;
    void seasonChanged(Season oldSeason, Season newSeason) const;
    void eventStarted(const EventDefinition& event) const;
    void eventEnded(const EventDefinition& event) const;
    void systemsStarted(const CalendarDate& date, Season season) const;
    void systemsStopped() const;

private:
    std::vector<CalendarListener*> m_listeners;
};
