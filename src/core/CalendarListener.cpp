/*
 * CalendarListener.cpp
 *
 * Purpose:
 *   Implements CalendarNotifier fan-out.
 */

#include "core/CalendarListener.h"

#include <algorithm>

void CalendarNotifier::addListener(CalendarListener* listener) {
    if (!listener) return;
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) != m_listeners.end()) return;
    m_listeners.push_back(listener);
}

void CalendarNotifier::removeListener(CalendarListener* listener) {
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener),
                      m_listeners.end());
}

void CalendarNotifier::dayAdvanced(const CalendarDate& date) const {
    for (CalendarListener* l : m_listeners) l->onDayAdvanced(date);
}

void CalendarNotifier::seasonChanged(Season oldSeason, Season newSeason) const {
    for (CalendarListener* l : m_listeners) l->onSeasonChanged(oldSeason, newSeason);
}

void CalendarNotifier::eventStarted(const EventDefinition& event) const {
    for (CalendarListener* l : m_listeners) l->onEventStarted(event);
}

void CalendarNotifier::eventEnded(const EventDefinition& event) const {
    for (CalendarListener* l : m_listeners) l->onEventEnded(event);
}

void CalendarNotifier::systemsStarted(const CalendarDate& date, Season season) const {
    for (CalendarListener* l : m_listeners) l->onSystemsStarted(date, season);
}

void CalendarNotifier::systemsStopped() const {
    for (CalendarListener* l : m_listeners) l->onSystemsStopped();
}
