/*
 * EventScheduler.cpp
 *
 * Purpose:
 *   Implements the daily event state machine.
 */

#include "events/EventScheduler.h"

#include <algorithm>
#include <iostream>

EventScheduler::EventScheduler(const CalendarDate& date,
                               const EventCatalog& catalog,
                               ActionDispatcher& actions,
                               CalendarNotifier& notifier)
    : m_date(date), m_catalog(catalog), m_actions(actions), m_notifier(notifier) {
    std::random_device rd;
    m_rng.seed(rd());
}

void EventScheduler::onNewDay() {
    if (m_active) {
        if (m_active->daysRemaining > 0) {
            --m_active->daysRemaining;
        }
        if (m_active->daysRemaining == 0 && !m_active->event.isIndefinite()) {
            endActiveEvent();
        }
    }

    if (m_active) return;

    for (const auto& kv : m_catalog.events()) {
        if (isEligible(kv.second)) {
            startEvent(kv.second);
            break;
        }
    }
}

void EventScheduler::handleDateChange() {
    if (m_active) {
        std::cout << "[Events] Manual date change: ending '" << m_active->event.displayName << "'\n";
        endActiveEvent();
    }
    onNewDay();
}

bool EventScheduler::forceStartEvent(const std::string& id) {
    const EventDefinition* ev = m_catalog.find(id);
    if (!ev) return false;

    // Copy before ending: the definition must not alias the slot being cleared.
    const EventDefinition next = *ev;
    if (m_active) endActiveEvent();
    startEvent(next);
    return true;
}

bool EventScheduler::endActiveEvent() {
    if (!m_active) return false;

    // Clear the slot before dispatching so re-entrant queries see Idle.
    ActiveSlot ended = std::move(*m_active);
    m_active.reset();

    std::cout << "[Events] Event ended: " << ended.event.displayName << "\n";
    dispatchAll(ended.event.endActions);
    m_notifier.eventEnded(ended.event);
    return true;
}

bool EventScheduler::restoreActiveEvent(const std::string& id, int daysRemaining) {
    if (m_active) return false;
    const EventDefinition* ev = m_catalog.find(id);
    if (!ev) return false;

    int remaining = -1;
    if (!ev->isIndefinite()) {
        remaining = std::max(0, std::min(daysRemaining, ev->durationDays));
        if (remaining != daysRemaining) {
            std::cerr << "[Events] Warning: saved days-remaining " << daysRemaining << " for '" << ev->id
                      << "' is outside [0," << ev->durationDays << "]; using " << remaining << "\n";
        }
    }
    m_active = ActiveSlot{*ev, remaining};
    return true;
}

bool EventScheduler::isEligible(const EventDefinition& event) {
    if (event.malformed) return false;

    switch (event.kind) {
        case EventKind::FixedDate:
            return event.trigger.day == m_date.day() &&
                   event.trigger.month == m_date.month() &&
                   event.trigger.year == m_date.year();
        case EventKind::Annual:
            return event.trigger.day == m_date.day() &&
                   event.trigger.month == m_date.month();
        case EventKind::Random: {
            const bool seasonMatch = event.eligibleSeasons.empty() ||
                                     event.eligibleSeasons.count(m_date.season()) > 0;
            return seasonMatch && m_percent(m_rng) < event.chancePercent;
        }
    }
    return false;
}

void EventScheduler::startEvent(const EventDefinition& event) {
    m_active = ActiveSlot{event, event.durationDays};

    std::cout << "[Events] Event started: " << event.displayName << "\n";
    dispatchAll(event.startActions);
    m_notifier.eventStarted(event);
}

void EventScheduler::dispatchAll(const std::vector<std::string>& actions) {
    for (const std::string& action : actions) {
        m_actions.dispatch(action);
    }
}
