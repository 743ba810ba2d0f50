/*
 * WorldActionDispatcher.h
 *
 * Purpose:
 *   Declares WorldActionDispatcher, the demo host's interpreter for event start/end actions.
 *
 * Supported actions:
 *   weather <clear|rain|thunder>   : sets the WorldClock weather
 *   time add <ticks>               : advances the world counter
 *   say <text>                     : broadcasts a line to the log
 *
 * Notes:
 *   - Unknown or malformed actions are logged as warnings and otherwise ignored.
 */

#pragma once

#include <string>

#include "core/ActionDispatcher.h"
#include "environment/WorldClock.h"

class WorldActionDispatcher : public ActionDispatcher {
public:
    explicit WorldActionDispatcher(WorldClock& world) : m_world(world) {}

    void dispatch(const std::string& action) override;

    // Number of actions executed successfully.
    int executed() const { return m_executed; }

private:
    WorldClock& m_world;
    int m_executed = 0;
};
