/*
 * Environment.h
 *
 * Purpose:
 *   Declares the Environment facade that aggregates the host world clock, seasonal effects and
 *   sun state. Provides a single update entry point and accessors for dependent systems.
 *
 * Responsibilities:
 *   - Advance the host world's own daylight cycle (when it owns time).
 *   - Advance seasonal palette transitions.
 *   - Update the Sun from world time and the current palette.
 *
 * Usage:
 *   - Register effects() on the calendar notifier.
 *   - Call update(dt) once per frame; query skyColor() / sun() for rendering.
 */

#pragma once

#include <glm/glm.hpp>

#include "environment/SeasonalEffects.h"
#include "environment/Sun.h"
#include "environment/WorldClock.h"

class Environment {
public:
    /*
     * Updates the environment simulation.
     *
     * Parameters:
     *   dt : Delta time in seconds. Expected to be non-negative.
     */
    void update(float dt);

    WorldClock& world() { return m_world; }
    const WorldClock& world() const { return m_world; }

    SeasonalEffects& effects() { return m_effects; }
    const SeasonalEffects& effects() const { return m_effects; }

    const Sun& sun() const { return m_sun; }

    // Sky colour blended between the season's night and day colours, darkened by weather.
    glm::vec3 skyColor() const;

private:
    WorldClock m_world;
    SeasonalEffects m_effects;
    Sun m_sun;
};
