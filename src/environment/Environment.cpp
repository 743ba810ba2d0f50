/*
 * Environment.cpp
 *
 * Purpose:
 *   Implements Environment orchestration logic: host world cycle, seasonal effects, sun.
 *
 * Notes:
 *   - The calendar ClockDriver advances the world separately through HostWorld::advanceBy();
 *     update() only runs the host's own cycle, which is disabled while the calendar owns time.
 */

#include "environment/Environment.h"

void Environment::update(float dt) {
    m_world.update(dt);
    m_effects.update(dt);
    m_sun.update(m_world, m_effects.current());
}

glm::vec3 Environment::skyColor() const {
    const SeasonPalette& p = m_effects.current();
    glm::vec3 sky = glm::mix(p.skyNight, p.skyDay, m_sun.dayFactor());

    if (m_world.isThundering()) {
        sky *= 0.45f;
    } else if (m_world.hasStorm()) {
        sky *= 0.7f;
    }
    return sky;
}
