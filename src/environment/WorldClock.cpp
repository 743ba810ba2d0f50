/*
 * WorldClock.cpp
 *
 * Purpose:
 *   Implements the host world's native time advance.
 *
 * Model:
 *   - The native cycle accumulates dt * kNativeTicksPerSecond * cycleSpeed and applies the whole
 *     part to the tick counter; the fraction stays in m_nativeAcc.
 */

#include "environment/WorldClock.h"

#include <cmath>

void WorldClock::advanceBy(std::int64_t ticks) {
    if (ticks > 0) m_fullTime += ticks;
}

void WorldClock::update(float dt) {
    if (!m_daylightCycle || dt <= 0.0f) return;

    m_nativeAcc += static_cast<double>(dt) * kNativeTicksPerSecond * m_cycleSpeed;
    double whole = std::floor(m_nativeAcc);
    if (whole >= 1.0) {
        m_fullTime += static_cast<std::int64_t>(whole);
        m_nativeAcc -= whole;
    }
}

float WorldClock::normalizedTime() const {
    // Tick 0 is 06:00, so shift by a quarter day before normalizing.
    const std::int64_t shifted = (timeOfDay() + kDayCycleTicks / 4) % kDayCycleTicks;
    return static_cast<float>(shifted) / static_cast<float>(kDayCycleTicks);
}
