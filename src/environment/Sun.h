/*
 * Sun.h
 *
 * Purpose:
 *   Declares a simple Sun model that produces a DirectionalLight from the host world time and the
 *   active seasonal palette.
 *
 * Notes:
 *   - Direction points from the scene towards the sun.
 *   - The noon elevation follows the season, so winter days are dimmer and lower.
 */

#pragma once
#include <glm/glm.hpp>

#include "environment/SeasonalEffects.h"
#include "environment/WorldClock.h"

// Direction is normalized; color is linear RGB.
struct DirectionalLight {
    glm::vec3 direction{0.0f, 1.0f, 0.0f};
    glm::vec3 color{1.0f};
    float intensity = 1.0f;
};

class Sun {
public:
    // Recomputes the light from the world time and the blended seasonal palette.
    void update(const WorldClock& world, const SeasonPalette& palette);

    const DirectionalLight& light() const { return m_light; }

    // 0 below the horizon, 1 once the sun is well up.
    float dayFactor() const { return m_day; }

private:
    DirectionalLight m_light;
    float m_day = 0.0f;
};
