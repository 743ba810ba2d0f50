/*
 * Sun.cpp
 *
 * Purpose:
 *   Derives a directional light (direction, color, intensity) from the host world time and the
 *   seasonal palette.
 *
 * Model:
 *   - Hour angle from the world clock; host tick 0 is sunrise, tick 6000 is noon.
 *   - The arc is tilted so the noon elevation equals the palette's noonElevation
 *     (low winter sun, high summer sun).
 *   - Color warms near the horizon and takes the season's sun tint.
 *   - Intensity follows elevation and the season's light factor.
 */

#include "environment/Sun.h"
#include <glm/gtc/constants.hpp>
#include <cmath>

void Sun::update(const WorldClock& world, const SeasonPalette& palette) {
    const float hourAngle = (world.normalizedTime() - 0.25f) * glm::two_pi<float>();
    const float tilt = glm::clamp(palette.noonElevation, 0.05f, glm::half_pi<float>());

    const float s = std::sin(hourAngle);
    m_light.direction = glm::normalize(glm::vec3(std::cos(hourAngle),
                                                 s * std::sin(tilt),
                                                 s * std::cos(tilt)));

    const float elevation = m_light.direction.y;

    m_day = glm::smoothstep(0.0f, 0.3f, elevation);
    const float warmth = 1.0f - glm::smoothstep(0.0f, 0.25f, std::abs(elevation));

    const glm::vec3 white(1.0f, 0.97f, 0.92f);
    const glm::vec3 ember(1.0f, 0.45f, 0.20f);

    m_light.color = glm::mix(white, ember, 0.75f * warmth) * palette.sunTint;
    m_light.intensity = (0.1f + 2.2f * m_day) * palette.lightScale;
}
