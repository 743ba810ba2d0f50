/*
 * SeasonalEffects.cpp
 *
 * Purpose:
 *   Implements season palettes and the timed blend between them.
 *
 * Model:
 *   - Winter: pale sky, cold sun, full snow cover, dim light.
 *   - Spring: saturated sky, neutral sun, snow melting away.
 *   - Summer: bright sky, warm sun, strongest light.
 *   - Autumn: hazy sky, amber sun.
 *   - Transitions interpolate every palette field linearly over kTransitionSeconds.
 */

#include "environment/SeasonalEffects.h"

#include <algorithm>
#include <iostream>

namespace {

SeasonPalette Mix(const SeasonPalette& a, const SeasonPalette& b, float t) {
    SeasonPalette p;
    p.skyDay = glm::mix(a.skyDay, b.skyDay, t);
    p.skyNight = glm::mix(a.skyNight, b.skyNight, t);
    p.sunTint = glm::mix(a.sunTint, b.sunTint, t);
    p.snowCover = glm::mix(a.snowCover, b.snowCover, t);
    p.lightScale = glm::mix(a.lightScale, b.lightScale, t);
    p.noonElevation = glm::mix(a.noonElevation, b.noonElevation, t);
    return p;
}

} // namespace

SeasonPalette SeasonalEffects::paletteFor(Season season) {
    SeasonPalette p;
    switch (season) {
        case Season::Winter:
            p.skyDay = {0.70f, 0.78f, 0.88f};
            p.skyNight = {0.03f, 0.04f, 0.09f};
            p.sunTint = {0.85f, 0.92f, 1.00f};
            p.snowCover = 1.0f;
            p.lightScale = 0.75f;
            p.noonElevation = 0.55f;
            break;
        case Season::Spring:
            p.skyDay = {0.42f, 0.66f, 0.95f};
            p.skyNight = {0.02f, 0.03f, 0.08f};
            p.sunTint = {1.00f, 0.98f, 0.94f};
            p.snowCover = 0.0f;
            p.lightScale = 1.0f;
            p.noonElevation = 0.9f;
            break;
        case Season::Summer:
            p.skyDay = {0.36f, 0.62f, 0.98f};
            p.skyNight = {0.02f, 0.03f, 0.07f};
            p.sunTint = {1.00f, 0.95f, 0.85f};
            p.snowCover = 0.0f;
            p.lightScale = 1.15f;
            p.noonElevation = 1.2f;
            break;
        case Season::Autumn:
            p.skyDay = {0.58f, 0.62f, 0.70f};
            p.skyNight = {0.03f, 0.03f, 0.06f};
            p.sunTint = {1.00f, 0.82f, 0.62f};
            p.snowCover = 0.0f;
            p.lightScale = 0.9f;
            p.noonElevation = 0.8f;
            break;
    }
    return p;
}

void SeasonalEffects::onSeasonChanged(Season oldSeason, Season newSeason) {
    (void)oldSeason;
    switch (newSeason) {
        case Season::Winter: std::cout << "[Effects] Winter has arrived: frost is spreading.\n"; break;
        case Season::Spring: std::cout << "[Effects] Spring has arrived: the snow is melting.\n"; break;
        case Season::Summer: std::cout << "[Effects] Summer has arrived.\n"; break;
        case Season::Autumn: std::cout << "[Effects] Autumn has arrived: the leaves are turning.\n"; break;
    }
    ++m_seasonChanges;
    beginTransition(newSeason);
}

void SeasonalEffects::onSystemsStarted(const CalendarDate& date, Season season) {
    (void)date;
    m_season = season;
    m_to = paletteFor(season);
    m_from = m_to;
    m_current = m_to;
    m_progress = 1.0f;
    m_active = true;
}

void SeasonalEffects::onSystemsStopped() {
    // Freeze wherever the blend currently is.
    m_from = m_current;
    m_to = m_current;
    m_progress = 1.0f;
    m_active = false;
}

void SeasonalEffects::update(float dt) {
    if (!m_active || m_progress >= 1.0f) return;

    m_progress = std::min(1.0f, m_progress + std::max(dt, 0.0f) / kTransitionSeconds);
    m_current = Mix(m_from, m_to, m_progress);
}

void SeasonalEffects::beginTransition(Season season) {
    m_season = season;
    m_from = m_current;
    m_to = paletteFor(season);
    m_progress = 0.0f;
    m_active = true;
}
