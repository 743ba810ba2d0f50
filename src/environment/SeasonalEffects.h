/*
 * SeasonalEffects.h
 *
 * Purpose:
 *   Declares SeasonalEffects, the environment collaborator that reacts to season changes by
 *   blending sky/sun tints and ground snow cover towards the new season's palette.
 *
 * Integration:
 *   - Register on the CalendarNotifier. onSeasonChanged() starts a timed transition,
 *     onSystemsStarted() snaps to the current season, onSystemsStopped() stops all effects.
 *   - Call update(dt) once per frame to advance the blend.
 *
 * Notes:
 *   - Colours are linear RGB in [0,1].
 */

#pragma once

#include <glm/glm.hpp>

#include "core/CalendarListener.h"

struct SeasonPalette {
    glm::vec3 skyDay{0.45f, 0.65f, 0.90f};
    glm::vec3 skyNight{0.02f, 0.03f, 0.08f};
    glm::vec3 sunTint{1.0f, 1.0f, 1.0f};
    float snowCover = 0.0f;      // 0 = bare ground, 1 = fully snowed.
    float lightScale = 1.0f;     // Multiplier on sun intensity.
    float noonElevation = 0.9f;  // Sun elevation at noon, radians.
};

class SeasonalEffects : public CalendarListener {
public:
    // Seconds to blend from one palette to the next.
    static constexpr float kTransitionSeconds = 8.0f;

    static SeasonPalette paletteFor(Season season);

    void onSeasonChanged(Season oldSeason, Season newSeason) override;
    void onSystemsStarted(const CalendarDate& date, Season season) override;
    void onSystemsStopped() override;

    /*
     * Advances the active palette transition.
     *
     * Parameters:
     *   dt : Delta time in seconds. Expected to be non-negative.
     */
    void update(float dt);

    const SeasonPalette& current() const { return m_current; }
    Season season() const { return m_season; }

    // false after onSystemsStopped() until the next start/season change.
    bool active() const { return m_active; }

    // 1 when no transition is running.
    float transitionProgress() const { return m_progress; }

    int seasonChanges() const { return m_seasonChanges; }

private:
    void beginTransition(Season season);

    Season m_season = Season::Winter;
    bool m_active = false;

    SeasonPalette m_from;
    SeasonPalette m_to;
    SeasonPalette m_current;
    float m_progress = 1.0f;

    int m_seasonChanges = 0;
};
