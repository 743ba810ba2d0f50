/*
Seasonal effects, sun and environment facade tests.
*/
#include "environment/Environment.h"

#include <cmath>

#include "TestSupport.h"

static bool Near(const glm::vec3& a, const glm::vec3& b)
{
    return glm::length(a - b) < 1e-4f;
}

static int test_start_snaps_to_season(void)
{
    SeasonalEffects effects;
    EXPECT(!effects.active(), "inactive before start");

    effects.onSystemsStarted(CalendarDate(1, 1, 1), Season::Winter);
    EXPECT(effects.active(), "active after start");
    EXPECT(effects.current().snowCover == 1.0f, "winter palette applied");
    EXPECT(effects.transitionProgress() == 1.0f, "no transition on start");
    EXPECT(effects.seasonChanges() == 0, "start is not a season change");
    return 0;
}

static int test_transition_blends(void)
{
    SeasonalEffects effects;
    effects.onSystemsStarted(CalendarDate(28, 2, 1), Season::Winter);
    effects.onSeasonChanged(Season::Winter, Season::Spring);
    EXPECT(effects.season() == Season::Spring, "target season");
    EXPECT(effects.transitionProgress() == 0.0f, "transition begins");
    EXPECT(effects.seasonChanges() == 1, "season change counted");

    effects.update(SeasonalEffects::kTransitionSeconds * 0.5f);
    EXPECT(std::fabs(effects.current().snowCover - 0.5f) < 1e-4f, "halfway snow melt");

    effects.update(SeasonalEffects::kTransitionSeconds);
    EXPECT(effects.transitionProgress() == 1.0f, "transition completes");
    EXPECT(Near(effects.current().skyDay, SeasonalEffects::paletteFor(Season::Spring).skyDay), "spring sky");
    return 0;
}

static int test_stop_freezes(void)
{
    SeasonalEffects effects;
    effects.onSystemsStarted(CalendarDate(), Season::Summer);
    effects.onSeasonChanged(Season::Summer, Season::Autumn);
    effects.update(1.0f);
    const glm::vec3 frozen = effects.current().sunTint;

    effects.onSystemsStopped();
    EXPECT(!effects.active(), "stopped");
    effects.update(100.0f);
    EXPECT(Near(effects.current().sunTint, frozen), "no blending after stop");
    return 0;
}

static int test_sun_follows_world(void)
{
    Environment env;
    env.world().setDaylightCycle(false);
    env.effects().onSystemsStarted(CalendarDate(1, 7, 1), Season::Summer);

    env.world().setFullTime(6000);
    env.update(0.016f);
    EXPECT(env.sun().light().direction.y > 0.6f, "sun high at noon");
    EXPECT(env.sun().dayFactor() > 0.9f, "full daylight at noon");
    const glm::vec3 noonSky = env.skyColor();

    env.world().setFullTime(18000);
    env.update(0.016f);
    EXPECT(env.sun().light().direction.y < -0.6f, "sun below the horizon at midnight");
    EXPECT(env.sun().dayFactor() == 0.0f, "no daylight at midnight");
    EXPECT(glm::length(env.skyColor()) < glm::length(noonSky), "night sky is darker");

    env.world().setFullTime(6000);
    env.world().setWeather(Weather::Thunder);
    env.update(0.016f);
    EXPECT(glm::length(env.skyColor()) < glm::length(noonSky), "thunder darkens the sky");
    return 0;
}

static int test_winter_sun_stays_low(void)
{
    Sun summer;
    Sun winter;
    WorldClock world;
    world.setDaylightCycle(false);
    world.setFullTime(6000);

    summer.update(world, SeasonalEffects::paletteFor(Season::Summer));
    winter.update(world, SeasonalEffects::paletteFor(Season::Winter));

    EXPECT(winter.light().direction.y < summer.light().direction.y, "winter noon sun is lower");
    EXPECT(winter.light().direction.y > 0.0f, "winter noon sun is still up");
    EXPECT(winter.light().intensity < summer.light().intensity, "winter light is weaker");
    return 0;
}

static int test_world_native_cycle(void)
{
    WorldClock world;
    world.update(1.0f);
    EXPECT(world.fullTime() == 20, "native cycle runs at 20 ticks per second");

    world.setDaylightCycle(false);
    world.update(5.0f);
    EXPECT(world.fullTime() == 20, "disabled cycle does not move");

    world.setDaylightCycle(true);
    world.setCycleSpeed(10.0);
    world.update(0.5f);
    EXPECT(world.fullTime() == 120, "cycle speed multiplies the native rate");

    world.advanceBy(-50);
    EXPECT(world.fullTime() == 120, "negative advance ignored");
    return 0;
}

int main(void)
{
    if (test_start_snaps_to_season() != 0) return 1;
    if (test_transition_blends() != 0) return 1;
    if (test_stop_freezes() != 0) return 1;
    if (test_sun_follows_world() != 0) return 1;
    if (test_winter_sun_stays_low() != 0) return 1;
    if (test_world_native_cycle() != 0) return 1;
    return 0;
}
