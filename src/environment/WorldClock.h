/*
 * WorldClock.h
 *
 * Purpose:
 *   Declares WorldClock, the in-process host world used by the demo and the tests.
 *   Tracks the raw tick counter, weather flags and the host's own daylight cycle.
 *
 * Model:
 *   - fullTime() is an integer tick counter; the host's native rate is kNativeTicksPerSecond.
 *   - While the daylight cycle is enabled, update(dt) advances the counter at the native rate
 *     times cycleSpeed() (used for the accelerated sleep skip). Fractional ticks are carried.
 *   - normalizedTime() maps the tick position into [0,1) with 0.25 at sunrise (tick 0).
 */

#pragma once

#include <cstdint>

#include "environment/HostWorld.h"

enum class Weather : int { Clear = 0, Rain = 1, Thunder = 2 };

class WorldClock : public HostWorld {
public:
    static constexpr double kNativeTicksPerSecond = 20.0;

    WorldClock() = default;
    explicit WorldClock(std::int64_t fullTime) : m_fullTime(fullTime) {}

    std::int64_t fullTime() const override { return m_fullTime; }
    void advanceBy(std::int64_t ticks) override;
    bool hasStorm() const override { return m_weather != Weather::Clear; }
    bool isThundering() const override { return m_weather == Weather::Thunder; }
    void setDaylightCycle(bool enabled) override { m_daylightCycle = enabled; }

    bool daylightCycle() const { return m_daylightCycle; }

    /*
     * Advances the host's own cycle.
     *
     * Parameters:
     *   dt : Delta time in seconds. Expected to be non-negative.
     *
     * Notes:
     *   - No-op while the daylight cycle is disabled.
     */
    void update(float dt);

    // Sets the counter directly (world load, tests).
    void setFullTime(std::int64_t ticks) { m_fullTime = ticks; }

    void setWeather(Weather weather) { m_weather = weather; }
    Weather weather() const { return m_weather; }

    // Multiplier on the native rate; 1.0 is normal speed.
    void setCycleSpeed(double speed) { m_cycleSpeed = speed > 0.0 ? speed : 1.0; }
    double cycleSpeed() const { return m_cycleSpeed; }

    // Normalized time-of-day in [0,1), 0.25 = sunrise.
    float normalizedTime() const;

    // Convenience conversion to "clock hours" in [0,24).
    float hours() const { return normalizedTime() * 24.0f; }

private:
    std::int64_t m_fullTime = 0;
    Weather m_weather = Weather::Clear;
    bool m_daylightCycle = true;
    double m_cycleSpeed = 1.0;

    // Unapplied fraction of the native cycle, [0,1).
    double m_nativeAcc = 0.0;
};
