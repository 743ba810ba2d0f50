/*
 * HostWorld.h
 *
 * Purpose:
 *   Declares the host world seen by the calendar: a monotonically increasing tick counter plus the
 *   weather flags shown on the status line.
 *
 * Model:
 *   - One host day is kDayCycleTicks ticks. Tick 0 of a day is sunrise (06:00); day phase covers
 *     [0, kSunsetTicks), night phase [kSunsetTicks, kDayCycleTicks).
 *   - The host may advance its own counter (its native daylight cycle) or hand control to the
 *     calendar through setDaylightCycle(false).
 */

#pragma once

#include <cstdint>

constexpr std::int64_t kDayCycleTicks = 24000;
constexpr std::int64_t kSunsetTicks = 13000;

class HostWorld {
public:
    virtual ~HostWorld() = default;

    // Total ticks since world creation.
    virtual std::int64_t fullTime() const = 0;

    // Moves the counter forward by ticks (>= 0).
    virtual void advanceBy(std::int64_t ticks) = 0;

    virtual bool hasStorm() const = 0;
    virtual bool isThundering() const = 0;

    // true: the host advances time itself; false: only advanceBy() moves it.
    virtual void setDaylightCycle(bool enabled) = 0;

    // Tick position within the current day, [0, kDayCycleTicks).
    std::int64_t timeOfDay() const { return fullTime() % kDayCycleTicks; }

    // Whole host days elapsed.
    std::int64_t totalDays() const { return fullTime() / kDayCycleTicks; }
};
