#pragma once
#include <cstdint>

namespace Rtos {

void SleepMs(uint32_t ms);

// Monotonic time in microseconds (CLOCK_MONOTONIC).
uint64_t MonoUs();

// Wall-clock time in milliseconds since the epoch (CLOCK_REALTIME).
int64_t WallMs();

//== Clock abstraction ==//
// The meter loop reads time and sleeps only through this interface so that
// cadence can be driven deterministically from tests.
class Clock {
public:
    virtual ~Clock() = default;

    virtual uint64_t monoUs() = 0;
    virtual int64_t  wallMs() = 0;
    virtual void     sleepMs(uint32_t ms) = 0;
};

// Default clock backed by the functions above.
class SystemClock : public Clock {
public:
    uint64_t monoUs() override { return MonoUs(); }
    int64_t  wallMs() override { return WallMs(); }
    void     sleepMs(uint32_t ms) override { SleepMs(ms); }
};

} // namespace Rtos
