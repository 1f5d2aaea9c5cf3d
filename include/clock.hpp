#pragma once

#include <chrono>

using WallTime = std::chrono::system_clock::time_point;
using MonoTime = std::chrono::steady_clock::time_point;

// Source of "now" for the watchdog. Injected so timing is deterministic in tests.
// now() is for display only; elapsed time is measured on monotonic_now() so
// wall-clock steps neither delay nor fake a timeout.
class Clock {
public:
    virtual ~Clock() = default;
    virtual WallTime now() const = 0;
    virtual MonoTime monotonic_now() const = 0;
};

class SystemClock : public Clock {
public:
    WallTime now() const override;
    MonoTime monotonic_now() const override;
};

// Milliseconds between two monotonic instants, fractional.
double elapsed_ms(MonoTime from, MonoTime to);
