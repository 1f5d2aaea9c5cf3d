#include "clock.hpp"

WallTime SystemClock::now() const {
    return std::chrono::system_clock::now();
}

MonoTime SystemClock::monotonic_now() const {
    return std::chrono::steady_clock::now();
}

double elapsed_ms(MonoTime from, MonoTime to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}
