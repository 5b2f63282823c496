#include "clock.hpp"
#include <thread>

namespace g1 {

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(duration d) {
    std::this_thread::sleep_for(d);
}

} // namespace g1
