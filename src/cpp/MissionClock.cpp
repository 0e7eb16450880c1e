#include "MissionClock.h"

#include <thread>

MissionTimePoint SystemMissionClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemMissionClock::sleepFor(std::chrono::seconds duration) {
    std::this_thread::sleep_for(duration);
}
