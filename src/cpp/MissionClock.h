#ifndef MISSION_CLOCK_H
#define MISSION_CLOCK_H

#include <chrono>
#include "MissionTime.h"

// Wall clock and blocking sleep used by the acquisition loop
class MissionClock {
public:
    virtual ~MissionClock() = default;
    virtual MissionTimePoint now() const = 0;
    virtual void sleepFor(std::chrono::seconds duration) = 0;
};

class SystemMissionClock : public MissionClock {
public:
    MissionTimePoint now() const override;
    void sleepFor(std::chrono::seconds duration) override;
};

#endif // MISSION_CLOCK_H
