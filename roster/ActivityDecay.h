#pragma once

#include "roster/Participant.h"
#include "utils/CancellationToken.h"
#include <cstdint>
#include <functional>
#include <vector>

namespace jobmanager
{
class JobManager;
}

namespace roster
{

/**
 * Clears activity ranks of participants whose last activity is unknown or older than rankTimeoutSeconds.
 * Activity timestamps are left as they are. The caller re-sorts if anything changed.
 * @return number of ranks cleared
 */
size_t clearStaleActivityRanks(std::vector<Participant>& participants, double nowSeconds, double rankTimeoutSeconds);

/**
 * Periodic tick run as a timed job on a JobManager, so onTick runs on the same thread as every other job posted to
 * it. Re-arms itself after each tick until stopped or destroyed. Once started, stop and destroy it on the thread
 * draining the JobManager.
 */
class ActivityDecayTimer
{
public:
    ActivityDecayTimer(jobmanager::JobManager& jobManager, uint64_t intervalMs, std::function<void()> onTick);
    ~ActivityDecayTimer();

    bool start();
    void stop();

    bool isRunning() const { return _running; }
    uint32_t getTickCount() const { return _tickCount; }

private:
    bool arm();

    jobmanager::JobManager& _jobManager;
    const uint32_t _groupId;
    const uint64_t _intervalUs;
    std::function<void()> _onTick;
    utils::CancellationTokenPtr _lifetime;
    bool _running;
    uint32_t _tickCount;
};

} // namespace roster
