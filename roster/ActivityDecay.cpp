#include "roster/ActivityDecay.h"
#include "jobmanager/JobManager.h"
#include "logger/Logger.h"
#include <atomic>

namespace roster
{

namespace
{
std::atomic_uint32_t timerGroupIdCounter(1);
}

size_t clearStaleActivityRanks(std::vector<Participant>& participants, double nowSeconds, double rankTimeoutSeconds)
{
    size_t cleared = 0;
    for (auto& participant : participants)
    {
        if (!participant.activityRank)
        {
            continue;
        }

        if (!participant.activityTimestamp || nowSeconds - *participant.activityTimestamp > rankTimeoutSeconds)
        {
            participant.activityRank.reset();
            ++cleared;
        }
    }
    return cleared;
}

ActivityDecayTimer::ActivityDecayTimer(jobmanager::JobManager& jobManager,
    uint64_t intervalMs,
    std::function<void()> onTick)
    : _jobManager(jobManager),
      _groupId(timerGroupIdCounter.fetch_add(1)),
      _intervalUs(intervalMs * 1000),
      _onTick(std::move(onTick)),
      _lifetime(utils::CancellationToken::create()),
      _running(false),
      _tickCount(0)
{
}

ActivityDecayTimer::~ActivityDecayTimer()
{
    stop();
}

bool ActivityDecayTimer::start()
{
    if (_running)
    {
        return true;
    }

    _running = arm();
    if (!_running)
    {
        logger::warn("could not schedule activity decay timer %u", "ActivityDecayTimer", _groupId);
    }
    return _running;
}

void ActivityDecayTimer::stop()
{
    if (!_running)
    {
        return;
    }

    _running = false;
    _lifetime->cancel();
    _lifetime = utils::CancellationToken::create();
    _jobManager.abortTimedJobs(_groupId);
}

// A tick already handed to the job queue can still run after stop. The lifetime token makes it a no-op.
bool ActivityDecayTimer::arm()
{
    auto lifetime = _lifetime;
    return _jobManager.addTimedJob(_groupId, 0, _intervalUs, [this, lifetime]() {
        if (lifetime->isCancelled())
        {
            return;
        }

        ++_tickCount;
        _onTick();
        if (!lifetime->isCancelled() && !arm())
        {
            logger::warn("activity decay timer %u could not re-arm", "ActivityDecayTimer", _groupId);
            _running = false;
        }
    });
}

} // namespace roster
