#pragma once
#include "jobmanager/Job.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace jobmanager
{
class JobManager;

// thread safe
class TimerQueue
{
public:
    TimerQueue();
    ~TimerQueue();

    bool addTimer(uint32_t groupId, uint32_t id, uint64_t timeoutNs, std::unique_ptr<Job> job, JobManager& jobManager);
    void abortTimer(uint32_t groupId, uint32_t id);
    void abortTimers(uint32_t groupId);
    void abortJobsFor(const JobManager& jobManager);
    void stop();

    size_t size() const;

private:
    struct TimerEntry
    {
        TimerEntry() : endTime(0), id(0), groupId(0), jobManager(nullptr) {}
        TimerEntry(uint64_t endTime, uint32_t id, uint32_t groupId, std::unique_ptr<Job> job, JobManager* jobManager)
            : endTime(endTime),
              id(id),
              groupId(groupId),
              job(std::move(job)),
              jobManager(jobManager)
        {
        }

        // earliest timer at front of heap
        bool operator<(const TimerEntry& rhs) const { return static_cast<int64_t>(endTime - rhs.endTime) > 0; }

        uint64_t endTime; // ns
        uint32_t id;
        uint32_t groupId;
        std::unique_ptr<Job> job;
        JobManager* jobManager;
    };

    void run();
    bool popExpired(TimerEntry& entry);
    template <typename Predicate>
    void removeIf(Predicate&& predicate);

    mutable std::mutex _lock;
    std::condition_variable _changed;
    std::vector<TimerEntry> _timers;
    std::atomic_bool _running;
    std::thread _thread; // must be last
};

} // namespace jobmanager
