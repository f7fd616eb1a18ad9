#pragma once

#include "concurrency/SynchronizationContext.h"
#include "jobmanager/Job.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <type_traits>

namespace jobmanager
{

class TimerQueue;

/**
 * JobManager is a thread safe FIFO of jobs. When drained by a single WorkerThread it is the serialization point for
 * everything posted to it: jobs run one at a time in the order they were added.
 *
 * Timed jobs are handed to the TimerQueue and enter the FIFO when they expire. You have to handle re-triggering
 * yourself. You can abort a specific timer by id, or a group of related timers using a group id.
 *
 * Without a WorkerThread, jobs can be drained manually with pop(), which is how tests run it deterministically.
 */
class JobManager : public concurrency::SynchronizationContext
{
public:
    explicit JobManager(size_t maxPendingJobs = 4096);
    JobManager(TimerQueue& timerQueue, size_t maxPendingJobs = 4096);
    ~JobManager();

    template <typename JOB_TYPE, typename... U>
    bool addJob(U&&... args)
    {
        return addJobItem(std::make_unique<JOB_TYPE>(std::forward<U>(args)...));
    }

    template <class Callable>
    bool addCallable(Callable&& callable)
    {
        return addJob<CallableJob<std::decay_t<Callable>>>(std::forward<Callable>(callable));
    }

    bool post(concurrency::SynchronizationContext::Task&& task) override { return addCallable(std::move(task)); }

    template <class Callable>
    bool addTimedJob(uint32_t groupId, uint32_t id, uint64_t timeoutUs, Callable&& callable)
    {
        return addTimedJobItem(groupId,
            id,
            timeoutUs,
            std::make_unique<CallableJob<std::decay_t<Callable>>>(std::forward<Callable>(callable)));
    }

    bool addJobItem(std::unique_ptr<Job> job);
    bool addTimedJobItem(uint32_t groupId, uint32_t id, uint64_t timeoutUs, std::unique_ptr<Job> job);

    std::unique_ptr<Job> pop();
    std::unique_ptr<Job> waitAndPop(uint32_t timeoutMs);

    void stop();
    bool isRunning() const { return _running.load(); }

    size_t getCount() const;

    void abortTimedJobs(uint32_t groupId);
    void abortTimedJob(uint32_t groupId, uint32_t id);

private:
    mutable std::mutex _lock;
    std::condition_variable _jobAvailable;
    std::deque<std::unique_ptr<Job>> _jobQueue;
    const size_t _maxPendingJobs;
    std::atomic_bool _running;

    TimerQueue* _timers;
};

} // namespace jobmanager
