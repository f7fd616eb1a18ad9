#include "jobmanager/JobManager.h"
#include "jobmanager/TimerQueue.h"
#include "logger/Logger.h"
#include <chrono>

namespace jobmanager
{

JobManager::JobManager(size_t maxPendingJobs) : _maxPendingJobs(maxPendingJobs), _running(true), _timers(nullptr) {}

JobManager::JobManager(TimerQueue& timerQueue, size_t maxPendingJobs)
    : _maxPendingJobs(maxPendingJobs),
      _running(true),
      _timers(&timerQueue)
{
}

JobManager::~JobManager()
{
    if (_timers)
    {
        _timers->abortJobsFor(*this);
    }
}

bool JobManager::addJobItem(std::unique_ptr<Job> job)
{
    std::lock_guard<std::mutex> locker(_lock);
    if (!_running.load() || _jobQueue.size() >= _maxPendingJobs)
    {
        logger::warn("job queue full or stopped, %zu pending", "JobManager", _jobQueue.size());
        return false;
    }

    _jobQueue.push_back(std::move(job));
    _jobAvailable.notify_one();
    return true;
}

bool JobManager::addTimedJobItem(uint32_t groupId, uint32_t id, uint64_t timeoutUs, std::unique_ptr<Job> job)
{
    if (!_timers || !_running.load())
    {
        return false;
    }

    return _timers->addTimer(groupId, id, timeoutUs * 1000, std::move(job), *this);
}

std::unique_ptr<Job> JobManager::pop()
{
    std::lock_guard<std::mutex> locker(_lock);
    if (_jobQueue.empty())
    {
        return nullptr;
    }

    auto job = std::move(_jobQueue.front());
    _jobQueue.pop_front();
    return job;
}

std::unique_ptr<Job> JobManager::waitAndPop(uint32_t timeoutMs)
{
    std::unique_lock<std::mutex> locker(_lock);
    _jobAvailable.wait_for(locker, std::chrono::milliseconds(timeoutMs), [this] {
        return !_jobQueue.empty() || !_running.load();
    });

    if (_jobQueue.empty())
    {
        return nullptr;
    }

    auto job = std::move(_jobQueue.front());
    _jobQueue.pop_front();
    return job;
}

void JobManager::stop()
{
    if (_timers)
    {
        _timers->abortJobsFor(*this);
    }

    std::lock_guard<std::mutex> locker(_lock);
    _running = false;
    _jobAvailable.notify_all();
}

size_t JobManager::getCount() const
{
    std::lock_guard<std::mutex> locker(_lock);
    return _jobQueue.size();
}

void JobManager::abortTimedJobs(const uint32_t groupId)
{
    if (_timers)
    {
        _timers->abortTimers(groupId);
    }
}

void JobManager::abortTimedJob(const uint32_t groupId, const uint32_t id)
{
    if (_timers)
    {
        _timers->abortTimer(groupId, id);
    }
}

} // namespace jobmanager
