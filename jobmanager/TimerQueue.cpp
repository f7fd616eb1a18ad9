#include "jobmanager/TimerQueue.h"
#include "concurrency/ThreadUtils.h"
#include "jobmanager/JobManager.h"
#include "logger/Logger.h"
#include "utils/Time.h"
#include <algorithm>
#include <chrono>

namespace jobmanager
{

TimerQueue::TimerQueue() : _running(true), _thread([this] { this->run(); }) {}

TimerQueue::~TimerQueue()
{
    stop();
}

// multi threaded
bool TimerQueue::addTimer(uint32_t groupId,
    uint32_t id,
    uint64_t timeoutNs,
    std::unique_ptr<Job> job,
    JobManager& jobManager)
{
    std::lock_guard<std::mutex> locker(_lock);
    if (!_running.load())
    {
        return false;
    }

    _timers.emplace_back(utils::Time::getAbsoluteTime() + timeoutNs, id, groupId, std::move(job), &jobManager);
    std::push_heap(_timers.begin(), _timers.end());
    _changed.notify_one();
    return true;
}

template <typename Predicate>
void TimerQueue::removeIf(Predicate&& predicate)
{
    std::lock_guard<std::mutex> locker(_lock);
    const auto itEnd = std::remove_if(_timers.begin(), _timers.end(), predicate);
    if (itEnd != _timers.end())
    {
        _timers.erase(itEnd, _timers.end());
        std::make_heap(_timers.begin(), _timers.end());
    }
}

void TimerQueue::abortTimer(uint32_t groupId, uint32_t id)
{
    removeIf([groupId, id](const TimerEntry& entry) { return entry.groupId == groupId && entry.id == id; });
}

void TimerQueue::abortTimers(uint32_t groupId)
{
    removeIf([groupId](const TimerEntry& entry) { return entry.groupId == groupId; });
}

void TimerQueue::abortJobsFor(const JobManager& jobManager)
{
    removeIf([&jobManager](const TimerEntry& entry) { return entry.jobManager == &jobManager; });
}

// Joins the timer thread so no expired job is handed to a JobManager after this returns.
void TimerQueue::stop()
{
    {
        std::lock_guard<std::mutex> locker(_lock);
        _running = false;
        _changed.notify_all();
    }
    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
    {
        _thread.join();
    }
}

size_t TimerQueue::size() const
{
    std::lock_guard<std::mutex> locker(_lock);
    return _timers.size();
}

// must hold lock
bool TimerQueue::popExpired(TimerEntry& entry)
{
    if (_timers.empty() || utils::Time::diff(utils::Time::getAbsoluteTime(), _timers.front().endTime) > 0)
    {
        return false;
    }

    std::pop_heap(_timers.begin(), _timers.end());
    entry = std::move(_timers.back());
    _timers.pop_back();
    return true;
}

void TimerQueue::run()
{
    concurrency::setThreadName("TimerQueue");
    std::vector<TimerEntry> expired;

    while (_running.load())
    {
        {
            std::unique_lock<std::mutex> locker(_lock);
            TimerEntry entry;
            while (popExpired(entry))
            {
                expired.push_back(std::move(entry));
            }

            if (expired.empty())
            {
                uint64_t toWait = utils::Time::ms * 10;
                if (!_timers.empty())
                {
                    const auto untilFirst = utils::Time::diff(utils::Time::getAbsoluteTime(), _timers.front().endTime);
                    toWait = std::min(toWait, static_cast<uint64_t>(std::max(int64_t(0), untilFirst)));
                }
                _changed.wait_for(locker, std::chrono::nanoseconds(toWait));
                continue;
            }
        }

        // hand over outside the lock, JobManager may log or take its own lock
        for (auto& entry : expired)
        {
            if (!entry.jobManager->addJobItem(std::move(entry.job)))
            {
                logger::warn("failed to post expired timer %u/%u", "TimerQueue", entry.groupId, entry.id);
            }
        }
        expired.clear();
    }

    std::lock_guard<std::mutex> locker(_lock);
    _timers.clear();
}

} // namespace jobmanager
