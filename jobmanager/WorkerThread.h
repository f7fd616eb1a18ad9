#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace jobmanager
{
class JobManager;

/**
 * Drains a JobManager on one thread. A JobManager with exactly one WorkerThread runs its jobs strictly in order.
 */
class WorkerThread
{
public:
    explicit WorkerThread(jobmanager::JobManager& jobManager, const char* name = "Worker");
    ~WorkerThread();

    void stop();

    static bool isWorkerThread();

private:
    std::atomic<bool> _running;
    jobmanager::JobManager& _jobManager;

    void run();

    std::string _name;
    std::thread _thread; // must be last
};

} // namespace jobmanager
