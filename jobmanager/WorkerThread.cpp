#include "jobmanager/WorkerThread.h"
#include "concurrency/ThreadUtils.h"
#include "jobmanager/JobManager.h"
#include "logger/Logger.h"
#include <exception>

namespace
{

thread_local jobmanager::WorkerThread* workerThreadHandler = nullptr;

} // namespace

namespace jobmanager
{

WorkerThread::WorkerThread(jobmanager::JobManager& jobManager, const char* name)
    : _running(true),
      _jobManager(jobManager),
      _name(name),
      _thread([this] { this->run(); })
{
}

WorkerThread::~WorkerThread()
{
    stop();
}

void WorkerThread::stop()
{
    _running = false;
    if (_thread.joinable())
    {
        _thread.join();
    }
}

void WorkerThread::run()
{
    concurrency::setThreadName(_name.c_str());
    workerThreadHandler = this;

    while (_running)
    {
        auto job = _jobManager.waitAndPop(50);
        if (!job)
        {
            continue;
        }

        try
        {
            job->run();
        }
        catch (const std::exception& e)
        {
            logger::error("std exception %s", _name.c_str(), e.what());
        }
    }
    workerThreadHandler = nullptr;
}

bool WorkerThread::isWorkerThread()
{
    return workerThreadHandler != nullptr;
}

} // namespace jobmanager
