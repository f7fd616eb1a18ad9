#include "logger/Logger.h"
#include "logger/LoggerThread.h"
#include "utils/Time.h"
#include <memory>
#include <pthread.h>
#include <strings.h>

namespace logger
{

std::atomic<Level> _logLevel(Level::INFO);
std::atomic<size_t> LoggableId::_lastInstanceId(0);

namespace
{
std::unique_ptr<LoggerThread> _logThread;
}

void setup(const char* logFileName, bool logToStdOut, bool logToStdErr, Level level, size_t backlogSize)
{
    _logLevel = level;
    _logThread.reset(new LoggerThread(logFileName, logToStdOut, logToStdErr, backlogSize));
}

void stop()
{
    if (_logThread)
    {
        _logThread->stop();
        _logThread.reset();
    }
}

Level parseLevel(const char* level)
{
    if (strcasecmp(level, "error") == 0)
    {
        return Level::ERROR;
    }
    if (strcasecmp(level, "warn") == 0 || strcasecmp(level, "warning") == 0)
    {
        return Level::WARN;
    }
    if (strcasecmp(level, "debug") == 0 || strcasecmp(level, "dbg") == 0)
    {
        return Level::DBG;
    }
    return Level::INFO;
}

const char* toString(Level level)
{
    switch (level)
    {
    case Level::ERROR:
        return "ERROR";
    case Level::WARN:
        return "WARN";
    case Level::INFO:
        return "INFO";
    case Level::DBG:
        return "DEBUG";
    }
    return "INFO";
}

void logv(Level level, const char* logGroup, bool immediate, const char* format, va_list args)
{
    if (!_logThread)
    {
        return;
    }

    const auto timestamp = utils::Time::now();
    auto threadId = reinterpret_cast<void*>(pthread_self());
    if (immediate)
    {
        _logThread->immediate(timestamp, toString(level), logGroup, threadId, format, args);
    }
    else
    {
        _logThread->post(timestamp, toString(level), logGroup, threadId, format, args);
    }
}

void flushLog()
{
    awaitLogDrained(500 * utils::Time::ms);
}

void awaitLogDrained(uint64_t timeoutNs)
{
    if (_logThread)
    {
        _logThread->awaitLogDrained(timeoutNs);
    }
}

uint32_t getDroppedLogCount()
{
    return _logThread ? _logThread->getDroppedLogCount() : 0;
}

} // namespace logger
