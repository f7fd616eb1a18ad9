#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <inttypes.h>

namespace logger
{
enum class Level
{
    ERROR,
    WARN,
    INFO,
    DBG
};

extern std::atomic<Level> _logLevel;

/**
 * Starts the background writer. Lines are formatted on the calling thread and queued, at most backlogSize of them.
 * Lines posted while the backlog is full are counted and dropped.
 */
void setup(const char* logToFile, bool logToStdOut, bool logToStdErr, Level level, size_t backlogSize = 4096);
void stop();

Level parseLevel(const char* level);
const char* toString(Level level);
inline bool isEnabled(Level level)
{
    return level <= _logLevel.load(std::memory_order_relaxed);
}

void logv(Level level, const char* logGroup, bool immediate, const char* format, va_list args);
void flushLog();
void awaitLogDrained(uint64_t timeoutNs = 2000'000'000);
uint32_t getDroppedLogCount();

__attribute__((format(printf, 1, 3))) inline void info(const char* format, const char* logGroup, ...)
{
    if (!isEnabled(Level::INFO))
    {
        return;
    }

    va_list arglist;
    va_start(arglist, logGroup);
    logv(Level::INFO, logGroup, false, format, arglist);
    va_end(arglist);
}

__attribute__((format(printf, 1, 3))) inline void warn(const char* format, const char* logGroup, ...)
{
    if (!isEnabled(Level::WARN))
    {
        return;
    }

    va_list arglist;
    va_start(arglist, logGroup);
    logv(Level::WARN, logGroup, false, format, arglist);
    va_end(arglist);
}

__attribute__((format(printf, 1, 3))) inline void error(const char* format, const char* logGroup, ...)
{
    va_list arglist;
    va_start(arglist, logGroup);
    logv(Level::ERROR, logGroup, false, format, arglist);
    va_end(arglist);
}

__attribute__((format(printf, 1, 3))) inline void debug(const char* format, const char* logGroup, ...)
{
    if (!isEnabled(Level::DBG))
    {
        return;
    }

    va_list arglist;
    va_start(arglist, logGroup);
    logv(Level::DBG, logGroup, false, format, arglist);
    va_end(arglist);
}

// written regardless of level, tagged with the configured level
__attribute__((format(printf, 1, 3))) inline void logAlways(const char* format, const char* logGroup, ...)
{
    va_list arglist;
    va_start(arglist, logGroup);
    logv(_logLevel.load(), logGroup, false, format, arglist);
    va_end(arglist);
}

// bypasses the queue, for fatal paths where the writer thread may never run again
__attribute__((format(printf, 1, 3))) inline void errorImmediate(const char* format, const char* logGroup, ...)
{
    va_list arglist;
    va_start(arglist, logGroup);
    logv(Level::ERROR, logGroup, true, format, arglist);
    va_end(arglist);
}

// Log group of one object instance, "<prefix>-<n>" with n unique in the process.
class LoggableId
{
public:
    explicit LoggableId(const char* prefix) : _instanceId(++_lastInstanceId)
    {
        snprintf(_value, maxLength, "%s-%zu", prefix, _instanceId);
    }

    const char* c_str() const { return _value; }

private:
    static const int maxLength = 64;
    static std::atomic<size_t> _lastInstanceId;

    char _value[maxLength];
    const size_t _instanceId;
};

} // namespace logger
