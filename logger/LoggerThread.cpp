#include "logger/LoggerThread.h"
#include "concurrency/ThreadUtils.h"
#include "utils/Time.h"
#include <cstring>
#include <ctime>

namespace logger
{

const auto timeStringLength = 32;

LoggerThread::LoggerThread(const char* logFileName, bool logStdOut, bool logStdErr, size_t backlogSize)
    : _running(true),
      _backlogSize(backlogSize),
      _logFile(nullptr),
      _logStdOut(logStdOut),
      _logStdErr(logStdErr),
      _logFileName(logFileName && std::strlen(logFileName) > 0 ? logFileName : ""),
      _droppedLogs(0),
      _thread(new std::thread([this] { this->run(); }))
{
}

LoggerThread::~LoggerThread()
{
    stop();
}

void LoggerThread::openLogFile()
{
    if (_logFileName.empty())
    {
        return;
    }

    _logFile = fopen(_logFileName.c_str(), "a+");
    if (!_logFile)
    {
        fprintf(stderr, "failed to open log file %s\n", _logFileName.c_str());
    }
}

namespace
{

inline void formatTo(FILE* fh, const char* localTime, const char* level, const void* threadId, const char* message)
{
    fprintf(fh, "%s %s [%p]%s\n", localTime, level, threadId, message);
}

std::string formatMessage(const char* logGroup, const char* format, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);

    const int maxMessageLength = 300;
    char smallMessage[maxMessageLength + 1];
    const int groupLength = snprintf(smallMessage, sizeof(smallMessage), "[%s] ", logGroup);
    if (groupLength < 0)
    {
        va_end(argsCopy);
        return std::string();
    }

    const int messageLength = vsnprintf(smallMessage + groupLength, sizeof(smallMessage) - groupLength, format, args);
    if (messageLength < 0)
    {
        va_end(argsCopy);
        return std::string(smallMessage, groupLength);
    }

    if (messageLength + groupLength <= maxMessageLength)
    {
        va_end(argsCopy);
        return std::string(smallMessage, messageLength + groupLength);
    }

    std::string message(smallMessage, groupLength);
    message.resize(groupLength + messageLength + 1);
    vsnprintf(&message[groupLength], messageLength + 1, format, argsCopy);
    message.resize(groupLength + messageLength);
    va_end(argsCopy);
    return message;
}

} // namespace

void LoggerThread::write(const LogItem& item, const char* localTime)
{
    if (_logStdOut)
    {
        formatTo(stdout, localTime, item.logLevel, item.threadId, item.message.c_str());
    }
    if (_logStdErr && !std::strcmp(item.logLevel, "ERROR"))
    {
        formatTo(stderr, localTime, item.logLevel, item.threadId, item.message.c_str());
    }
    if (_logFile)
    {
        formatTo(_logFile, localTime, item.logLevel, item.threadId, item.message.c_str());
    }
}

void LoggerThread::flushOutputs()
{
    if (_logStdOut)
    {
        fflush(stdout);
    }
    if (_logStdErr)
    {
        fflush(stderr);
    }
    if (_logFile)
    {
        fflush(_logFile);
    }
}

void LoggerThread::run()
{
    concurrency::setThreadName("Logger");
    char localTime[timeStringLength];
    openLogFile();

    std::deque<LogItem> batch;
    for (;;)
    {
        {
            std::unique_lock<std::mutex> locker(_queueLock);
            _queueCondition.wait_for(locker, std::chrono::milliseconds(50), [this] {
                return !_logQueue.empty() || !_running.load();
            });
            batch.swap(_logQueue);
        }

        for (const auto& item : batch)
        {
            formatTime(item.timestamp, localTime);
            write(item, localTime);
        }
        if (!batch.empty())
        {
            flushOutputs();
            batch.clear();
            _queueCondition.notify_all();
        }

        if (!_running.load())
        {
            std::lock_guard<std::mutex> locker(_queueLock);
            if (_logQueue.empty())
            {
                break;
            }
        }
    }

    if (_logFile)
    {
        fclose(_logFile);
        _logFile = nullptr;
    }
}

/**
 * logLevel must be static eternal const string in memory.
 */
void LoggerThread::post(std::chrono::system_clock::time_point timestamp,
    const char* logLevel,
    const char* logGroup,
    void* threadId,
    const char* format,
    va_list args)
{
    auto message = formatMessage(logGroup, format, args);

    std::lock_guard<std::mutex> locker(_queueLock);
    if (_logQueue.size() >= _backlogSize)
    {
        ++_droppedLogs;
        return;
    }
    _logQueue.push_back(LogItem{timestamp, logLevel, threadId, std::move(message)});
    _queueCondition.notify_all();
}

void LoggerThread::immediate(std::chrono::system_clock::time_point timestamp,
    const char* logLevel,
    const char* logGroup,
    void* threadId,
    const char* format,
    va_list args)
{
    char localTime[timeStringLength];
    formatTime(timestamp, localTime);

    const LogItem item{timestamp, logLevel, threadId, formatMessage(logGroup, format, args)};
    write(item, localTime);
    flushOutputs();
}

void LoggerThread::stop()
{
    _running = false;
    _queueCondition.notify_all();
    if (_thread && _thread->joinable())
    {
        _thread->join();
    }
}

void LoggerThread::formatTime(const std::chrono::system_clock::time_point timestamp, char* output)
{
    using namespace std::chrono;
    const std::time_t currentTime = system_clock::to_time_t(timestamp);
    tm currentLocalTime = {};
    localtime_r(&currentTime, &currentLocalTime);

    const auto ms = duration_cast<milliseconds>(timestamp.time_since_epoch()).count();

    snprintf(output,
        timeStringLength,
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        currentLocalTime.tm_year + 1900,
        currentLocalTime.tm_mon + 1,
        currentLocalTime.tm_mday,
        currentLocalTime.tm_hour,
        currentLocalTime.tm_min,
        currentLocalTime.tm_sec,
        static_cast<int>(ms % 1000));
}

void LoggerThread::awaitLogDrained(uint64_t timeoutNs)
{
    std::unique_lock<std::mutex> locker(_queueLock);
    _queueCondition.wait_for(locker, std::chrono::nanoseconds(timeoutNs), [this] {
        return _logQueue.empty() || !_running.load();
    });
}

} // namespace logger
