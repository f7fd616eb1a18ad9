#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace logger
{

// Single writer for all log outputs. Messages are formatted by the caller and written in posting order.
class LoggerThread
{
    struct LogItem
    {
        std::chrono::system_clock::time_point timestamp;
        const char* logLevel;
        void* threadId;
        std::string message;
    };

public:
    LoggerThread(const char* logFileName, bool logStdOut, bool logStdErr, size_t backlogSize);
    ~LoggerThread();

    void post(std::chrono::system_clock::time_point timestamp,
        const char* logLevel,
        const char* logGroup,
        void* threadId,
        const char* format,
        va_list args);

    void immediate(std::chrono::system_clock::time_point timestamp,
        const char* logLevel,
        const char* logGroup,
        void* threadId,
        const char* format,
        va_list args);

    void stop();

    // waits until the writer has emptied the queue, or the timeout passes
    void awaitLogDrained(uint64_t timeoutNs);

    static void formatTime(const std::chrono::system_clock::time_point timestamp, char* output);

    uint32_t getDroppedLogCount() const { return _droppedLogs; }

private:
    void run();
    void openLogFile();
    void write(const LogItem& item, const char* localTime);
    void flushOutputs();

    std::atomic_bool _running;

    std::mutex _queueLock;
    std::condition_variable _queueCondition;
    std::deque<LogItem> _logQueue;
    const size_t _backlogSize;

    FILE* _logFile;
    const bool _logStdOut;
    const bool _logStdErr;
    std::string _logFileName;
    std::atomic_uint32_t _droppedLogs;
    std::unique_ptr<std::thread> _thread; // must be last
};
} // namespace logger
