#include "utils/Time.h"
#include <atomic>
#include <time.h>

namespace utils
{

namespace
{

class SystemTimeSource final : public TimeSource
{
public:
    uint64_t getAbsoluteTime() const override
    {
        timespec timeSpec = {};
        clock_gettime(CLOCK_MONOTONIC, &timeSpec);
        return static_cast<uint64_t>(timeSpec.tv_sec) * Time::sec + static_cast<uint64_t>(timeSpec.tv_nsec);
    }

    std::chrono::system_clock::time_point wallClock() const override { return std::chrono::system_clock::now(); }
};

SystemTimeSource systemTimeSource;
std::atomic<TimeSource*> timeSource(&systemTimeSource);

} // namespace

namespace Time
{

void initialize()
{
    timeSource = &systemTimeSource;
}

void initialize(TimeSource& source)
{
    timeSource = &source;
}

uint64_t getAbsoluteTime()
{
    return timeSource.load()->getAbsoluteTime();
}

std::chrono::system_clock::time_point now()
{
    return timeSource.load()->wallClock();
}

double toSeconds(const std::chrono::system_clock::time_point timestamp)
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(timestamp.time_since_epoch()).count();
}

double nowSeconds()
{
    return toSeconds(now());
}

} // namespace Time

} // namespace utils
