#pragma once
#include <chrono>
#include <cstdint>

namespace utils
{

/**
 * Clock behind utils::Time. Tests install their own to control both the monotonic and the wall clock.
 */
class TimeSource
{
public:
    virtual ~TimeSource() = default;

    // nanoseconds since an unspecified, machine specific epoch. Never goes backwards.
    virtual uint64_t getAbsoluteTime() const = 0;

    virtual std::chrono::system_clock::time_point wallClock() const = 0;
};

namespace Time
{

// back to the system clocks
void initialize();
// timeSource must outlive its use, or until initialize() is called again
void initialize(TimeSource& timeSource);

uint64_t getAbsoluteTime();
std::chrono::system_clock::time_point now();

// wall clock as seconds since epoch, with sub second precision
double nowSeconds();
double toSeconds(std::chrono::system_clock::time_point timestamp);

constexpr uint64_t us = 1000;
constexpr uint64_t ms = 1000 * us;
constexpr uint64_t sec = ms * 1000;

// wrap safe distance from a to b on the monotonic clock
constexpr int64_t diff(const uint64_t a, const uint64_t b)
{
    return static_cast<int64_t>(b - a);
}

constexpr bool diffGE(const uint64_t a, const uint64_t b, const uint64_t value)
{
    return diff(a, b) >= static_cast<int64_t>(value);
}

} // namespace Time

} // namespace utils
