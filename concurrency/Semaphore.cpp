#include "concurrency/Semaphore.h"
#include <chrono>

namespace concurrency
{

Semaphore::Semaphore(uint32_t initial) : _count(initial) {}

void Semaphore::wait()
{
    std::unique_lock<std::mutex> locker(_lock);
    _conditionVariable.wait(locker, [this] { return _count > 0; });
    --_count;
}

// returns false on timeout
bool Semaphore::wait(uint32_t timeoutMs)
{
    const auto timeoutAt = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::unique_lock<std::mutex> locker(_lock);
    if (!_conditionVariable.wait_until(locker, timeoutAt, [this] { return _count > 0; }))
    {
        return false;
    }

    --_count;
    return true;
}

void Semaphore::reset()
{
    std::unique_lock<std::mutex> locker(_lock);
    _count = 0;
}

void Semaphore::post()
{
    std::lock_guard<std::mutex> locker(_lock);
    ++_count;
    _conditionVariable.notify_one();
}

} // namespace concurrency
