#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace concurrency
{

class Semaphore
{
public:
    explicit Semaphore(uint32_t initial = 0);
    ~Semaphore() = default;

    void wait();
    // Uses the steady clock, not utils::Time, so it keeps working with a fake time source installed.
    bool wait(const uint32_t timeoutMs);
    void post();
    void reset();

private:
    mutable std::mutex _lock;
    std::condition_variable _conditionVariable;
    uint32_t _count;
};

} // namespace concurrency
