#pragma once
#include <utility>

namespace jobmanager
{

// Job that can only run once
class Job
{
public:
    Job() = default;
    virtual ~Job() = default;

    virtual void run() = 0;
};

/**
Generic callable. The only restriction is that it needs to implement operator()().
Lambdas are stored by value in the job itself.
*/
template <class Callable>
class CallableJob final : public Job
{
public:
    explicit CallableJob(const Callable& callable) : _callable(callable) {}
    explicit CallableJob(Callable&& callable) : _callable(std::move(callable)) {}

    void run() final { _callable(); }

private:
    Callable _callable;
};

} // namespace jobmanager
