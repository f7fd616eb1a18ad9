#pragma once

#include <functional>

namespace concurrency
{

/**
 * A single point of serialization. Tasks posted are run one at a time in posting order.
 * Returns false if the task could not be queued.
 */
class SynchronizationContext
{
public:
    using Task = std::function<void()>;

    virtual ~SynchronizationContext() = default;

    virtual bool post(Task&& task) = 0;
};

} // namespace concurrency
