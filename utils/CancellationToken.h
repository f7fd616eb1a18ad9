#pragma once

#include <atomic>
#include <memory>

namespace utils
{

/**
 * Shared cancellation flag. The issuer of an asynchronous operation keeps one reference and hands copies to the
 * completion. Cancelling is sticky and visible to every copy.
 */
class CancellationToken
{
public:
    CancellationToken() : _cancelled(false) {}

    void cancel() { _cancelled.store(true); }
    bool isCancelled() const { return _cancelled.load(); }

    static std::shared_ptr<CancellationToken> create() { return std::make_shared<CancellationToken>(); }

private:
    std::atomic_bool _cancelled;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace utils
