#pragma once

namespace concurrency
{
// Names the calling thread. Names longer than the OS limit are truncated.
void setThreadName(const char* name);
} // namespace concurrency
