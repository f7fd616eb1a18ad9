#include "concurrency/ThreadUtils.h"
#include <cstring>
#include <pthread.h>

namespace concurrency
{

// Linux limits thread names to 15 characters plus terminator.
void setThreadName(const char* name)
{
    char truncatedName[16];
    std::strncpy(truncatedName, name, sizeof(truncatedName) - 1);
    truncatedName[sizeof(truncatedName) - 1] = 0;
    pthread_setname_np(pthread_self(), truncatedName);
}

} // namespace concurrency
