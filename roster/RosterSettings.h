#pragma once

#include <cstdint>

namespace config
{
class Config;
}

namespace roster
{

struct RosterSettings
{
    int32_t fetchLimit = 100;
    uint32_t decayIntervalMs = 10 * 1000;
    uint32_t rankTimeoutMs = 60 * 1000;

    static RosterSettings fromConfig(const config::Config& config);
};

} // namespace roster
