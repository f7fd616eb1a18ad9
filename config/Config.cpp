#include "config/Config.h"
#include "logger/Logger.h"

namespace config
{

bool Config::validate() const
{
    bool valid = true;
    if (participants.fetchLimit <= 0)
    {
        logger::error("participants.fetchLimit must be positive, is %d", "Config", participants.fetchLimit.get());
        valid = false;
    }
    if (activity.decayIntervalMs == 0 || activity.rankTimeoutMs == 0)
    {
        logger::error("activity intervals must be positive", "Config");
        valid = false;
    }
    if (simulator.participantCount == 0 || simulator.updateIntervalMs == 0)
    {
        logger::error("simulator needs at least one participant and a positive update interval", "Config");
        valid = false;
    }
    return valid;
}

} // namespace config
