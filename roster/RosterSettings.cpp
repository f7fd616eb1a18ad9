#include "roster/RosterSettings.h"
#include "config/Config.h"

namespace roster
{

RosterSettings RosterSettings::fromConfig(const config::Config& config)
{
    RosterSettings settings;
    settings.fetchLimit = config.participants.fetchLimit;
    settings.decayIntervalMs = config.activity.decayIntervalMs;
    settings.rankTimeoutMs = config.activity.rankTimeoutMs;
    return settings;
}

} // namespace roster
