#pragma once

#include "config/ConfigReader.h"
#include <string>

namespace config
{

class Config : public ConfigReader
{
public:
    CFG_PROP(bool, logStdOut, true);
    CFG_PROP(std::string, logLevel, "INFO");
    CFG_PROP(std::string, logFile, "/tmp/rostersim.log");

    CFG_GROUP()
    CFG_PROP(int64_t, id, 1);
    CFG_PROP(uint64_t, myPeerId, 1);
    CFG_GROUP_END(call);

    CFG_GROUP()
    // page size for snapshot, pagination and missing ssrc fetches
    CFG_PROP(int32_t, fetchLimit, 100);
    CFG_GROUP_END(participants);

    CFG_GROUP()
    CFG_PROP(uint32_t, decayIntervalMs, 10 * 1000);
    // speaking rank is cleared when the last activity is older than this
    CFG_PROP(uint32_t, rankTimeoutMs, 60 * 1000);
    CFG_GROUP_END(activity);

    CFG_GROUP()
    CFG_PROP(uint32_t, participantCount, 250);
    CFG_PROP(uint32_t, updateIntervalMs, 200);
    // every n-th version is withheld from the push stream to force a resync. 0 disables.
    CFG_PROP(uint32_t, gapEveryNthUpdate, 50);
    // every n-th participant edit fails. 0 disables.
    CFG_PROP(uint32_t, mutationFailureEveryNth, 4);
    CFG_PROP(uint32_t, speakerReportIntervalMs, 500);
    CFG_PROP(uint32_t, snapshotLogIntervalMs, 5000);
    CFG_PROP(uint32_t, runTimeSec, 30);
    CFG_PROP(uint32_t, seed, 1);
    CFG_GROUP_END(simulator);

protected:
    bool validate() const override;
};

} // namespace config
