#pragma once

#include "roster/Participant.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace roster
{

struct DefaultParticipantsAreMuted
{
    bool operator==(const DefaultParticipantsAreMuted& other) const
    {
        return isMuted == other.isMuted && canChange == other.canChange;
    }
    bool operator!=(const DefaultParticipantsAreMuted& other) const { return !(*this == other); }

    bool isMuted = false;
    bool canChange = false;
};

/**
 * Authoritative roster as of version. participants is sorted with ParticipantOrder and holds unique peer ids.
 * totalCount may exceed participants.size() while the roster is only partially paged in.
 */
struct ParticipantsState
{
    bool operator==(const ParticipantsState& other) const;
    bool operator!=(const ParticipantsState& other) const { return !(*this == other); }

    const Participant* findParticipant(PeerId peerId) const;
    Participant* findParticipant(PeerId peerId);

    /**
     * Takes the local activity annotations of participants also present in other, then re-sorts.
     */
    void mergeActivity(const ParticipantsState& other, bool mergeActivityTimestamps);

    std::vector<Participant> participants;
    std::optional<std::string> nextParticipantsFetchOffset;
    std::unordered_set<PeerId> adminIds;
    bool isCreator = false;
    DefaultParticipantsAreMuted defaultParticipantsAreMuted;
    bool sortAscending = false;
    std::optional<int32_t> recordingStartTimestamp;
    std::optional<std::string> title;
    int32_t totalCount = 0;
    int32_t version = 0;
};

} // namespace roster
