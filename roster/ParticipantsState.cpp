#include "roster/ParticipantsState.h"
#include "roster/ParticipantOrder.h"
#include <algorithm>
#include <unordered_map>

namespace roster
{

bool ParticipantsState::operator==(const ParticipantsState& other) const
{
    return participants == other.participants && nextParticipantsFetchOffset == other.nextParticipantsFetchOffset &&
        adminIds == other.adminIds && isCreator == other.isCreator &&
        defaultParticipantsAreMuted == other.defaultParticipantsAreMuted && sortAscending == other.sortAscending &&
        recordingStartTimestamp == other.recordingStartTimestamp && title == other.title &&
        totalCount == other.totalCount && version == other.version;
}

const Participant* ParticipantsState::findParticipant(PeerId peerId) const
{
    auto it = std::find_if(participants.cbegin(), participants.cend(), [peerId](const Participant& participant) {
        return participant.peerId == peerId;
    });
    return it == participants.cend() ? nullptr : &(*it);
}

Participant* ParticipantsState::findParticipant(PeerId peerId)
{
    auto it = std::find_if(participants.begin(), participants.end(), [peerId](const Participant& participant) {
        return participant.peerId == peerId;
    });
    return it == participants.end() ? nullptr : &(*it);
}

void ParticipantsState::mergeActivity(const ParticipantsState& other, bool mergeActivityTimestamps)
{
    std::unordered_map<PeerId, size_t> indexMap;
    for (size_t i = 0; i < other.participants.size(); ++i)
    {
        indexMap.emplace(other.participants[i].peerId, i);
    }

    for (auto& participant : participants)
    {
        auto it = indexMap.find(participant.peerId);
        if (it != indexMap.end())
        {
            participant.mergeActivity(other.participants[it->second], mergeActivityTimestamps);
        }
    }

    sortParticipants(participants, sortAscending);
}

} // namespace roster
