#include "roster/OverlayState.h"
#include "roster/ParticipantOrder.h"

namespace roster
{

void OverlayState::removePending(const std::unordered_set<PeerId>& peerIds)
{
    for (auto peerId : peerIds)
    {
        pendingMuteStateChanges.erase(peerId);
    }
}

ParticipantsState makeEffectiveState(const InternalState& internalState, PeerId viewerPeerId)
{
    ParticipantsState publicState = internalState.state;
    const auto& pending = internalState.overlayState.pendingMuteStateChanges;
    const bool canSeeHands = publicState.isCreator || publicState.adminIds.count(viewerPeerId) > 0;

    bool sortAgain = false;
    for (auto& participant : publicState.participants)
    {
        auto pendingIt = pending.find(participant.peerId);
        if (pendingIt != pending.end())
        {
            participant.muteState = pendingIt->second.state;
            participant.volume = pendingIt->second.volume;
        }
        if (!canSeeHands && participant.raiseHandRating)
        {
            participant.raiseHandRating.reset();
            sortAgain = true;
        }
    }

    if (sortAgain)
    {
        sortParticipants(publicState.participants, publicState.sortAscending);
    }
    return publicState;
}

} // namespace roster
