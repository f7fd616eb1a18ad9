#include "roster/MutationCoordinator.h"

namespace roster
{

MutationCoordinator::MutationCoordinator(int64_t callId, PeerId myPeerId) : _callId(callId), _myPeerId(myPeerId) {}

MutationCoordinator::~MutationCoordinator()
{
    cancelAll();
}

bool MutationCoordinator::isNoOp(const InternalState& internalState,
    PeerId peerId,
    const std::optional<MuteState>& muteState,
    const std::optional<int32_t>& volume,
    const std::optional<bool>& raiseHand) const
{
    const Participant* participant = internalState.state.findParticipant(peerId);
    if (!participant)
    {
        return false;
    }

    auto displayedMuteState = participant->muteState;
    auto displayedVolume = participant->volume;
    auto pendingIt = internalState.overlayState.pendingMuteStateChanges.find(peerId);
    if (pendingIt != internalState.overlayState.pendingMuteStateChanges.end())
    {
        displayedMuteState = pendingIt->second.state;
        displayedVolume = pendingIt->second.volume;
    }

    bool raiseHandEqual = true;
    if (raiseHand)
    {
        raiseHandEqual = participant->raiseHandRating.has_value() == *raiseHand;
    }

    return displayedMuteState == muteState && displayedVolume == volume && raiseHandEqual;
}

EditParticipantRequest MutationCoordinator::makeRequest(PeerId peerId,
    const std::optional<MuteState>& muteState,
    const std::optional<int32_t>& volume,
    const std::optional<bool>& raiseHand) const
{
    EditParticipantRequest request;
    request.callId = _callId;
    request.peerId = peerId;
    request.changesMuteState = muteState.has_value();
    request.muted = muteState && (!muteState->canUnmute || peerId == _myPeerId || muteState->mutedByYou);
    if (volume && *volume > 0)
    {
        request.volume = volume;
    }
    request.raiseHand = raiseHand;
    return request;
}

MutationCoordinator::Mutation MutationCoordinator::begin(InternalState& internalState,
    PeerId peerId,
    const std::optional<MuteState>& muteState,
    const std::optional<int32_t>& volume,
    const std::optional<bool>& raiseHand)
{
    auto inFlightIt = _inFlight.find(peerId);
    if (inFlightIt != _inFlight.end())
    {
        inFlightIt->second->cancel();
        _inFlight.erase(inFlightIt);
    }
    internalState.overlayState.pendingMuteStateChanges.erase(peerId);

    Mutation mutation;
    mutation.request = makeRequest(peerId, muteState, volume, raiseHand);
    mutation.cancellation = utils::CancellationToken::create();

    if (!raiseHand)
    {
        PendingMuteStateChange pending;
        pending.state = muteState;
        pending.volume = volume;
        pending.cancellation = mutation.cancellation;
        internalState.overlayState.pendingMuteStateChanges.emplace(peerId, std::move(pending));
    }

    _inFlight.emplace(peerId, mutation.cancellation);
    return mutation;
}

bool MutationCoordinator::finish(PeerId peerId, const utils::CancellationTokenPtr& cancellation)
{
    if (cancellation->isCancelled())
    {
        return false;
    }

    auto inFlightIt = _inFlight.find(peerId);
    if (inFlightIt == _inFlight.end() || inFlightIt->second != cancellation)
    {
        return false;
    }

    _inFlight.erase(inFlightIt);
    return true;
}

bool MutationCoordinator::rollback(InternalState& internalState,
    PeerId peerId,
    const utils::CancellationTokenPtr& cancellation) const
{
    auto& pending = internalState.overlayState.pendingMuteStateChanges;
    auto pendingIt = pending.find(peerId);
    if (pendingIt == pending.end() || pendingIt->second.cancellation != cancellation)
    {
        return false;
    }

    pending.erase(pendingIt);
    return true;
}

void MutationCoordinator::cancelAll()
{
    for (auto& inFlight : _inFlight)
    {
        inFlight.second->cancel();
    }
    _inFlight.clear();
}

} // namespace roster
