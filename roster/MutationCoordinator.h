#pragma once

#include "roster/CallService.h"
#include "roster/OverlayState.h"
#include "utils/CancellationToken.h"
#include <optional>
#include <unordered_map>

namespace roster
{

/**
 * Keeps at most one edit request in flight per peer. Starting a new edit for a peer cancels the previous one and
 * replaces its optimistic overlay entry. Hand raise edits are sent without an overlay entry.
 */
class MutationCoordinator
{
public:
    struct Mutation
    {
        EditParticipantRequest request;
        utils::CancellationTokenPtr cancellation;
    };

    MutationCoordinator(int64_t callId, PeerId myPeerId);
    ~MutationCoordinator();

    /**
     * True if the peer as currently displayed already has the requested mute state, volume and hand state.
     * A peer not in the roster is never a no-op.
     */
    bool isNoOp(const InternalState& internalState,
        PeerId peerId,
        const std::optional<MuteState>& muteState,
        const std::optional<int32_t>& volume,
        const std::optional<bool>& raiseHand) const;

    EditParticipantRequest makeRequest(PeerId peerId,
        const std::optional<MuteState>& muteState,
        const std::optional<int32_t>& volume,
        const std::optional<bool>& raiseHand) const;

    Mutation begin(InternalState& internalState,
        PeerId peerId,
        const std::optional<MuteState>& muteState,
        const std::optional<int32_t>& volume,
        const std::optional<bool>& raiseHand);

    // returns false if the mutation was superseded or cancelled
    bool finish(PeerId peerId, const utils::CancellationTokenPtr& cancellation);

    /**
     * Drops the overlay entry created by the mutation, if it has not been replaced since.
     * @return true if the entry was removed
     */
    bool rollback(InternalState& internalState, PeerId peerId, const utils::CancellationTokenPtr& cancellation) const;

    void cancelAll();

    size_t getInFlightCount() const { return _inFlight.size(); }

private:
    const int64_t _callId;
    const PeerId _myPeerId;
    std::unordered_map<PeerId, utils::CancellationTokenPtr> _inFlight;
};

} // namespace roster
