#pragma once

#include "roster/ParticipantsState.h"
#include "utils/CancellationToken.h"
#include <unordered_map>
#include <unordered_set>

namespace roster
{

/**
 * Mute state and volume requested locally for a peer and not yet confirmed by the server.
 * cancellation belongs to the in-flight edit request that created the entry.
 */
struct PendingMuteStateChange
{
    bool operator==(const PendingMuteStateChange& other) const
    {
        return state == other.state && volume == other.volume && cancellation == other.cancellation;
    }
    bool operator!=(const PendingMuteStateChange& other) const { return !(*this == other); }

    std::optional<MuteState> state;
    std::optional<int32_t> volume;
    utils::CancellationTokenPtr cancellation;
};

struct OverlayState
{
    bool operator==(const OverlayState& other) const
    {
        return pendingMuteStateChanges == other.pendingMuteStateChanges;
    }
    bool operator!=(const OverlayState& other) const { return !(*this == other); }

    bool isEmpty() const { return pendingMuteStateChanges.empty(); }
    void removePending(const std::unordered_set<PeerId>& peerIds);

    std::unordered_map<PeerId, PendingMuteStateChange> pendingMuteStateChanges;
};

// The only mutable unit of a call roster. Replaced as a whole.
struct InternalState
{
    bool operator==(const InternalState& other) const
    {
        return state == other.state && overlayState == other.overlayState;
    }
    bool operator!=(const InternalState& other) const { return !(*this == other); }

    ParticipantsState state;
    OverlayState overlayState;
};

/**
 * Read time projection of the roster as a viewer sees it. Pending mute states and volumes replace the authoritative
 * ones, and raise hand ratings are hidden unless the viewer is the creator or an admin. The base state is not
 * modified.
 */
ParticipantsState makeEffectiveState(const InternalState& internalState, PeerId viewerPeerId);

} // namespace roster
