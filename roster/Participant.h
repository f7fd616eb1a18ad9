#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roster
{

// Opaque peer identifier. Peer records themselves live in the PeerDirectory.
using PeerId = uint64_t;

struct MuteState
{
    MuteState() : canUnmute(false), mutedByYou(false) {}
    MuteState(bool canUnmute, bool mutedByYou) : canUnmute(canUnmute), mutedByYou(mutedByYou) {}

    bool operator==(const MuteState& other) const
    {
        return canUnmute == other.canUnmute && mutedByYou == other.mutedByYou;
    }
    bool operator!=(const MuteState& other) const { return !(*this == other); }

    bool canUnmute;
    bool mutedByYou;
};

struct Participant
{
    PeerId peerId = 0;
    std::optional<uint32_t> ssrc;
    std::optional<std::string> jsonParams;
    // server seconds, stable for a peer within a session
    int32_t joinTimestamp = 0;
    std::optional<int64_t> raiseHandRating;
    bool hasRaiseHand = false;
    // wall clock seconds of last detected speech, never decreases
    std::optional<double> activityTimestamp;
    // local recency marker, lower is more recent. Never set by the server.
    std::optional<int32_t> activityRank;
    std::optional<MuteState> muteState;
    std::optional<int32_t> volume;
    std::optional<std::string> about;

    bool operator==(const Participant& other) const;
    bool operator!=(const Participant& other) const { return !(*this == other); }

    /**
     * Carries over the locally maintained activity annotations of other, which describes the same peer.
     * The rank is always taken from other. The activity timestamp is merged only if mergeActivityTimestamp is set
     * and never moves backwards.
     */
    void mergeActivity(const Participant& other, bool mergeActivityTimestamp);
};

std::optional<double> maxActivityTimestamp(const std::optional<double>& a, const std::optional<double>& b);

} // namespace roster
