#pragma once

#include "roster/Participant.h"
#include "roster/ParticipantsState.h"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace roster
{

enum class ParticipationStatusChange
{
    None,
    Joined,
    Left
};

struct ParticipantUpdate
{
    PeerId peerId = 0;
    std::optional<uint32_t> ssrc;
    std::optional<std::string> jsonParams;
    int32_t joinTimestamp = 0;
    std::optional<double> activityTimestamp;
    std::optional<int64_t> raiseHandRating;
    std::optional<MuteState> muteState;
    ParticipationStatusChange participationStatusChange = ParticipationStatusChange::None;
    std::optional<int32_t> volume;
    std::optional<std::string> about;
    // reduced projection that does not carry per viewer fields (muted by you, volume)
    bool isMin = false;
};

// Versioned delta of the roster.
struct StateUpdate
{
    std::vector<ParticipantUpdate> participantUpdates;
    int32_t version = 0;
    // peers whose pending local mute state is settled by this delta
    std::unordered_set<PeerId> removePendingMuteStates;
};

// Call level settings. Not versioned, applied on arrival.
struct CallUpdate
{
    bool isTerminated = false;
    DefaultParticipantsAreMuted defaultParticipantsAreMuted;
    std::optional<std::string> title;
    std::optional<int32_t> recordingStartTimestamp;
};

struct ParticipantsUpdate
{
    enum class Type
    {
        State,
        Call
    };

    static ParticipantsUpdate makeStateUpdate(int64_t callId, StateUpdate stateUpdate)
    {
        ParticipantsUpdate update;
        update.type = Type::State;
        update.callId = callId;
        update.state = std::move(stateUpdate);
        return update;
    }

    static ParticipantsUpdate makeCallUpdate(int64_t callId, CallUpdate callUpdate)
    {
        ParticipantsUpdate update;
        update.type = Type::Call;
        update.callId = callId;
        update.call = std::move(callUpdate);
        return update;
    }

    Type type = Type::State;
    int64_t callId = 0;
    StateUpdate state;
    CallUpdate call;
};

struct MemberEvent
{
    MemberEvent(PeerId peerId, bool joined) : peerId(peerId), joined(joined) {}

    bool operator==(const MemberEvent& other) const { return peerId == other.peerId && joined == other.joined; }

    PeerId peerId;
    bool joined;
};

} // namespace roster
