#pragma once

#include "roster/Participant.h"
#include "roster/ParticipantsState.h"
#include "roster/ParticipantsUpdate.h"
#include <initializer_list>
#include <vector>

namespace test
{

inline roster::Participant makeParticipant(roster::PeerId peerId, int32_t joinTimestamp)
{
    roster::Participant participant;
    participant.peerId = peerId;
    participant.ssrc = static_cast<uint32_t>(peerId * 10);
    participant.joinTimestamp = joinTimestamp;
    return participant;
}

inline roster::ParticipantUpdate makeParticipantUpdate(roster::PeerId peerId,
    int32_t joinTimestamp,
    roster::ParticipationStatusChange statusChange)
{
    roster::ParticipantUpdate update;
    update.peerId = peerId;
    update.ssrc = static_cast<uint32_t>(peerId * 10);
    update.joinTimestamp = joinTimestamp;
    update.participationStatusChange = statusChange;
    return update;
}

inline roster::StateUpdate makeStateUpdate(int32_t version, std::vector<roster::ParticipantUpdate> participantUpdates)
{
    roster::StateUpdate update;
    update.version = version;
    update.participantUpdates = std::move(participantUpdates);
    return update;
}

inline roster::ParticipantsState makeState(std::initializer_list<roster::Participant> participants, int32_t version)
{
    roster::ParticipantsState state;
    state.participants = participants;
    state.totalCount = static_cast<int32_t>(state.participants.size());
    state.version = version;
    return state;
}

inline std::vector<roster::PeerId> peerIds(const std::vector<roster::Participant>& participants)
{
    std::vector<roster::PeerId> ids;
    for (const auto& participant : participants)
    {
        ids.push_back(participant.peerId);
    }
    return ids;
}

} // namespace test
