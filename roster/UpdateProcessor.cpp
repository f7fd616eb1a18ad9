#include "roster/UpdateProcessor.h"
#include "logger/Logger.h"
#include "roster/ParticipantOrder.h"
#include "roster/PeerDirectory.h"
#include <algorithm>
#include <cassert>
#include <cinttypes>

namespace roster
{

UpdateProcessor::UpdateProcessor(const PeerDirectory& peerDirectory, const char* loggableId)
    : _peerDirectory(peerDirectory),
      _loggableId(loggableId),
      _phase(Phase::Idle)
{
}

void UpdateProcessor::enqueue(std::vector<StateUpdate>&& updates)
{
    for (auto& update : updates)
    {
        _updateQueue.push_back(std::move(update));
    }
}

bool UpdateProcessor::drain(InternalState& internalState, std::vector<MemberEvent>& outEvents)
{
    while (_phase == Phase::Idle && !_updateQueue.empty())
    {
        _phase = Phase::ProcessingUpdate;
        const StateUpdate update = std::move(_updateQueue.front());
        _updateQueue.pop_front();

        if (apply(internalState, update, outEvents) == Outcome::Gap)
        {
            logger::info("version gap, have %d received %d, %zu queued updates dropped",
                _loggableId,
                internalState.state.version,
                update.version,
                _updateQueue.size());
            beginResync();
            return true;
        }
        _phase = Phase::Idle;
    }
    return false;
}

UpdateProcessor::Outcome UpdateProcessor::apply(InternalState& internalState,
    const StateUpdate& update,
    std::vector<MemberEvent>& outEvents) const
{
    auto& state = internalState.state;
    if (update.version < state.version)
    {
        logger::debug("stale update version %d, current %d", _loggableId, update.version, state.version);
        internalState.overlayState.removePending(update.removePendingMuteStates);
        return Outcome::Stale;
    }

    if (update.version > state.version + 1)
    {
        internalState.overlayState.removePending(update.removePendingMuteStates);
        return Outcome::Gap;
    }

    const bool isVersionUpdate = update.version != state.version;
    auto& participants = state.participants;
    int32_t totalCount = state.totalCount;

    for (const auto& participantUpdate : update.participantUpdates)
    {
        auto existingIt = std::find_if(participants.begin(), participants.end(), [&](const Participant& participant) {
            return participant.peerId == participantUpdate.peerId;
        });

        if (participantUpdate.participationStatusChange == ParticipationStatusChange::Left)
        {
            if (existingIt != participants.end())
            {
                participants.erase(existingIt);
                totalCount = std::max(0, totalCount - 1);
                outEvents.emplace_back(participantUpdate.peerId, false);
            }
            else if (isVersionUpdate)
            {
                totalCount = std::max(0, totalCount - 1);
            }
            continue;
        }

        if (!_peerDirectory.getPeer(participantUpdate.peerId))
        {
            logger::error("update %d names unknown peer %" PRIu64 ", skipped",
                _loggableId,
                update.version,
                participantUpdate.peerId);
            assert(false);
            continue;
        }

        Participant participant;
        participant.peerId = participantUpdate.peerId;
        participant.ssrc = participantUpdate.ssrc;
        participant.jsonParams = participantUpdate.jsonParams;
        participant.joinTimestamp = participantUpdate.joinTimestamp;
        participant.raiseHandRating = participantUpdate.raiseHandRating;
        participant.hasRaiseHand = participantUpdate.raiseHandRating.has_value();
        participant.activityTimestamp = participantUpdate.activityTimestamp;
        participant.muteState = participantUpdate.muteState;
        participant.volume = participantUpdate.volume;
        participant.about = participantUpdate.about;

        if (existingIt != participants.end())
        {
            const Participant& previous = *existingIt;
            participant.joinTimestamp = previous.joinTimestamp;
            participant.activityRank = previous.activityRank;
            participant.activityTimestamp =
                maxActivityTimestamp(previous.activityTimestamp, participantUpdate.activityTimestamp);
            if (participantUpdate.isMin)
            {
                if (previous.muteState && previous.muteState->mutedByYou)
                {
                    participant.muteState = previous.muteState;
                }
                if (previous.volume)
                {
                    participant.volume = previous.volume;
                }
            }
            participants.erase(existingIt);
        }
        else if (participantUpdate.participationStatusChange == ParticipationStatusChange::Joined)
        {
            ++totalCount;
            outEvents.emplace_back(participantUpdate.peerId, true);
        }

        participants.push_back(std::move(participant));
    }

    state.totalCount = std::max(totalCount, static_cast<int32_t>(participants.size()));
    sortParticipants(participants, state.sortAscending);
    state.version = update.version;
    internalState.overlayState.removePending(update.removePendingMuteStates);
    return Outcome::Applied;
}

void UpdateProcessor::beginResync()
{
    _updateQueue.clear();
    _phase = Phase::ResyncingFromServer;
}

void UpdateProcessor::endResync()
{
    _phase = Phase::Idle;
}

const char* toString(UpdateProcessor::Phase phase)
{
    switch (phase)
    {
    case UpdateProcessor::Phase::Idle:
        return "Idle";
    case UpdateProcessor::Phase::ProcessingUpdate:
        return "ProcessingUpdate";
    case UpdateProcessor::Phase::ResyncingFromServer:
        return "ResyncingFromServer";
    }
    return "unknown";
}

} // namespace roster
