#pragma once

#include "roster/OverlayState.h"
#include "roster/ParticipantsUpdate.h"
#include <deque>
#include <vector>

namespace roster
{

class PeerDirectory;

/**
 * Applies versioned roster deltas strictly in order, one at a time.
 *
 * Deltas are queued FIFO and only taken while Idle. A delta older than the current version is dropped, apart from
 * settling the pending mute states it names. A delta that skips versions leaves the processor in
 * ResyncingFromServer with the queue discarded; it stays there until the owner has fetched a fresh snapshot and
 * calls endResync().
 */
class UpdateProcessor
{
public:
    enum class Phase
    {
        Idle,
        ProcessingUpdate,
        ResyncingFromServer
    };

    enum class Outcome
    {
        Applied,
        Stale,
        Gap
    };

    UpdateProcessor(const PeerDirectory& peerDirectory, const char* loggableId);

    void enqueue(std::vector<StateUpdate>&& updates);

    /**
     * Applies queued deltas until the queue is empty or a gap is found.
     * @return true if a gap was found and a snapshot must be fetched
     */
    bool drain(InternalState& internalState, std::vector<MemberEvent>& outEvents);

    Outcome apply(InternalState& internalState, const StateUpdate& update, std::vector<MemberEvent>& outEvents) const;

    void beginResync();
    void endResync();

    Phase getPhase() const { return _phase; }
    size_t getQueueSize() const { return _updateQueue.size(); }

private:
    const PeerDirectory& _peerDirectory;
    const char* _loggableId;

    Phase _phase;
    std::deque<StateUpdate> _updateQueue;
};

const char* toString(UpdateProcessor::Phase phase);

} // namespace roster
