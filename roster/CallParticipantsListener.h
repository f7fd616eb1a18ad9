#pragma once

#include "roster/ParticipantsState.h"
#include "roster/ParticipantsUpdate.h"
#include <unordered_set>

namespace roster
{

// Called on the serialization thread of the context the listener is registered with.
class CallParticipantsListener
{
public:
    virtual ~CallParticipantsListener() = default;

    virtual void onParticipantsStateChanged(const ParticipantsState& effectiveState) = 0;
    virtual void onActiveSpeakersChanged(const std::unordered_set<PeerId>& activeSpeakers) = 0;
    virtual void onMemberEvent(const MemberEvent& event) = 0;
};

} // namespace roster
