#include "roster/Participant.h"
#include <algorithm>

namespace roster
{

bool Participant::operator==(const Participant& other) const
{
    return peerId == other.peerId && ssrc == other.ssrc && jsonParams == other.jsonParams &&
        joinTimestamp == other.joinTimestamp && raiseHandRating == other.raiseHandRating &&
        hasRaiseHand == other.hasRaiseHand && activityTimestamp == other.activityTimestamp &&
        activityRank == other.activityRank && muteState == other.muteState && volume == other.volume &&
        about == other.about;
}

void Participant::mergeActivity(const Participant& other, bool mergeActivityTimestamp)
{
    activityRank = other.activityRank;
    if (mergeActivityTimestamp)
    {
        activityTimestamp = maxActivityTimestamp(activityTimestamp, other.activityTimestamp);
    }
}

std::optional<double> maxActivityTimestamp(const std::optional<double>& a, const std::optional<double>& b)
{
    if (a && b)
    {
        return std::max(*a, *b);
    }
    return a ? a : b;
}

} // namespace roster
