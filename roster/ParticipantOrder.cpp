#include "roster/ParticipantOrder.h"
#include <algorithm>
#include <unordered_set>

namespace roster
{

namespace
{

// present values sort first. Returns 0 if both are present and equal or both are absent.
template <typename T, typename Before>
int compareOptional(const std::optional<T>& lhs, const std::optional<T>& rhs, Before before)
{
    if (lhs && rhs)
    {
        if (*lhs == *rhs)
        {
            return 0;
        }
        return before(*lhs, *rhs) ? -1 : 1;
    }
    if (lhs)
    {
        return -1;
    }
    if (rhs)
    {
        return 1;
    }
    return 0;
}

} // namespace

int compareParticipants(const Participant& lhs, const Participant& rhs, bool sortAscending)
{
    int result = compareOptional(lhs.activityRank, rhs.activityRank, [](int32_t a, int32_t b) { return a < b; });
    if (result != 0)
    {
        return result;
    }

    result = compareOptional(lhs.activityTimestamp, rhs.activityTimestamp, [](double a, double b) { return a > b; });
    if (result != 0)
    {
        return result;
    }

    result = compareOptional(lhs.raiseHandRating, rhs.raiseHandRating, [](int64_t a, int64_t b) { return a > b; });
    if (result != 0)
    {
        return result;
    }

    if (lhs.joinTimestamp != rhs.joinTimestamp)
    {
        if (sortAscending)
        {
            return lhs.joinTimestamp < rhs.joinTimestamp ? -1 : 1;
        }
        return lhs.joinTimestamp > rhs.joinTimestamp ? -1 : 1;
    }

    if (lhs.peerId != rhs.peerId)
    {
        return lhs.peerId < rhs.peerId ? -1 : 1;
    }
    return 0;
}

void sortParticipants(std::vector<Participant>& participants, bool sortAscending)
{
    std::stable_sort(participants.begin(), participants.end(), ParticipantOrder(sortAscending));
}

std::vector<Participant> mergeAndSortParticipants(const std::vector<Participant>& current,
    const std::vector<Participant>& incoming,
    bool sortAscending)
{
    std::vector<Participant> merged = current;
    merged.reserve(current.size() + incoming.size());

    std::unordered_set<PeerId> knownPeers;
    for (const auto& participant : current)
    {
        knownPeers.insert(participant.peerId);
    }
    for (const auto& participant : incoming)
    {
        if (knownPeers.insert(participant.peerId).second)
        {
            merged.push_back(participant);
        }
    }

    sortParticipants(merged, sortAscending);
    return merged;
}

} // namespace roster
