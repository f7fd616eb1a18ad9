#include "roster/MissingParticipantResolver.h"
#include <unordered_set>

namespace roster
{

namespace
{
std::unordered_set<uint32_t> collectSsrcs(const std::vector<Participant>& participants)
{
    std::unordered_set<uint32_t> ssrcs;
    for (const auto& participant : participants)
    {
        if (participant.ssrc)
        {
            ssrcs.insert(*participant.ssrc);
        }
    }
    return ssrcs;
}
} // namespace

size_t MissingParticipantResolver::addReferencedSsrcs(const std::set<uint32_t>& ssrcs,
    const std::vector<Participant>& participants)
{
    const auto knownSsrcs = collectSsrcs(participants);

    size_t added = 0;
    for (auto ssrc : ssrcs)
    {
        if (knownSsrcs.count(ssrc) == 0 && _missingSsrcs.insert(ssrc).second)
        {
            ++added;
        }
    }
    return added;
}

// Ids that became known while they waited, through a snapshot, page or delta, are dropped before the batch is built.
std::vector<uint32_t> MissingParticipantResolver::beginFetch(const std::vector<Participant>& participants)
{
    if (_isFetching)
    {
        return {};
    }

    const auto knownSsrcs = collectSsrcs(participants);
    for (auto it = _missingSsrcs.begin(); it != _missingSsrcs.end();)
    {
        if (knownSsrcs.count(*it) != 0)
        {
            it = _missingSsrcs.erase(it);
        }
        else
        {
            ++it;
        }
    }

    if (_missingSsrcs.empty())
    {
        return {};
    }

    _isFetching = true;
    return std::vector<uint32_t>(_missingSsrcs.begin(), _missingSsrcs.end());
}

// The batch is dropped whether or not the fetch found anyone. An id still unresolved is picked up again when it is
// next reported.
void MissingParticipantResolver::endFetch(const std::vector<uint32_t>& batch)
{
    for (auto ssrc : batch)
    {
        _missingSsrcs.erase(ssrc);
    }
    _isFetching = false;
}

} // namespace roster
