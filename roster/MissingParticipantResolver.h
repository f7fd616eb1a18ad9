#pragma once

#include "roster/Participant.h"
#include <cstdint>
#include <set>
#include <vector>

namespace roster
{

/**
 * Collects media source ids heard in the call that no known participant uses. Ids are handed out in batches, one
 * batch at a time. Ids discovered while a batch is out wait for the next one.
 */
class MissingParticipantResolver
{
public:
    MissingParticipantResolver() : _isFetching(false) {}

    // returns number of ids that were not already known or pending
    size_t addReferencedSsrcs(const std::set<uint32_t>& ssrcs, const std::vector<Participant>& participants);

    bool hasPending() const { return !_missingSsrcs.empty(); }
    bool isFetching() const { return _isFetching; }

    // empty when nothing is left to fetch or a batch is already out
    std::vector<uint32_t> beginFetch(const std::vector<Participant>& participants);
    void endFetch(const std::vector<uint32_t>& batch);

    const std::set<uint32_t>& getMissingSsrcs() const { return _missingSsrcs; }

private:
    std::set<uint32_t> _missingSsrcs;
    bool _isFetching;
};

} // namespace roster
