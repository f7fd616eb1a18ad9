#pragma once

#include "roster/Participant.h"
#include <vector>

namespace roster
{

/**
 * Total order over participants, by descending priority:
 * 1. activity rank present first, smaller rank first
 * 2. activity timestamp present first, more recent first
 * 3. raise hand rating present first, higher rating first
 * 4. join timestamp, ascending if sortAscending else descending
 * 5. peer id ascending
 *
 * Returns negative if lhs sorts before rhs, positive if after and 0 only for the same peer id.
 */
int compareParticipants(const Participant& lhs, const Participant& rhs, bool sortAscending);

struct ParticipantOrder
{
    explicit ParticipantOrder(bool sortAscending) : sortAscending(sortAscending) {}

    bool operator()(const Participant& lhs, const Participant& rhs) const
    {
        return compareParticipants(lhs, rhs, sortAscending) < 0;
    }

    bool sortAscending;
};

void sortParticipants(std::vector<Participant>& participants, bool sortAscending);

/**
 * Union by peer id where entries already in current win, then sorted.
 */
std::vector<Participant> mergeAndSortParticipants(const std::vector<Participant>& current,
    const std::vector<Participant>& incoming,
    bool sortAscending);

} // namespace roster
