#pragma once

#include "roster/Participant.h"
#include <optional>
#include <string>

namespace roster
{

struct PeerRecord
{
    PeerId peerId = 0;
    std::string displayName;
};

/**
 * Read only lookup of peer records kept outside the roster. The roster holds peer ids only and asks the directory
 * whether a peer named in a delta is known.
 */
class PeerDirectory
{
public:
    virtual ~PeerDirectory() = default;

    virtual std::optional<PeerRecord> getPeer(PeerId peerId) const = 0;
};

} // namespace roster
