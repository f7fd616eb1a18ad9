#pragma once

#include "roster/Participant.h"
#include "roster/ParticipantsUpdate.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace roster
{

struct FetchParticipantsRequest
{
    int64_t callId = 0;
    // empty for the first page
    std::string offset;
    // when not empty, only participants using these media sources
    std::vector<uint32_t> ssrcs;
    int32_t limit = 100;
    std::optional<bool> sortAscending;
};

// One page of the roster as returned by a fetch. version is the server version the page was read at.
struct ParticipantsPage
{
    std::vector<Participant> participants;
    std::optional<std::string> nextOffset;
    int32_t totalCount = 0;
    int32_t version = 0;
    bool sortAscending = false;
};

struct EditParticipantRequest
{
    int64_t callId = 0;
    PeerId peerId = 0;
    // muted is only meaningful when the request changes the mute state
    bool changesMuteState = false;
    bool muted = false;
    std::optional<int32_t> volume;
    std::optional<bool> raiseHand;
};

struct ToggleRecordingRequest
{
    int64_t callId = 0;
    bool shouldBeRecording = false;
    std::optional<std::string> title;
};

struct CallSettingsRequest
{
    int64_t callId = 0;
    std::optional<bool> joinMuted;
    bool resetInviteHash = false;
};

// nullopt on failure
using FetchParticipantsHandler = std::function<void(const std::optional<ParticipantsPage>& result)>;
using UpdatesHandler = std::function<void(const std::optional<std::vector<ParticipantsUpdate>>& result)>;

/**
 * Request/response side of the network layer. Handlers may be invoked on any thread, at most once per request.
 */
class CallService
{
public:
    virtual ~CallService() = default;

    virtual void fetchParticipants(const FetchParticipantsRequest& request, FetchParticipantsHandler&& handler) = 0;
    virtual void editParticipant(const EditParticipantRequest& request, UpdatesHandler&& handler) = 0;
    virtual void toggleRecording(const ToggleRecordingRequest& request, UpdatesHandler&& handler) = 0;
    virtual void updateCallSettings(const CallSettingsRequest& request, UpdatesHandler&& handler) = 0;
};

} // namespace roster
