#pragma once

#include "roster/CallService.h"
#include "roster/PeerDirectory.h"
#include "utils/MersienneRandom.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace concurrency
{
class SynchronizationContext;
}

namespace simulator
{

/**
 * In-process stand-in for the call server and the peer store. Holds the authoritative roster of one call, bumps its
 * version on every change and answers requests asynchronously on the given network context.
 *
 * Thread safe. Requests may come from any thread and responses are delivered on the network context.
 */
class SimulatedCallServer : public roster::CallService, public roster::PeerDirectory
{
public:
    struct Settings
    {
        int64_t callId = 1;
        roster::PeerId myPeerId = 1;
        uint32_t participantCount = 250;
        // a version divisible by this is never pushed. 0 disables.
        uint32_t gapEveryNthUpdate = 0;
        // every n-th edit request fails. 0 disables.
        uint32_t mutationFailureEveryNth = 0;
        uint64_t seed = 1;
        bool sortAscending = false;
    };

    SimulatedCallServer(const Settings& settings, concurrency::SynchronizationContext& network);

    void fetchParticipants(const roster::FetchParticipantsRequest& request,
        roster::FetchParticipantsHandler&& handler) override;
    void editParticipant(const roster::EditParticipantRequest& request, roster::UpdatesHandler&& handler) override;
    void toggleRecording(const roster::ToggleRecordingRequest& request, roster::UpdatesHandler&& handler) override;
    void updateCallSettings(const roster::CallSettingsRequest& request, roster::UpdatesHandler&& handler) override;

    std::optional<roster::PeerRecord> getPeer(roster::PeerId peerId) const override;

    roster::ParticipantsPage readPage(const roster::FetchParticipantsRequest& request) const;

    // First page plus call settings, as a client would see it when joining.
    roster::ParticipantsState makeInitialState(int32_t limit) const;

    /**
     * Advances the call by one random change: a join, a leave, a mute change or a settings change.
     * Returns what the push stream delivers, which is empty when the version is withheld.
     */
    std::vector<roster::ParticipantsUpdate> tick();

    std::unordered_map<roster::PeerId, uint32_t> pickSpeakers(size_t count);
    std::optional<roster::PeerId> pickParticipant();

    int32_t getVersion() const;
    size_t getParticipantCount() const;
    uint32_t getWithheldCount() const;

private:
    struct CallSettings
    {
        roster::DefaultParticipantsAreMuted defaultParticipantsAreMuted;
        std::optional<std::string> title;
        std::optional<int32_t> recordingStartTimestamp;
    };

    roster::PeerId addParticipant();
    std::vector<roster::Participant> sortedParticipants() const;
    roster::ParticipantUpdate toUpdate(const roster::Participant& participant,
        roster::ParticipationStatusChange statusChange,
        bool isMin) const;
    roster::ParticipantsUpdate makeCallUpdate() const;
    roster::ParticipantsUpdate publish(std::vector<roster::ParticipantUpdate>&& participantUpdates);
    bool post(std::function<void()>&& task);

    const Settings _settings;
    concurrency::SynchronizationContext& _network;

    mutable std::mutex _lock;
    std::map<roster::PeerId, roster::Participant> _participants;
    std::unordered_map<roster::PeerId, roster::PeerRecord> _peers;
    CallSettings _callSettings;
    int32_t _version;
    roster::PeerId _nextPeerId;
    int32_t _nextJoinTimestamp;
    int64_t _raiseHandCounter;
    uint32_t _editCount;
    uint32_t _withheldCount;
    utils::MersienneRandom<uint32_t> _random;
};

} // namespace simulator
