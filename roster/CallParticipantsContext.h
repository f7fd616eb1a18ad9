#pragma once

#include "logger/Logger.h"
#include "roster/ActivityDecay.h"
#include "roster/CallService.h"
#include "roster/MissingParticipantResolver.h"
#include "roster/MutationCoordinator.h"
#include "roster/OverlayState.h"
#include "roster/RosterSettings.h"
#include "roster/UpdateProcessor.h"
#include "utils/CancellationToken.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace concurrency
{
class SynchronizationContext;
}

namespace jobmanager
{
class JobManager;
}

namespace roster
{

class CallParticipantsListener;
class PeerDirectory;

/**
 * Client side mirror of the participant roster of one group call.
 *
 * The server owns the roster and pushes versioned deltas. They are applied in version order, and a skipped version
 * makes the context refetch a snapshot. Edits made locally show up immediately as an overlay on the roster and are
 * dropped again when the server confirms or rejects them.
 *
 * Not thread safe. Every public method must be called on the thread draining the JobManager given at construction,
 * and the context must be destroyed on that thread too. Collaborator completions are posted back onto that
 * JobManager before they touch any state.
 */
class CallParticipantsContext
{
public:
    // Survives the context, so activity ranks keep increasing when a call's context is re-created.
    struct ServiceState
    {
        int32_t nextActivityRank = 0;
    };

    CallParticipantsContext(int64_t callId,
        PeerId myPeerId,
        const ParticipantsState& initialState,
        const std::optional<ServiceState>& previousServiceState,
        CallService& callService,
        const PeerDirectory& peerDirectory,
        jobmanager::JobManager& jobManager,
        const RosterSettings& settings);
    ~CallParticipantsContext();

    void addListener(CallParticipantsListener* listener);
    void removeListener(CallParticipantsListener* listener);

    // Push stream entry point. Updates for other calls are ignored.
    void onPushedUpdates(const std::vector<ParticipantsUpdate>& updates);
    void addUpdates(const std::vector<ParticipantsUpdate>& updates);

    void updateAdminIds(const std::unordered_set<PeerId>& adminIds);

    /**
     * Marks the peers as speaking now. Peers that had no rank get the next one and move to the front.
     * Media source ids no participant is known to use are fetched from the server.
     */
    void reportSpeakingParticipants(const std::unordered_map<PeerId, uint32_t>& speakers);

    // Peers with their last speaking time in seconds, as detected by the call's activity feed.
    void updatePeerActivities(const std::vector<std::pair<PeerId, double>>& activities);

    void ensureHaveParticipants(const std::set<uint32_t>& ssrcs);

    void updateMuteState(PeerId peerId,
        const std::optional<MuteState>& muteState,
        const std::optional<int32_t>& volume,
        const std::optional<bool>& raiseHand);
    void raiseHand();
    void lowerHand();

    void updateShouldBeRecording(bool shouldBeRecording, const std::optional<std::string>& title);
    void updateDefaultParticipantsAreMuted(bool isMuted);
    void resetInviteLinks();

    void loadMore(const std::string& token);

    // Run by the activity decay timer.
    void sweepActivityRanks();

    const ParticipantsState& getState() const { return _effectiveState; }
    const InternalState& getInternalState() const { return _internalState; }
    const std::unordered_set<PeerId>& getActiveSpeakers() const { return _activeSpeakers; }
    ServiceState getServiceState() const { return _serviceState; }
    UpdateProcessor::Phase getUpdatePhase() const { return _updateProcessor.getPhase(); }
    bool isLoading() const { return _isLoadingMore; }
    int64_t getCallId() const { return _callId; }

private:
    // Completions refused by the synchronization context. Filled from collaborator threads.
    struct DeferredCompletions
    {
        std::mutex lock;
        std::vector<std::function<void()>> completions;
    };

    template <typename T>
    std::function<void(const T&)> postBack(std::function<void(const T&)> handler);
    void runDeferredCompletions();

    void processUpdates();
    void resetStateFromServer();
    void loadMissingSsrcs();
    void onSnapshotFetched(const std::optional<ParticipantsPage>& page);
    void onMissingFetched(const std::vector<uint32_t>& batch, const std::optional<ParticipantsPage>& page);
    void onPageFetched(const std::optional<ParticipantsPage>& page);
    void onEditResponse(PeerId peerId,
        const utils::CancellationTokenPtr& cancellation,
        const std::optional<std::vector<ParticipantsUpdate>>& result);
    void onSettingsResponse(const char* operation,
        const utils::CancellationTokenPtr& cancellation,
        const std::optional<std::vector<ParticipantsUpdate>>& result);

    utils::CancellationTokenPtr replaceRequest(utils::CancellationTokenPtr& slot);
    std::vector<ParticipantsUpdate> filterForThisCall(const std::vector<ParticipantsUpdate>& updates) const;
    int32_t takeNextActivityRank();

    void commit(InternalState&& internalState);
    void emitMemberEvents(const std::vector<MemberEvent>& events);
    void setActiveSpeakers(std::unordered_set<PeerId>&& activeSpeakers);
    template <typename Callback>
    void notifyListeners(Callback&& callback);

    logger::LoggableId _loggableId;
    const int64_t _callId;
    const PeerId _myPeerId;
    const RosterSettings _settings;
    CallService& _callService;
    concurrency::SynchronizationContext& _synchronizationContext;
    utils::CancellationTokenPtr _lifetime;
    std::shared_ptr<DeferredCompletions> _deferredCompletions;

    InternalState _internalState;
    ParticipantsState _effectiveState;
    ServiceState _serviceState;
    std::unordered_set<PeerId> _activeSpeakers;
    bool _hasReceivedSpeakingParticipantsReport;

    UpdateProcessor _updateProcessor;
    MissingParticipantResolver _missingParticipants;
    MutationCoordinator _mutations;

    // one snapshot, backfill or page fetch at a time
    bool _isLoadingMore;
    bool _shouldResetStateFromServer;
    utils::CancellationTokenPtr _fetchRequest;

    utils::CancellationTokenPtr _recordingRequest;
    utils::CancellationTokenPtr _defaultMuteRequest;
    utils::CancellationTokenPtr _inviteLinksRequest;

    std::vector<CallParticipantsListener*> _listeners;
    ActivityDecayTimer _decayTimer;
};

} // namespace roster
