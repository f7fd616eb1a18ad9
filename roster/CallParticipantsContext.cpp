#include "roster/CallParticipantsContext.h"
#include "jobmanager/JobManager.h"
#include "roster/CallParticipantsListener.h"
#include "roster/ParticipantOrder.h"
#include "utils/Time.h"
#include <algorithm>
#include <cinttypes>

namespace roster
{

CallParticipantsContext::CallParticipantsContext(int64_t callId,
    PeerId myPeerId,
    const ParticipantsState& initialState,
    const std::optional<ServiceState>& previousServiceState,
    CallService& callService,
    const PeerDirectory& peerDirectory,
    jobmanager::JobManager& jobManager,
    const RosterSettings& settings)
    : _loggableId("CallRoster"),
      _callId(callId),
      _myPeerId(myPeerId),
      _settings(settings),
      _callService(callService),
      _synchronizationContext(jobManager),
      _lifetime(utils::CancellationToken::create()),
      _deferredCompletions(std::make_shared<DeferredCompletions>()),
      _serviceState(previousServiceState.value_or(ServiceState())),
      _hasReceivedSpeakingParticipantsReport(false),
      _updateProcessor(peerDirectory, _loggableId.c_str()),
      _mutations(callId, myPeerId),
      _isLoadingMore(false),
      _shouldResetStateFromServer(false),
      _decayTimer(jobManager, settings.decayIntervalMs, [this]() { sweepActivityRanks(); })
{
    _internalState.state = initialState;
    sortParticipants(_internalState.state.participants, _internalState.state.sortAscending);
    _effectiveState = makeEffectiveState(_internalState, _myPeerId);

    logger::info("call %" PRId64 " roster created, version %d, %zu of %d participants, next rank %d",
        _loggableId.c_str(),
        _callId,
        _internalState.state.version,
        _internalState.state.participants.size(),
        _internalState.state.totalCount,
        _serviceState.nextActivityRank);

    _decayTimer.start();
}

CallParticipantsContext::~CallParticipantsContext()
{
    _lifetime->cancel();
    _decayTimer.stop();
    _mutations.cancelAll();
    for (auto* request : {&_fetchRequest, &_recordingRequest, &_defaultMuteRequest, &_inviteLinksRequest})
    {
        if (*request)
        {
            (*request)->cancel();
        }
    }
}

void CallParticipantsContext::addListener(CallParticipantsListener* listener)
{
    if (std::find(_listeners.begin(), _listeners.end(), listener) == _listeners.end())
    {
        _listeners.push_back(listener);
    }
}

void CallParticipantsContext::removeListener(CallParticipantsListener* listener)
{
    _listeners.erase(std::remove(_listeners.begin(), _listeners.end(), listener), _listeners.end());
}

// A completion the synchronization context refuses is kept and run at the next entry point on the context's thread.
template <typename T>
std::function<void(const T&)> CallParticipantsContext::postBack(std::function<void(const T&)> handler)
{
    auto lifetime = _lifetime;
    auto deferredCompletions = _deferredCompletions;
    auto& synchronizationContext = _synchronizationContext;
    const std::string loggableId = _loggableId.c_str();
    return [lifetime, deferredCompletions, &synchronizationContext, handler, loggableId](const T& result) {
        if (lifetime->isCancelled())
        {
            return;
        }

        concurrency::SynchronizationContext::Task completion = [lifetime, handler, result]() {
            if (!lifetime->isCancelled())
            {
                handler(result);
            }
        };
        if (!synchronizationContext.post(concurrency::SynchronizationContext::Task(completion)))
        {
            logger::warn("failed to post completion, deferred to next update", loggableId.c_str());
            std::lock_guard<std::mutex> locker(deferredCompletions->lock);
            deferredCompletions->completions.push_back(std::move(completion));
        }
    };
}

void CallParticipantsContext::runDeferredCompletions()
{
    std::vector<concurrency::SynchronizationContext::Task> completions;
    {
        std::lock_guard<std::mutex> locker(_deferredCompletions->lock);
        completions.swap(_deferredCompletions->completions);
    }

    if (completions.empty())
    {
        return;
    }

    logger::info("running %zu deferred completions", _loggableId.c_str(), completions.size());
    for (auto& completion : completions)
    {
        completion();
    }
}

std::vector<ParticipantsUpdate> CallParticipantsContext::filterForThisCall(
    const std::vector<ParticipantsUpdate>& updates) const
{
    std::vector<ParticipantsUpdate> filtered;
    for (const auto& update : updates)
    {
        if (update.callId == _callId)
        {
            filtered.push_back(update);
        }
    }
    return filtered;
}

void CallParticipantsContext::onPushedUpdates(const std::vector<ParticipantsUpdate>& updates)
{
    auto filtered = filterForThisCall(updates);
    if (!filtered.empty())
    {
        addUpdates(filtered);
    }
}

void CallParticipantsContext::addUpdates(const std::vector<ParticipantsUpdate>& updates)
{
    runDeferredCompletions();

    std::vector<StateUpdate> stateUpdates;
    InternalState nextState = _internalState;
    bool callUpdated = false;

    for (const auto& update : updates)
    {
        if (update.type == ParticipantsUpdate::Type::State)
        {
            stateUpdates.push_back(update.state);
            continue;
        }

        auto& state = nextState.state;
        state.defaultParticipantsAreMuted = update.call.defaultParticipantsAreMuted;
        state.recordingStartTimestamp = update.call.recordingStartTimestamp;
        state.title = update.call.title;
        callUpdated = true;
        if (update.call.isTerminated)
        {
            logger::info("call %" PRId64 " terminated by server", _loggableId.c_str(), _callId);
        }
    }

    if (callUpdated)
    {
        commit(std::move(nextState));
    }

    if (!stateUpdates.empty())
    {
        _updateProcessor.enqueue(std::move(stateUpdates));
        processUpdates();
    }
}

void CallParticipantsContext::processUpdates()
{
    if (_updateProcessor.getPhase() != UpdateProcessor::Phase::Idle || _updateProcessor.getQueueSize() == 0)
    {
        return;
    }

    InternalState nextState = _internalState;
    std::vector<MemberEvent> events;
    const bool gapFound = _updateProcessor.drain(nextState, events);
    commit(std::move(nextState));
    emitMemberEvents(events);

    if (gapFound)
    {
        resetStateFromServer();
    }
}

void CallParticipantsContext::resetStateFromServer()
{
    if (_isLoadingMore)
    {
        logger::info("resync deferred until current fetch completes", _loggableId.c_str());
        _shouldResetStateFromServer = true;
        return;
    }

    _isLoadingMore = true;
    _updateProcessor.beginResync();
    logger::info("resync from server, have version %d", _loggableId.c_str(), _internalState.state.version);

    FetchParticipantsRequest request;
    request.callId = _callId;
    request.limit = _settings.fetchLimit;
    request.sortAscending = _internalState.state.sortAscending;

    auto cancellation = replaceRequest(_fetchRequest);
    _callService.fetchParticipants(request,
        postBack<std::optional<ParticipantsPage>>([this, cancellation](const std::optional<ParticipantsPage>& page) {
            if (!cancellation->isCancelled())
            {
                onSnapshotFetched(page);
            }
        }));
}

void CallParticipantsContext::onSnapshotFetched(const std::optional<ParticipantsPage>& page)
{
    _isLoadingMore = false;
    _shouldResetStateFromServer = false;

    if (!page)
    {
        logger::warn("resync fetch failed, staying at version %d", _loggableId.c_str(), _internalState.state.version);
        _updateProcessor.endResync();
        processUpdates();
        return;
    }

    if (page->version < _internalState.state.version)
    {
        logger::warn("resync snapshot version %d is older than current %d, ignored",
            _loggableId.c_str(),
            page->version,
            _internalState.state.version);
        _updateProcessor.endResync();
        processUpdates();
        return;
    }

    InternalState nextState = _internalState;
    ParticipantsState& state = nextState.state;
    const ParticipantsState previousState = _internalState.state;

    state.participants = page->participants;
    state.nextParticipantsFetchOffset = page->nextOffset;
    state.sortAscending = page->sortAscending;
    state.totalCount = std::max(page->totalCount, static_cast<int32_t>(page->participants.size()));
    state.version = page->version;
    state.mergeActivity(previousState, true);

    logger::info("resync done, version %d -> %d, %zu of %d participants",
        _loggableId.c_str(),
        previousState.version,
        state.version,
        state.participants.size(),
        state.totalCount);

    commit(std::move(nextState));
    _updateProcessor.endResync();
    processUpdates();
    loadMissingSsrcs();
}

void CallParticipantsContext::updateAdminIds(const std::unordered_set<PeerId>& adminIds)
{
    if (_internalState.state.adminIds == adminIds)
    {
        return;
    }

    InternalState nextState = _internalState;
    nextState.state.adminIds = adminIds;
    commit(std::move(nextState));
}

int32_t CallParticipantsContext::takeNextActivityRank()
{
    return _serviceState.nextActivityRank++;
}

void CallParticipantsContext::reportSpeakingParticipants(const std::unordered_map<PeerId, uint32_t>& speakers)
{
    runDeferredCompletions();
    if (!speakers.empty())
    {
        _hasReceivedSpeakingParticipantsReport = true;
    }

    InternalState nextState = _internalState;
    auto& state = nextState.state;
    const double timestamp = utils::Time::nowSeconds();
    bool updated = false;

    for (const auto& speaker : speakers)
    {
        Participant* participant = state.findParticipant(speaker.first);
        if (!participant)
        {
            continue;
        }

        if (!participant->activityTimestamp || *participant->activityTimestamp < timestamp)
        {
            participant->activityTimestamp = timestamp;
            if (!participant->activityRank)
            {
                participant->activityRank = takeNextActivityRank();
            }
            updated = true;
        }
    }

    if (updated)
    {
        sortParticipants(state.participants, state.sortAscending);
        commit(std::move(nextState));
    }

    std::set<uint32_t> ssrcs;
    for (const auto& speaker : speakers)
    {
        ssrcs.insert(speaker.second);
    }
    ensureHaveParticipants(ssrcs);
}

void CallParticipantsContext::updatePeerActivities(const std::vector<std::pair<PeerId, double>>& activities)
{
    runDeferredCompletions();

    std::unordered_set<PeerId> activeSpeakers;
    for (const auto& activity : activities)
    {
        activeSpeakers.insert(activity.first);
    }
    setActiveSpeakers(std::move(activeSpeakers));

    if (_hasReceivedSpeakingParticipantsReport)
    {
        return;
    }

    InternalState nextState = _internalState;
    auto& state = nextState.state;
    bool updated = false;
    for (const auto& activity : activities)
    {
        Participant* participant = state.findParticipant(activity.first);
        if (participant && (!participant->activityTimestamp || *participant->activityTimestamp < activity.second))
        {
            participant->activityTimestamp = activity.second;
            updated = true;
        }
    }

    if (updated)
    {
        sortParticipants(state.participants, state.sortAscending);
        commit(std::move(nextState));
    }
}

void CallParticipantsContext::ensureHaveParticipants(const std::set<uint32_t>& ssrcs)
{
    if (_missingParticipants.addReferencedSsrcs(ssrcs, _internalState.state.participants) > 0)
    {
        loadMissingSsrcs();
    }
}

void CallParticipantsContext::loadMissingSsrcs()
{
    if (!_missingParticipants.hasPending() || _isLoadingMore)
    {
        return;
    }

    const auto batch = _missingParticipants.beginFetch(_internalState.state.participants);
    if (batch.empty())
    {
        return;
    }

    _isLoadingMore = true;
    logger::debug("requesting %zu missing ssrcs", _loggableId.c_str(), batch.size());

    FetchParticipantsRequest request;
    request.callId = _callId;
    request.ssrcs = batch;
    request.limit = _settings.fetchLimit;
    request.sortAscending = true;

    auto cancellation = replaceRequest(_fetchRequest);
    _callService.fetchParticipants(request,
        postBack<std::optional<ParticipantsPage>>(
            [this, cancellation, batch](const std::optional<ParticipantsPage>& page) {
                if (!cancellation->isCancelled())
                {
                    onMissingFetched(batch, page);
                }
            }));
}

void CallParticipantsContext::onMissingFetched(const std::vector<uint32_t>& batch,
    const std::optional<ParticipantsPage>& page)
{
    _isLoadingMore = false;
    _missingParticipants.endFetch(batch);

    if (page)
    {
        logger::debug("received %zu participants for %zu missing ssrcs",
            _loggableId.c_str(),
            page->participants.size(),
            batch.size());

        InternalState nextState = _internalState;
        auto& state = nextState.state;
        state.participants = mergeAndSortParticipants(state.participants, page->participants, state.sortAscending);
        state.totalCount =
            std::max({state.totalCount, page->totalCount, static_cast<int32_t>(state.participants.size())});
        commit(std::move(nextState));
    }
    else
    {
        logger::warn("fetch of %zu missing ssrcs failed", _loggableId.c_str(), batch.size());
    }

    if (_shouldResetStateFromServer)
    {
        resetStateFromServer();
    }
    else
    {
        loadMissingSsrcs();
    }
}

void CallParticipantsContext::loadMore(const std::string& token)
{
    runDeferredCompletions();

    const auto& nextOffset = _internalState.state.nextParticipantsFetchOffset;
    if (!nextOffset || token != *nextOffset)
    {
        logger::warn("loadMore called with invalid token '%s', expected '%s'",
            _loggableId.c_str(),
            token.c_str(),
            nextOffset ? nextOffset->c_str() : "");
        return;
    }
    if (_isLoadingMore)
    {
        return;
    }

    _isLoadingMore = true;

    FetchParticipantsRequest request;
    request.callId = _callId;
    request.offset = token;
    request.limit = _settings.fetchLimit;
    request.sortAscending = _internalState.state.sortAscending;

    auto cancellation = replaceRequest(_fetchRequest);
    _callService.fetchParticipants(request,
        postBack<std::optional<ParticipantsPage>>([this, cancellation](const std::optional<ParticipantsPage>& page) {
            if (!cancellation->isCancelled())
            {
                onPageFetched(page);
            }
        }));
}

void CallParticipantsContext::onPageFetched(const std::optional<ParticipantsPage>& page)
{
    _isLoadingMore = false;

    if (page)
    {
        InternalState nextState = _internalState;
        auto& state = nextState.state;
        state.participants = mergeAndSortParticipants(state.participants, page->participants, state.sortAscending);
        state.nextParticipantsFetchOffset = page->nextOffset;
        state.totalCount =
            std::max({state.totalCount, page->totalCount, static_cast<int32_t>(state.participants.size())});
        commit(std::move(nextState));
    }
    else
    {
        logger::warn("participants page fetch failed", _loggableId.c_str());
    }

    if (_shouldResetStateFromServer)
    {
        resetStateFromServer();
    }
    else
    {
        loadMissingSsrcs();
    }
}

void CallParticipantsContext::updateMuteState(PeerId peerId,
    const std::optional<MuteState>& muteState,
    const std::optional<int32_t>& volume,
    const std::optional<bool>& raiseHand)
{
    runDeferredCompletions();
    if (_mutations.isNoOp(_internalState, peerId, muteState, volume, raiseHand))
    {
        return;
    }

    InternalState nextState = _internalState;
    auto mutation = _mutations.begin(nextState, peerId, muteState, volume, raiseHand);
    commit(std::move(nextState));

    auto cancellation = mutation.cancellation;
    _callService.editParticipant(mutation.request,
        postBack<std::optional<std::vector<ParticipantsUpdate>>>(
            [this, peerId, cancellation](const std::optional<std::vector<ParticipantsUpdate>>& result) {
                onEditResponse(peerId, cancellation, result);
            }));
}

void CallParticipantsContext::onEditResponse(PeerId peerId,
    const utils::CancellationTokenPtr& cancellation,
    const std::optional<std::vector<ParticipantsUpdate>>& result)
{
    if (!_mutations.finish(peerId, cancellation))
    {
        return;
    }

    if (!result)
    {
        InternalState nextState = _internalState;
        if (_mutations.rollback(nextState, peerId, cancellation))
        {
            logger::info("edit of peer %" PRIu64 " failed, pending state dropped", _loggableId.c_str(), peerId);
            commit(std::move(nextState));
        }
        return;
    }

    auto updates = filterForThisCall(*result);
    bool settled = false;
    for (auto& update : updates)
    {
        if (update.type == ParticipantsUpdate::Type::State)
        {
            update.state.removePendingMuteStates.insert(peerId);
            settled = true;
        }
    }

    if (!settled)
    {
        InternalState nextState = _internalState;
        if (_mutations.rollback(nextState, peerId, cancellation))
        {
            commit(std::move(nextState));
        }
    }

    addUpdates(updates);
}

void CallParticipantsContext::raiseHand()
{
    updateMuteState(_myPeerId, std::nullopt, std::nullopt, true);
}

void CallParticipantsContext::lowerHand()
{
    updateMuteState(_myPeerId, std::nullopt, std::nullopt, false);
}

utils::CancellationTokenPtr CallParticipantsContext::replaceRequest(utils::CancellationTokenPtr& slot)
{
    if (slot)
    {
        slot->cancel();
    }
    slot = utils::CancellationToken::create();
    return slot;
}

void CallParticipantsContext::updateShouldBeRecording(bool shouldBeRecording,
    const std::optional<std::string>& title)
{
    ToggleRecordingRequest request;
    request.callId = _callId;
    request.shouldBeRecording = shouldBeRecording;
    if (title && !title->empty())
    {
        request.title = title;
    }

    auto cancellation = replaceRequest(_recordingRequest);
    _callService.toggleRecording(request,
        postBack<std::optional<std::vector<ParticipantsUpdate>>>(
            [this, cancellation](const std::optional<std::vector<ParticipantsUpdate>>& result) {
                onSettingsResponse("toggle recording", cancellation, result);
            }));
}

void CallParticipantsContext::updateDefaultParticipantsAreMuted(bool isMuted)
{
    if (_internalState.state.defaultParticipantsAreMuted.isMuted == isMuted)
    {
        return;
    }

    InternalState nextState = _internalState;
    nextState.state.defaultParticipantsAreMuted.isMuted = isMuted;
    commit(std::move(nextState));

    CallSettingsRequest request;
    request.callId = _callId;
    request.joinMuted = isMuted;

    auto cancellation = replaceRequest(_defaultMuteRequest);
    _callService.updateCallSettings(request,
        postBack<std::optional<std::vector<ParticipantsUpdate>>>(
            [this, cancellation](const std::optional<std::vector<ParticipantsUpdate>>& result) {
                onSettingsResponse("default mute", cancellation, result);
            }));
}

void CallParticipantsContext::resetInviteLinks()
{
    CallSettingsRequest request;
    request.callId = _callId;
    request.resetInviteHash = true;

    auto cancellation = replaceRequest(_inviteLinksRequest);
    _callService.updateCallSettings(request,
        postBack<std::optional<std::vector<ParticipantsUpdate>>>(
            [this, cancellation](const std::optional<std::vector<ParticipantsUpdate>>& result) {
                onSettingsResponse("reset invite links", cancellation, result);
            }));
}

void CallParticipantsContext::onSettingsResponse(const char* operation,
    const utils::CancellationTokenPtr& cancellation,
    const std::optional<std::vector<ParticipantsUpdate>>& result)
{
    if (cancellation->isCancelled())
    {
        return;
    }

    if (!result)
    {
        logger::info("%s request failed", _loggableId.c_str(), operation);
        return;
    }

    auto updates = filterForThisCall(*result);
    if (!updates.empty())
    {
        addUpdates(updates);
    }
}

void CallParticipantsContext::sweepActivityRanks()
{
    runDeferredCompletions();

    InternalState nextState = _internalState;
    auto& state = nextState.state;
    const size_t cleared = clearStaleActivityRanks(state.participants,
        utils::Time::nowSeconds(),
        static_cast<double>(_settings.rankTimeoutMs) / 1000.0);

    if (cleared > 0)
    {
        logger::debug("cleared %zu stale activity ranks", _loggableId.c_str(), cleared);
        sortParticipants(state.participants, state.sortAscending);
        commit(std::move(nextState));
    }
}

// Listeners may add or remove listeners from their callbacks. One removed during the round is not called.
template <typename Callback>
void CallParticipantsContext::notifyListeners(Callback&& callback)
{
    const auto listeners = _listeners;
    for (auto* listener : listeners)
    {
        if (std::find(_listeners.begin(), _listeners.end(), listener) != _listeners.end())
        {
            callback(listener);
        }
    }
}

void CallParticipantsContext::commit(InternalState&& internalState)
{
    if (internalState == _internalState)
    {
        return;
    }

    _internalState = std::move(internalState);
    auto effectiveState = makeEffectiveState(_internalState, _myPeerId);
    if (effectiveState == _effectiveState)
    {
        return;
    }

    _effectiveState = std::move(effectiveState);
    notifyListeners([this](CallParticipantsListener* listener) {
        listener->onParticipantsStateChanged(_effectiveState);
    });
}

void CallParticipantsContext::emitMemberEvents(const std::vector<MemberEvent>& events)
{
    for (const auto& event : events)
    {
        notifyListeners([&event](CallParticipantsListener* listener) { listener->onMemberEvent(event); });
    }
}

void CallParticipantsContext::setActiveSpeakers(std::unordered_set<PeerId>&& activeSpeakers)
{
    if (activeSpeakers == _activeSpeakers)
    {
        return;
    }

    _activeSpeakers = std::move(activeSpeakers);
    notifyListeners([this](CallParticipantsListener* listener) { listener->onActiveSpeakersChanged(_activeSpeakers); });
}

} // namespace roster
