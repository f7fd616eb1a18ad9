#include "simulator/SimulatedCallServer.h"
#include "concurrency/SynchronizationContext.h"
#include "logger/Logger.h"
#include "utils/Time.h"
#include <algorithm>
#include <cinttypes>
#include <cstdlib>
#include <string>

namespace simulator
{

namespace
{
const roster::PeerId firstSimulatedPeerId = 1000;
const uint32_t ssrcMultiplier = 10;
} // namespace

SimulatedCallServer::SimulatedCallServer(const Settings& settings, concurrency::SynchronizationContext& network)
    : _settings(settings),
      _network(network),
      _version(1),
      _nextPeerId(firstSimulatedPeerId),
      _nextJoinTimestamp(static_cast<int32_t>(utils::Time::nowSeconds() - settings.participantCount)),
      _raiseHandCounter(0),
      _editCount(0),
      _withheldCount(0),
      _random(settings.seed)
{
    std::lock_guard<std::mutex> locker(_lock);
    roster::Participant me;
    me.peerId = _settings.myPeerId;
    me.ssrc = static_cast<uint32_t>(_settings.myPeerId * ssrcMultiplier);
    me.joinTimestamp = _nextJoinTimestamp++;
    _participants.emplace(me.peerId, me);
    _peers.emplace(me.peerId, roster::PeerRecord{me.peerId, "me"});

    while (_participants.size() < _settings.participantCount)
    {
        addParticipant();
    }
}

// must hold lock
roster::PeerId SimulatedCallServer::addParticipant()
{
    roster::Participant participant;
    participant.peerId = _nextPeerId++;
    participant.ssrc = static_cast<uint32_t>(participant.peerId * ssrcMultiplier);
    participant.joinTimestamp = _nextJoinTimestamp++;
    if (_random.oneIn(3))
    {
        participant.muteState = roster::MuteState(true, false);
    }

    _peers.emplace(participant.peerId,
        roster::PeerRecord{participant.peerId, "peer-" + std::to_string(participant.peerId)});
    _participants.emplace(participant.peerId, participant);
    return participant.peerId;
}

// must hold lock
std::vector<roster::Participant> SimulatedCallServer::sortedParticipants() const
{
    std::vector<roster::Participant> sorted;
    sorted.reserve(_participants.size());
    for (const auto& entry : _participants)
    {
        sorted.push_back(entry.second);
    }

    const bool ascending = _settings.sortAscending;
    std::stable_sort(sorted.begin(),
        sorted.end(),
        [ascending](const roster::Participant& a, const roster::Participant& b) {
            if (a.joinTimestamp != b.joinTimestamp)
            {
                return ascending ? a.joinTimestamp < b.joinTimestamp : a.joinTimestamp > b.joinTimestamp;
            }
            return a.peerId < b.peerId;
        });
    return sorted;
}

roster::ParticipantsPage SimulatedCallServer::readPage(const roster::FetchParticipantsRequest& request) const
{
    std::lock_guard<std::mutex> locker(_lock);
    roster::ParticipantsPage page;
    page.totalCount = static_cast<int32_t>(_participants.size());
    page.version = _version;
    page.sortAscending = request.sortAscending.value_or(_settings.sortAscending);

    const auto sorted = sortedParticipants();
    const size_t limit = request.limit > 0 ? static_cast<size_t>(request.limit) : 0;
    if (!request.ssrcs.empty())
    {
        for (const auto& participant : sorted)
        {
            if (page.participants.size() >= limit)
            {
                break;
            }
            if (participant.ssrc &&
                std::find(request.ssrcs.begin(), request.ssrcs.end(), *participant.ssrc) != request.ssrcs.end())
            {
                page.participants.push_back(participant);
            }
        }
        return page;
    }

    size_t offset = 0;
    if (!request.offset.empty())
    {
        offset = std::strtoul(request.offset.c_str(), nullptr, 10);
    }

    for (size_t i = offset; i < sorted.size() && page.participants.size() < limit; ++i)
    {
        page.participants.push_back(sorted[i]);
    }

    const size_t end = offset + page.participants.size();
    if (!page.participants.empty() && end < sorted.size())
    {
        page.nextOffset = std::to_string(end);
    }
    return page;
}

roster::ParticipantsState SimulatedCallServer::makeInitialState(int32_t limit) const
{
    roster::FetchParticipantsRequest request;
    request.callId = _settings.callId;
    request.limit = limit;
    auto page = readPage(request);

    std::lock_guard<std::mutex> locker(_lock);
    roster::ParticipantsState state;
    state.participants = std::move(page.participants);
    state.nextParticipantsFetchOffset = page.nextOffset;
    state.isCreator = true;
    state.adminIds.insert(_settings.myPeerId);
    state.defaultParticipantsAreMuted = _callSettings.defaultParticipantsAreMuted;
    state.sortAscending = page.sortAscending;
    state.recordingStartTimestamp = _callSettings.recordingStartTimestamp;
    state.title = _callSettings.title;
    state.totalCount = page.totalCount;
    state.version = page.version;
    return state;
}

roster::ParticipantUpdate SimulatedCallServer::toUpdate(const roster::Participant& participant,
    roster::ParticipationStatusChange statusChange,
    bool isMin) const
{
    roster::ParticipantUpdate update;
    update.peerId = participant.peerId;
    update.ssrc = participant.ssrc;
    update.jsonParams = participant.jsonParams;
    update.joinTimestamp = participant.joinTimestamp;
    update.activityTimestamp = participant.activityTimestamp;
    update.raiseHandRating = participant.raiseHandRating;
    update.muteState = participant.muteState;
    update.participationStatusChange = statusChange;
    update.volume = isMin ? std::nullopt : participant.volume;
    update.about = participant.about;
    update.isMin = isMin;
    return update;
}

// must hold lock
roster::ParticipantsUpdate SimulatedCallServer::publish(std::vector<roster::ParticipantUpdate>&& participantUpdates)
{
    roster::StateUpdate stateUpdate;
    stateUpdate.participantUpdates = std::move(participantUpdates);
    stateUpdate.version = ++_version;
    return roster::ParticipantsUpdate::makeStateUpdate(_settings.callId, std::move(stateUpdate));
}

// must hold lock
roster::ParticipantsUpdate SimulatedCallServer::makeCallUpdate() const
{
    roster::CallUpdate callUpdate;
    callUpdate.defaultParticipantsAreMuted = _callSettings.defaultParticipantsAreMuted;
    callUpdate.title = _callSettings.title;
    callUpdate.recordingStartTimestamp = _callSettings.recordingStartTimestamp;
    return roster::ParticipantsUpdate::makeCallUpdate(_settings.callId, callUpdate);
}

std::vector<roster::ParticipantsUpdate> SimulatedCallServer::tick()
{
    std::lock_guard<std::mutex> locker(_lock);
    std::vector<roster::ParticipantUpdate> participantUpdates;

    const uint32_t action = _random.next(10);
    if (action == 0)
    {
        _callSettings.title = "simulated call " + std::to_string(_version);
        return {makeCallUpdate()};
    }

    if (action < 4 || _participants.size() <= 1)
    {
        const auto peerId = addParticipant();
        participantUpdates.push_back(toUpdate(_participants[peerId], roster::ParticipationStatusChange::Joined, false));
    }
    else
    {
        auto it = _participants.begin();
        std::advance(it, _random.next(static_cast<uint32_t>(_participants.size())));
        if (it->first == _settings.myPeerId)
        {
            ++it;
            if (it == _participants.end())
            {
                it = _participants.begin();
            }
        }

        if (action < 7)
        {
            participantUpdates.push_back(toUpdate(it->second, roster::ParticipationStatusChange::Left, true));
            _participants.erase(it);
        }
        else
        {
            auto& participant = it->second;
            if (participant.muteState)
            {
                participant.muteState.reset();
            }
            else
            {
                participant.muteState = roster::MuteState(true, false);
            }
            participantUpdates.push_back(toUpdate(participant, roster::ParticipationStatusChange::None, true));
        }
    }

    auto update = publish(std::move(participantUpdates));
    if (_settings.gapEveryNthUpdate != 0 && update.state.version % _settings.gapEveryNthUpdate == 0)
    {
        ++_withheldCount;
        logger::debug("withholding version %d", "SimulatedCallServer", update.state.version);
        return {};
    }
    return {update};
}

std::unordered_map<roster::PeerId, uint32_t> SimulatedCallServer::pickSpeakers(size_t count)
{
    std::lock_guard<std::mutex> locker(_lock);
    std::unordered_map<roster::PeerId, uint32_t> speakers;
    if (_participants.empty())
    {
        return speakers;
    }

    for (size_t i = 0; i < count; ++i)
    {
        auto it = _participants.begin();
        std::advance(it, _random.next(static_cast<uint32_t>(_participants.size())));
        if (it->second.ssrc)
        {
            speakers.emplace(it->first, *it->second.ssrc);
        }
    }
    return speakers;
}

std::optional<roster::PeerId> SimulatedCallServer::pickParticipant()
{
    std::lock_guard<std::mutex> locker(_lock);
    if (_participants.empty())
    {
        return std::nullopt;
    }

    auto it = _participants.begin();
    std::advance(it, _random.next(static_cast<uint32_t>(_participants.size())));
    return it->first;
}

bool SimulatedCallServer::post(std::function<void()>&& task)
{
    if (!_network.post(std::move(task)))
    {
        logger::warn("network context rejected response", "SimulatedCallServer");
        return false;
    }
    return true;
}

void SimulatedCallServer::fetchParticipants(const roster::FetchParticipantsRequest& request,
    roster::FetchParticipantsHandler&& handler)
{
    if (request.callId != _settings.callId)
    {
        post([handler]() { handler(std::nullopt); });
        return;
    }

    auto page = readPage(request);
    post([handler, page]() { handler(page); });
}

void SimulatedCallServer::editParticipant(const roster::EditParticipantRequest& request,
    roster::UpdatesHandler&& handler)
{
    std::lock_guard<std::mutex> locker(_lock);
    ++_editCount;
    auto it = _participants.find(request.peerId);
    if (request.callId != _settings.callId || it == _participants.end() ||
        (_settings.mutationFailureEveryNth != 0 && _editCount % _settings.mutationFailureEveryNth == 0))
    {
        logger::debug("edit of peer %" PRIu64 " rejected", "SimulatedCallServer", request.peerId);
        post([handler]() { handler(std::nullopt); });
        return;
    }

    auto& participant = it->second;
    if (request.changesMuteState && request.muted)
    {
        participant.muteState = roster::MuteState(request.peerId == _settings.myPeerId, false);
    }
    else if (request.changesMuteState)
    {
        participant.muteState.reset();
    }
    if (request.volume)
    {
        participant.volume = request.volume;
    }
    if (request.raiseHand)
    {
        if (*request.raiseHand)
        {
            participant.raiseHandRating = ++_raiseHandCounter;
        }
        else
        {
            participant.raiseHandRating.reset();
        }
    }

    std::vector<roster::ParticipantUpdate> participantUpdates;
    participantUpdates.push_back(toUpdate(participant, roster::ParticipationStatusChange::None, false));
    std::vector<roster::ParticipantsUpdate> updates{publish(std::move(participantUpdates))};
    post([handler, updates]() { handler(updates); });
}

void SimulatedCallServer::toggleRecording(const roster::ToggleRecordingRequest& request,
    roster::UpdatesHandler&& handler)
{
    std::lock_guard<std::mutex> locker(_lock);
    if (request.shouldBeRecording)
    {
        _callSettings.recordingStartTimestamp = static_cast<int32_t>(utils::Time::nowSeconds());
        if (request.title)
        {
            _callSettings.title = request.title;
        }
    }
    else
    {
        _callSettings.recordingStartTimestamp.reset();
    }

    std::vector<roster::ParticipantsUpdate> updates{makeCallUpdate()};
    post([handler, updates]() { handler(updates); });
}

void SimulatedCallServer::updateCallSettings(const roster::CallSettingsRequest& request,
    roster::UpdatesHandler&& handler)
{
    std::lock_guard<std::mutex> locker(_lock);
    if (request.joinMuted)
    {
        _callSettings.defaultParticipantsAreMuted.isMuted = *request.joinMuted;
    }
    if (request.resetInviteHash)
    {
        logger::info("invite links reset for call %" PRId64, "SimulatedCallServer", request.callId);
    }

    std::vector<roster::ParticipantsUpdate> updates{makeCallUpdate()};
    post([handler, updates]() { handler(updates); });
}

std::optional<roster::PeerRecord> SimulatedCallServer::getPeer(roster::PeerId peerId) const
{
    std::lock_guard<std::mutex> locker(_lock);
    auto it = _peers.find(peerId);
    if (it == _peers.end())
    {
        return std::nullopt;
    }
    return it->second;
}

int32_t SimulatedCallServer::getVersion() const
{
    std::lock_guard<std::mutex> locker(_lock);
    return _version;
}

size_t SimulatedCallServer::getParticipantCount() const
{
    std::lock_guard<std::mutex> locker(_lock);
    return _participants.size();
}

uint32_t SimulatedCallServer::getWithheldCount() const
{
    std::lock_guard<std::mutex> locker(_lock);
    return _withheldCount;
}

} // namespace simulator
