#include "simulator/SimulatedCallServer.h"
#include "jobmanager/JobManager.h"
#include "roster/CallParticipantsContext.h"
#include "test/roster/RosterTestUtils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <set>

using namespace simulator;
using testing::ElementsAre;

struct SimulatedCallServerTest : public ::testing::Test
{
    SimulatedCallServerTest()
    {
        settings.callId = 77;
        settings.myPeerId = 1;
        settings.participantCount = 20;
        settings.seed = 1234;
    }

    size_t runPendingJobs()
    {
        size_t count = 0;
        for (auto job = network.pop(); job; job = network.pop())
        {
            job->run();
            ++count;
        }
        return count;
    }

    std::set<roster::PeerId> readAllPeers(const SimulatedCallServer& server)
    {
        roster::FetchParticipantsRequest request;
        request.callId = settings.callId;
        request.limit = 10000;
        std::set<roster::PeerId> peers;
        for (const auto& participant : server.readPage(request).participants)
        {
            peers.insert(participant.peerId);
        }
        return peers;
    }

    SimulatedCallServer::Settings settings;
    jobmanager::JobManager network;
};

TEST_F(SimulatedCallServerTest, initialStateIsFirstPage)
{
    SimulatedCallServer server(settings, network);
    EXPECT_EQ(20u, server.getParticipantCount());

    const auto state = server.makeInitialState(5);
    EXPECT_EQ(5u, state.participants.size());
    EXPECT_EQ(std::optional<std::string>("5"), state.nextParticipantsFetchOffset);
    EXPECT_EQ(20, state.totalCount);
    EXPECT_EQ(server.getVersion(), state.version);
    EXPECT_TRUE(state.isCreator);
    EXPECT_EQ(1u, state.adminIds.count(settings.myPeerId));

    EXPECT_TRUE(server.getPeer(settings.myPeerId).has_value());
    EXPECT_FALSE(server.getPeer(999999).has_value());
}

TEST_F(SimulatedCallServerTest, pagesCoverRosterOnce)
{
    SimulatedCallServer server(settings, network);

    roster::FetchParticipantsRequest request;
    request.callId = settings.callId;
    request.limit = 6;

    std::set<roster::PeerId> seen;
    size_t pages = 0;
    for (;;)
    {
        const auto page = server.readPage(request);
        ++pages;
        for (const auto& participant : page.participants)
        {
            EXPECT_TRUE(seen.insert(participant.peerId).second);
        }
        if (!page.nextOffset)
        {
            break;
        }
        request.offset = *page.nextOffset;
    }

    EXPECT_EQ(4u, pages);
    EXPECT_EQ(20u, seen.size());
}

TEST_F(SimulatedCallServerTest, fetchBySsrcReturnsOnlyThosePeers)
{
    SimulatedCallServer server(settings, network);

    roster::FetchParticipantsRequest request;
    request.callId = settings.callId;
    request.ssrcs = {10, 10000, 12345};

    std::optional<roster::ParticipantsPage> result;
    server.fetchParticipants(request, [&result](const std::optional<roster::ParticipantsPage>& page) {
        result = page;
    });
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(1u, runPendingJobs());

    ASSERT_TRUE(result.has_value());
    std::set<roster::PeerId> peers;
    for (const auto& participant : result->participants)
    {
        peers.insert(participant.peerId);
    }
    EXPECT_THAT(peers, ElementsAre(1, 1000));
    EXPECT_FALSE(result->nextOffset.has_value());
}

TEST_F(SimulatedCallServerTest, fetchForOtherCallFails)
{
    SimulatedCallServer server(settings, network);

    roster::FetchParticipantsRequest request;
    request.callId = settings.callId + 1;
    bool called = false;
    server.fetchParticipants(request, [&called](const std::optional<roster::ParticipantsPage>& page) {
        called = true;
        EXPECT_FALSE(page.has_value());
    });
    runPendingJobs();
    EXPECT_TRUE(called);
}

TEST_F(SimulatedCallServerTest, withheldVersionsAreNeverPushed)
{
    settings.gapEveryNthUpdate = 3;
    SimulatedCallServer server(settings, network);

    for (int i = 0; i < 60; ++i)
    {
        for (const auto& update : server.tick())
        {
            if (update.type == roster::ParticipantsUpdate::Type::State)
            {
                EXPECT_NE(0, update.state.version % 3);
            }
        }
    }
    EXPECT_GT(server.getWithheldCount(), 0u);
}

TEST_F(SimulatedCallServerTest, everySecondEditFails)
{
    settings.mutationFailureEveryNth = 2;
    SimulatedCallServer server(settings, network);
    const int32_t version = server.getVersion();

    roster::EditParticipantRequest request;
    request.callId = settings.callId;
    request.peerId = 1000;
    request.changesMuteState = true;
    request.muted = true;

    std::vector<std::optional<std::vector<roster::ParticipantsUpdate>>> results;
    auto handler = [&results](const std::optional<std::vector<roster::ParticipantsUpdate>>& result) {
        results.push_back(result);
    };
    server.editParticipant(request, handler);
    server.editParticipant(request, handler);
    runPendingJobs();

    ASSERT_EQ(2u, results.size());
    ASSERT_TRUE(results[0].has_value());
    ASSERT_EQ(1u, results[0]->size());
    const auto& stateUpdate = results[0]->front().state;
    EXPECT_EQ(version + 1, stateUpdate.version);
    ASSERT_EQ(1u, stateUpdate.participantUpdates.size());
    EXPECT_EQ(std::optional<roster::MuteState>(roster::MuteState(false, false)),
        stateUpdate.participantUpdates[0].muteState);
    EXPECT_FALSE(results[1].has_value());
}

TEST_F(SimulatedCallServerTest, raisingHandKeepsMuteState)
{
    SimulatedCallServer server(settings, network);

    std::vector<std::optional<std::vector<roster::ParticipantsUpdate>>> results;
    auto handler = [&results](const std::optional<std::vector<roster::ParticipantsUpdate>>& result) {
        results.push_back(result);
    };

    roster::EditParticipantRequest mute;
    mute.callId = settings.callId;
    mute.peerId = 1000;
    mute.changesMuteState = true;
    mute.muted = true;
    server.editParticipant(mute, handler);

    roster::EditParticipantRequest raiseHand;
    raiseHand.callId = settings.callId;
    raiseHand.peerId = 1000;
    raiseHand.raiseHand = true;
    server.editParticipant(raiseHand, handler);

    roster::EditParticipantRequest volume;
    volume.callId = settings.callId;
    volume.peerId = 1000;
    volume.volume = 5000;
    server.editParticipant(volume, handler);
    runPendingJobs();

    ASSERT_EQ(3u, results.size());
    for (const auto& result : results)
    {
        ASSERT_TRUE(result.has_value());
        ASSERT_EQ(1u, result->size());
        ASSERT_EQ(1u, result->front().state.participantUpdates.size());
        EXPECT_EQ(std::optional<roster::MuteState>(roster::MuteState(false, false)),
            result->front().state.participantUpdates[0].muteState);
    }
    EXPECT_TRUE(results[1]->front().state.participantUpdates[0].raiseHandRating.has_value());
    EXPECT_EQ(std::optional<int32_t>(5000), results[2]->front().state.participantUpdates[0].volume);
}

TEST_F(SimulatedCallServerTest, recordingToggleAnswersWithCallUpdate)
{
    SimulatedCallServer server(settings, network);

    roster::ToggleRecordingRequest request;
    request.callId = settings.callId;
    request.shouldBeRecording = true;
    request.title = std::string("town hall");

    std::optional<std::vector<roster::ParticipantsUpdate>> response;
    server.toggleRecording(request, [&response](const std::optional<std::vector<roster::ParticipantsUpdate>>& result) {
        response = result;
    });
    runPendingJobs();

    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(1u, response->size());
    const auto& update = response->front();
    EXPECT_EQ(roster::ParticipantsUpdate::Type::Call, update.type);
    EXPECT_EQ(std::optional<std::string>("town hall"), update.call.title);
    EXPECT_TRUE(update.call.recordingStartTimestamp.has_value());
}

TEST_F(SimulatedCallServerTest, rosterConvergesDespiteGaps)
{
    settings.gapEveryNthUpdate = 7;
    SimulatedCallServer server(settings, network);

    roster::RosterSettings rosterSettings;
    rosterSettings.fetchLimit = 1000;
    auto context = std::make_unique<roster::CallParticipantsContext>(settings.callId,
        settings.myPeerId,
        server.makeInitialState(rosterSettings.fetchLimit),
        std::nullopt,
        server,
        server,
        network,
        rosterSettings);

    for (int i = 0; i < 200; ++i)
    {
        context->onPushedUpdates(server.tick());
        runPendingJobs();
    }

    // a pushed state update after a withheld one triggers the final resync
    for (int i = 0; i < 100 && context->getState().version != server.getVersion(); ++i)
    {
        context->onPushedUpdates(server.tick());
        runPendingJobs();
    }

    EXPECT_EQ(server.getVersion(), context->getState().version);
    EXPECT_EQ(roster::UpdateProcessor::Phase::Idle, context->getUpdatePhase());
    EXPECT_EQ(static_cast<int32_t>(server.getParticipantCount()), context->getState().totalCount);

    const auto peers = test::peerIds(context->getState().participants);
    EXPECT_EQ(readAllPeers(server), std::set<roster::PeerId>(peers.begin(), peers.end()));

    context.reset();
    runPendingJobs();
}
