#include "roster/UpdateProcessor.h"
#include "mocks/PeerDirectoryStub.h"
#include "roster/ParticipantOrder.h"
#include "test/roster/RosterTestUtils.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace roster;
using testing::ElementsAre;

struct UpdateProcessorTest : public ::testing::Test
{
    UpdateProcessorTest() : processor(peers, "UpdateProcessorTest")
    {
        for (PeerId peerId = 1; peerId < 20; ++peerId)
        {
            peers.knownPeers.insert(peerId);
        }
        internalState.state = test::makeState({test::makeParticipant(1, 100), test::makeParticipant(2, 200)}, 10);
        sortParticipants(internalState.state.participants, internalState.state.sortAscending);
    }

    void addPending(PeerId peerId)
    {
        PendingMuteStateChange pending;
        pending.state = MuteState(false, true);
        pending.cancellation = utils::CancellationToken::create();
        internalState.overlayState.pendingMuteStateChanges[peerId] = pending;
    }

    test::PeerDirectoryStub peers;
    UpdateProcessor processor;
    InternalState internalState;
    std::vector<MemberEvent> events;
};

TEST_F(UpdateProcessorTest, joinIsSortedByJoinTimeAndCounted)
{
    auto update = test::makeStateUpdate(11, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Joined)});

    EXPECT_EQ(UpdateProcessor::Outcome::Applied, processor.apply(internalState, update, events));
    EXPECT_THAT(test::peerIds(internalState.state.participants), ElementsAre(2, 3, 1));
    EXPECT_EQ(3, internalState.state.totalCount);
    EXPECT_EQ(11, internalState.state.version);
    EXPECT_THAT(events, ElementsAre(MemberEvent(3, true)));
}

TEST_F(UpdateProcessorTest, sameDeltaTwiceIsStale)
{
    auto update = test::makeStateUpdate(11, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Joined)});
    ASSERT_EQ(UpdateProcessor::Outcome::Applied, processor.apply(internalState, update, events));

    auto nextUpdate =
        test::makeStateUpdate(12, {test::makeParticipantUpdate(4, 160, ParticipationStatusChange::Joined)});
    ASSERT_EQ(UpdateProcessor::Outcome::Applied, processor.apply(internalState, nextUpdate, events));

    const auto before = internalState;
    EXPECT_EQ(UpdateProcessor::Outcome::Stale, processor.apply(internalState, update, events));
    EXPECT_EQ(before, internalState);
}

TEST_F(UpdateProcessorTest, repeatedCurrentVersionDoesNotCountTwice)
{
    auto update = test::makeStateUpdate(10, {test::makeParticipantUpdate(2, 200, ParticipationStatusChange::Joined)});
    EXPECT_EQ(UpdateProcessor::Outcome::Applied, processor.apply(internalState, update, events));
    EXPECT_EQ(2, internalState.state.totalCount);
    EXPECT_EQ(10, internalState.state.version);
    EXPECT_TRUE(events.empty());
}

TEST_F(UpdateProcessorTest, gapLeavesStateUntouched)
{
    addPending(1);
    auto update = test::makeStateUpdate(12, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Joined)});
    update.removePendingMuteStates.insert(1);

    const auto stateBefore = internalState.state;
    EXPECT_EQ(UpdateProcessor::Outcome::Gap, processor.apply(internalState, update, events));
    EXPECT_EQ(stateBefore, internalState.state);
    EXPECT_TRUE(internalState.overlayState.isEmpty());
    EXPECT_TRUE(events.empty());
}

TEST_F(UpdateProcessorTest, staleDeltaStillSettlesPendingMuteStates)
{
    addPending(2);
    auto update = test::makeStateUpdate(9, {});
    update.removePendingMuteStates.insert(2);

    EXPECT_EQ(UpdateProcessor::Outcome::Stale, processor.apply(internalState, update, events));
    EXPECT_TRUE(internalState.overlayState.isEmpty());
    EXPECT_EQ(10, internalState.state.version);
}

TEST_F(UpdateProcessorTest, leaveRemovesAndNeverGoesBelowZero)
{
    internalState.state.totalCount = 2;
    auto update = test::makeStateUpdate(11,
        {test::makeParticipantUpdate(1, 100, ParticipationStatusChange::Left),
            test::makeParticipantUpdate(2, 200, ParticipationStatusChange::Left),
            test::makeParticipantUpdate(7, 200, ParticipationStatusChange::Left)});

    EXPECT_EQ(UpdateProcessor::Outcome::Applied, processor.apply(internalState, update, events));
    EXPECT_TRUE(internalState.state.participants.empty());
    EXPECT_EQ(0, internalState.state.totalCount);
    EXPECT_THAT(events, ElementsAre(MemberEvent(1, false), MemberEvent(2, false)));
}

TEST_F(UpdateProcessorTest, leaveOfUnloadedPeerCountsOnlyOnVersionChange)
{
    internalState.state.totalCount = 50;
    auto sameVersion = test::makeStateUpdate(10, {test::makeParticipantUpdate(7, 0, ParticipationStatusChange::Left)});
    processor.apply(internalState, sameVersion, events);
    EXPECT_EQ(50, internalState.state.totalCount);

    auto nextVersion = test::makeStateUpdate(11, {test::makeParticipantUpdate(7, 0, ParticipationStatusChange::Left)});
    processor.apply(internalState, nextVersion, events);
    EXPECT_EQ(49, internalState.state.totalCount);
    EXPECT_TRUE(events.empty());
}

TEST_F(UpdateProcessorTest, mergeKeepsJoinTimeRankAndNewestActivity)
{
    auto& existing = internalState.state.participants[1];
    ASSERT_EQ(1u, existing.peerId);
    existing.activityRank = 4;
    existing.activityTimestamp = 500.0;

    auto participantUpdate = test::makeParticipantUpdate(1, 999, ParticipationStatusChange::None);
    participantUpdate.activityTimestamp = 400.0;
    participantUpdate.about = std::string("hello");
    processor.apply(internalState, test::makeStateUpdate(11, {participantUpdate}), events);

    const auto* merged = internalState.state.findParticipant(1);
    ASSERT_NE(nullptr, merged);
    EXPECT_EQ(100, merged->joinTimestamp);
    EXPECT_EQ(std::optional<int32_t>(4), merged->activityRank);
    EXPECT_EQ(std::optional<double>(500.0), merged->activityTimestamp);
    EXPECT_EQ(std::optional<std::string>("hello"), merged->about);
    EXPECT_THAT(test::peerIds(internalState.state.participants), ElementsAre(1, 2));
}

TEST_F(UpdateProcessorTest, minUpdateKeepsViewerSpecificFields)
{
    auto& existing = internalState.state.participants[0];
    existing.muteState = MuteState(false, true);
    existing.volume = 5000;
    const PeerId peerId = existing.peerId;

    auto participantUpdate = test::makeParticipantUpdate(peerId, 200, ParticipationStatusChange::None);
    participantUpdate.muteState = MuteState(true, false);
    participantUpdate.isMin = true;
    processor.apply(internalState, test::makeStateUpdate(11, {participantUpdate}), events);

    const auto* merged = internalState.state.findParticipant(peerId);
    ASSERT_NE(nullptr, merged);
    EXPECT_EQ(std::optional<MuteState>(MuteState(false, true)), merged->muteState);
    EXPECT_EQ(std::optional<int32_t>(5000), merged->volume);
}

TEST_F(UpdateProcessorTest, fullUpdateReplacesMuteState)
{
    auto& existing = internalState.state.participants[0];
    existing.muteState = MuteState(false, true);
    existing.volume = 5000;
    const PeerId peerId = existing.peerId;

    auto participantUpdate = test::makeParticipantUpdate(peerId, 200, ParticipationStatusChange::None);
    processor.apply(internalState, test::makeStateUpdate(11, {participantUpdate}), events);

    const auto* merged = internalState.state.findParticipant(peerId);
    ASSERT_NE(nullptr, merged);
    EXPECT_FALSE(merged->muteState.has_value());
    EXPECT_FALSE(merged->volume.has_value());
}

TEST_F(UpdateProcessorTest, totalCountCoversLoadedParticipants)
{
    internalState.state.totalCount = 0;
    auto update = test::makeStateUpdate(11, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::None)});
    processor.apply(internalState, update, events);
    EXPECT_EQ(3, internalState.state.totalCount);
}

TEST_F(UpdateProcessorTest, confirmedDeltaClearsNamedOverlay)
{
    addPending(1);
    addPending(2);
    auto participantUpdate = test::makeParticipantUpdate(1, 100, ParticipationStatusChange::None);
    auto update = test::makeStateUpdate(11, {participantUpdate});
    update.removePendingMuteStates.insert(1);

    processor.apply(internalState, update, events);
    EXPECT_EQ(0u, internalState.overlayState.pendingMuteStateChanges.count(1));
    EXPECT_EQ(1u, internalState.overlayState.pendingMuteStateChanges.count(2));
}

TEST_F(UpdateProcessorTest, unknownPeerIsSkipped)
{
    auto update = test::makeStateUpdate(11, {test::makeParticipantUpdate(99, 150, ParticipationStatusChange::Joined)});
    EXPECT_DEBUG_DEATH(processor.apply(internalState, update, events), "");
#ifdef NDEBUG
    EXPECT_EQ(nullptr, internalState.state.findParticipant(99));
    EXPECT_EQ(11, internalState.state.version);
    EXPECT_TRUE(events.empty());
#endif
}

TEST_F(UpdateProcessorTest, drainStopsAtGapAndDropsQueue)
{
    std::vector<StateUpdate> updates;
    updates.push_back(
        test::makeStateUpdate(11, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Joined)}));
    updates.push_back(
        test::makeStateUpdate(13, {test::makeParticipantUpdate(4, 160, ParticipationStatusChange::Joined)}));
    updates.push_back(
        test::makeStateUpdate(14, {test::makeParticipantUpdate(5, 170, ParticipationStatusChange::Joined)}));
    processor.enqueue(std::move(updates));

    EXPECT_TRUE(processor.drain(internalState, events));
    EXPECT_EQ(11, internalState.state.version);
    EXPECT_EQ(UpdateProcessor::Phase::ResyncingFromServer, processor.getPhase());
    EXPECT_EQ(0u, processor.getQueueSize());

    std::vector<StateUpdate> later;
    later.push_back(test::makeStateUpdate(12, {}));
    processor.enqueue(std::move(later));
    EXPECT_FALSE(processor.drain(internalState, events));
    EXPECT_EQ(11, internalState.state.version);
    EXPECT_EQ(1u, processor.getQueueSize());

    processor.endResync();
    EXPECT_FALSE(processor.drain(internalState, events));
    EXPECT_EQ(12, internalState.state.version);
    EXPECT_EQ(UpdateProcessor::Phase::Idle, processor.getPhase());
}

TEST_F(UpdateProcessorTest, drainAppliesInQueueOrder)
{
    std::vector<StateUpdate> updates;
    updates.push_back(
        test::makeStateUpdate(11, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Joined)}));
    updates.push_back(
        test::makeStateUpdate(12, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Left)}));
    updates.push_back(
        test::makeStateUpdate(11, {test::makeParticipantUpdate(3, 150, ParticipationStatusChange::Joined)}));
    processor.enqueue(std::move(updates));

    EXPECT_FALSE(processor.drain(internalState, events));
    EXPECT_EQ(12, internalState.state.version);
    EXPECT_EQ(nullptr, internalState.state.findParticipant(3));
    EXPECT_THAT(events, ElementsAre(MemberEvent(3, true), MemberEvent(3, false)));
}
