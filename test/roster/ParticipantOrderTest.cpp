#include "roster/ParticipantOrder.h"
#include "test/roster/RosterTestUtils.h"
#include "utils/MersienneRandom.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace roster;
using testing::ElementsAre;

namespace
{
int sign(int value)
{
    return (value > 0) - (value < 0);
}

std::vector<Participant> makeRandomParticipants(size_t count, uint64_t seed)
{
    utils::MersienneRandom<uint32_t> random(seed);
    std::vector<Participant> participants;
    for (size_t i = 0; i < count; ++i)
    {
        auto participant = test::makeParticipant(i + 1, static_cast<int32_t>(random.next(4)));
        if (random.oneIn(3))
        {
            participant.activityRank = static_cast<int32_t>(random.next(3));
        }
        if (random.oneIn(3))
        {
            participant.activityTimestamp = 100.0 + random.next(3);
        }
        if (random.oneIn(3))
        {
            participant.raiseHandRating = random.next(3);
        }
        participants.push_back(participant);
    }
    return participants;
}
} // namespace

TEST(ParticipantOrderTest, rankBeforeTimestampBeforeHandBeforeJoin)
{
    auto ranked = test::makeParticipant(1, 100);
    ranked.activityRank = 5;
    auto talking = test::makeParticipant(2, 100);
    talking.activityTimestamp = 1000.0;
    auto handRaised = test::makeParticipant(3, 100);
    handRaised.raiseHandRating = 7;
    auto plain = test::makeParticipant(4, 300);

    std::vector<Participant> participants = {plain, handRaised, talking, ranked};
    sortParticipants(participants, false);
    EXPECT_THAT(test::peerIds(participants), ElementsAre(1, 2, 3, 4));
}

TEST(ParticipantOrderTest, smallerRankAndNewerActivityFirst)
{
    auto a = test::makeParticipant(1, 100);
    a.activityRank = 3;
    auto b = test::makeParticipant(2, 100);
    b.activityRank = 1;
    auto c = test::makeParticipant(3, 100);
    c.activityTimestamp = 10.0;
    auto d = test::makeParticipant(4, 100);
    d.activityTimestamp = 20.0;
    auto e = test::makeParticipant(5, 100);
    e.raiseHandRating = 1;
    auto f = test::makeParticipant(6, 100);
    f.raiseHandRating = 2;

    std::vector<Participant> participants = {a, b, c, d, e, f};
    sortParticipants(participants, false);
    EXPECT_THAT(test::peerIds(participants), ElementsAre(2, 1, 4, 3, 6, 5));
}

TEST(ParticipantOrderTest, joinTimestampFollowsSortDirection)
{
    std::vector<Participant> participants = {test::makeParticipant(1, 100),
        test::makeParticipant(2, 300),
        test::makeParticipant(3, 200)};

    sortParticipants(participants, false);
    EXPECT_THAT(test::peerIds(participants), ElementsAre(2, 3, 1));

    sortParticipants(participants, true);
    EXPECT_THAT(test::peerIds(participants), ElementsAre(1, 3, 2));
}

TEST(ParticipantOrderTest, peerIdBreaksTies)
{
    std::vector<Participant> participants = {test::makeParticipant(9, 100),
        test::makeParticipant(3, 100),
        test::makeParticipant(5, 100)};
    sortParticipants(participants, true);
    EXPECT_THAT(test::peerIds(participants), ElementsAre(3, 5, 9));

    EXPECT_EQ(0, compareParticipants(participants[0], participants[0], true));
    EXPECT_NE(0, compareParticipants(participants[0], participants[1], true));
}

TEST(ParticipantOrderTest, isStrictTotalOrder)
{
    const auto participants = makeRandomParticipants(40, 17);
    for (bool ascending : {false, true})
    {
        for (const auto& a : participants)
        {
            for (const auto& b : participants)
            {
                const int ab = sign(compareParticipants(a, b, ascending));
                const int ba = sign(compareParticipants(b, a, ascending));
                EXPECT_EQ(ab, -ba);
                EXPECT_EQ(ab == 0, a.peerId == b.peerId);

                for (const auto& c : participants)
                {
                    if (ab < 0 && compareParticipants(b, c, ascending) < 0)
                    {
                        EXPECT_LT(compareParticipants(a, c, ascending), 0);
                    }
                }
            }
        }
    }
}

TEST(ParticipantOrderTest, mergeKeepsExistingEntries)
{
    auto existing = test::makeParticipant(1, 100);
    existing.activityRank = 0;
    std::vector<Participant> current = {existing, test::makeParticipant(2, 200)};

    auto incomingCopy = test::makeParticipant(1, 100);
    incomingCopy.about = std::string("stale");
    std::vector<Participant> incoming = {incomingCopy, test::makeParticipant(3, 150)};

    const auto merged = mergeAndSortParticipants(current, incoming, false);
    EXPECT_THAT(test::peerIds(merged), ElementsAre(1, 2, 3));
    EXPECT_EQ(merged[0].activityRank, std::optional<int32_t>(0));
    EXPECT_FALSE(merged[0].about.has_value());
}
