#include <gtest/gtest.h>

#include "../core/Session.hpp"
#include "../core/State.hpp"
#include "TestHelpers.hpp"

using namespace siege::core;
using namespace siege::test;

TEST(Projection, ViewerSeesOnlyTheirOwnHand)
{
    Session s = MakeSession(3);
    StateOf(s, "p1").hand = Hand({Color::Green, Color::Black});

    SnapshotCSP const snap = s.SnapshotFor("p1");
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->viewer.member_id, "p1");
    EXPECT_EQ(snap->viewer.name, "Player 1");
    EXPECT_EQ(snap->viewer.hand, (std::vector<Color>{Color::Green, Color::Black}));

    ASSERT_EQ(snap->players.size(), 3u);
    EXPECT_EQ(snap->players[0].hand_count, 6u);
    EXPECT_EQ(snap->players[1].hand_count, 2u);
    EXPECT_EQ(snap->players[2].hand_count, 5u);
}

TEST(Projection, PublicStateMatchesSession)
{
    Session s = MakeSession();
    GiftSP const g = s.Display().front();
    GiveGift(s, "p0", g->id, constants::MaxLocks);
    StateOf(s, "p0").building = BuildingType::Crowbar;
    StateOf(s, "p1").lands_in_play = Untapped({Color::Red, Color::White});
    StateOf(s, "p1").lands_in_play[1].tapped = true;

    SnapshotCSP const snap = s.SnapshotFor("p1");
    EXPECT_EQ(snap->game_id, "game-test");
    EXPECT_EQ(snap->room_id, "room-test");
    EXPECT_EQ(snap->status, Status::Active);
    EXPECT_EQ(snap->turn.player_id, "p0");
    EXPECT_EQ(snap->turn.number, 1u);
    EXPECT_EQ(snap->deck_count, s.DeckCount());
    EXPECT_GT(snap->created_at_ms, 0);

    EXPECT_EQ(snap->gifts_display.size(), s.Display().size());
    for (GiftView const& v : snap->gifts_display)
    {
        EXPECT_FALSE(v.owner_id.has_value());
        EXPECT_EQ(v.locks, 0);
    }

    PlayerView const& p0 = snap->players[0];
    EXPECT_EQ(p0.building, BuildingType::Crowbar);
    EXPECT_EQ(p0.score, GiftValue(g->gift_class));
    ASSERT_EQ(p0.gifts.size(), 1u);
    EXPECT_EQ(p0.gifts[0].gift_id, g->id);
    EXPECT_EQ(p0.gifts[0].owner_id, MemberId{"p0"});
    EXPECT_TRUE(p0.gifts[0].sealed);

    PlayerView const& p1 = snap->players[1];
    ASSERT_EQ(p1.lands_in_play.size(), 2u);
    EXPECT_FALSE(p1.lands_in_play[0].tapped);
    EXPECT_TRUE(p1.lands_in_play[1].tapped);
    EXPECT_EQ(snap->viewer.lands_in_play.size(), 2u);
}

TEST(Projection, SnapshotIsDetachedFromLiveState)
{
    Session s = MakeSession();
    SnapshotCSP const snap = s.SnapshotFor("p0");
    std::size_t const hand = snap->viewer.hand.size();

    StateOf(s, "p0").hand.clear();
    StateOf(s, "p0").pending_discard = 1;

    EXPECT_EQ(snap->viewer.hand.size(), hand);
    EXPECT_EQ(snap->viewer.pending_discard, 0);
    EXPECT_EQ(s.SnapshotFor("p0")->viewer.pending_discard, 1);
}

TEST(Projection, NonMemberCannotBeProjected)
{
    Session s = MakeSession();
    EXPECT_THROW((void)s.SnapshotFor("nobody"), error::StateError);
}
