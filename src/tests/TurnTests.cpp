#include <gtest/gtest.h>
#include <vector>

#include "../core/Session.hpp"
#include "../core/Turn.hpp"
#include "../core/Dispatcher.hpp"
#include "../core/GiftRules.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "TestHelpers.hpp"

using namespace siege::core;
using namespace siege::test;

namespace
{
    auto Dispatcher() -> ActionDispatcher
    {
        return ActionDispatcher{std::make_unique<GiftRules>()};
    }
}

TEST(Turn, SetupDealsAndStartsTurnOne)
{
    Session s = MakeSession(3);
    EXPECT_EQ(s.StatusNow(), Status::Active);
    EXPECT_EQ(s.Turn().player_id, "p0");
    EXPECT_EQ(s.Turn().number, 1u);
    EXPECT_FALSE(s.Turn().has_played_land);
    EXPECT_FALSE(s.Turn().has_taken_action);

    EXPECT_EQ(s.Players()[0].hand.size(), 6u);
    EXPECT_EQ(s.Players()[1].hand.size(), 5u);
    EXPECT_EQ(s.Players()[2].hand.size(), 5u);
    EXPECT_EQ(s.DeckCount(), 60u - 16u);
    EXPECT_EQ(s.Display().size(), 8u);
    EXPECT_NO_THROW(debug::CheckInvariants(s));
}

TEST(Turn, SetupRejectsDeckTooSmallForInitialHands)
{
    Config cfg{};
    cfg.deck_size_per_color = 1; // 5 cards total
    EXPECT_THROW((void)MakeSession(2, 1, cfg), error::StateError);
}

TEST(Turn, OnlyTheTurnOwnerMayAct)
{
    Session s = MakeSession();
    auto const ok = TurnController::RequireTurn(s, "p1");
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, error::RuleViolationCode::NotYourTurn);
    EXPECT_EQ(ok.error().turn_owner, "p0");

    auto const stranger = TurnController::RequireTurn(s, "nobody");
    ASSERT_FALSE(stranger.has_value());
    EXPECT_EQ(stranger.error().code, error::RuleViolationCode::NotYourTurn);
}

TEST(Turn, RoundRobinAdvanceAndTurnNumbers)
{
    Session s = MakeSession(3);
    ActionDispatcher d = Dispatcher();

    std::vector<MemberId> const expected{"p1", "p2", "p0", "p1", "p2"};
    std::uint32_t number = s.Turn().number;
    for (MemberId const& next : expected)
    {
        auto const r = d.Dispatch(s, s.Turn().player_id, EndTurnAction{});
        ASSERT_TRUE(r.has_value()) << error::describe(r.error());
        EXPECT_EQ(*r, MoveOutcome::TurnEnded);
        EXPECT_EQ(s.Turn().player_id, next);
        EXPECT_EQ(s.Turn().number, number + 1);
        number = s.Turn().number;
        debug::CheckInvariants(s);
    }
}

TEST(Turn, StartTurnUntapsAndDrawsOne)
{
    Session s = MakeSession();
    StateOf(s, "p1").lands_in_play = Untapped({Color::Red, Color::Blue});
    StateOf(s, "p1").lands_in_play[0].tapped = true;
    StateOf(s, "p1").lands_in_play[1].tapped = true;

    std::size_t const hand_before = StateOf(s, "p1").hand.size();
    std::size_t const deck_before = s.DeckCount();

    ASSERT_TRUE(Dispatcher().Dispatch(s, "p0", EndTurnAction{}).has_value());

    PlayerState const& p1 = StateOf(s, "p1");
    EXPECT_EQ(p1.hand.size(), hand_before + 1);
    EXPECT_EQ(s.DeckCount(), deck_before - 1);
    for (LandInPlay const& l : p1.lands_in_play)
    {
        EXPECT_FALSE(l.tapped);
    }
    EXPECT_FALSE(s.Turn().has_played_land);
    EXPECT_FALSE(s.Turn().has_taken_action);
}

TEST(Turn, EndTurnTrimsHandFromTheTail)
{
    Session s = MakeSession();
    PlayerState& p0 = StateOf(s, "p0");
    std::vector<Land> const big = Hand({Color::White, Color::Blue, Color::Black, Color::Red, Color::Green,
                                        Color::White, Color::Blue, Color::Black, Color::Red});
    std::size_t const moved = big.size() - p0.hand.size();
    // Keep land conservation intact: take the extra cards from the deck.
    auto h = debug::Inspector::Edit(s);
    h.deck.erase(h.deck.begin(), h.deck.begin() + static_cast<std::ptrdiff_t>(moved));
    p0.hand = big;

    ASSERT_TRUE(Dispatcher().Dispatch(s, "p0", EndTurnAction{}).has_value());

    ASSERT_EQ(p0.hand.size(), s.Cfg().hand_limit);
    EXPECT_EQ(p0.hand.back().color, Color::Blue); // 7th card survives, 8th and 9th trimmed
    EXPECT_EQ(h.discard.size(), 2u);
    EXPECT_EQ(h.discard[0].color, Color::Red);
    EXPECT_EQ(h.discard[1].color, Color::Black);
}

TEST(Turn, EndTurnRejectedWhileDiscardPending)
{
    Session s = MakeSession();
    StateOf(s, "p0").pending_discard = 1;
    auto const r = Dispatcher().Dispatch(s, "p0", EndTurnAction{});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::DiscardRequired);
    EXPECT_EQ(s.Turn().player_id, "p0");
}

TEST(Turn, EmptyDeckAtTurnStartEndsTheGame)
{
    Session s = MakeSession();
    debug::Inspector::Edit(s).deck.clear();

    ActionDispatcher d = Dispatcher();
    auto const r = d.Dispatch(s, "p0", EndTurnAction{});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::RuleViolationCode::DeckEmpty);
    EXPECT_EQ(s.StatusNow(), Status::Ended);

    // Terminal: every later call is rejected, whoever makes it.
    for (MemberId const& who : {MemberId{"p0"}, MemberId{"p1"}})
    {
        auto const again = d.Dispatch(s, who, EndTurnAction{});
        ASSERT_FALSE(again.has_value());
        EXPECT_EQ(again.error().code, error::RuleViolationCode::GameEnded);
    }
}

TEST(Turn, SetupWithExactlyEnoughCardsEndsImmediately)
{
    Config cfg{};
    cfg.deck_size_per_color = 2; // 10 cards, two hands of 5, nothing left for the first draw
    Session s = MakeSession(2, 3, cfg);
    EXPECT_EQ(s.StatusNow(), Status::Ended);
    EXPECT_EQ(s.DeckCount(), 0u);
}
