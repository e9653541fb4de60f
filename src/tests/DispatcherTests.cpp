#include <gtest/gtest.h>

#include "../core/Dispatcher.hpp"
#include "../core/GiftRules.hpp"
#include "../core/Session.hpp"
#include "TestHelpers.hpp"

using namespace siege::core;
using namespace siege::test;
using RVC = siege::core::error::RuleViolationCode;

namespace
{
    auto ParseFails(std::string_view name, Payload const& payload, RVC expected) -> ::testing::AssertionResult
    {
        auto const r = ActionDispatcher::Parse(name, payload);
        if (r.has_value())
            return ::testing::AssertionFailure() << name << " parsed";
        if (r.error().code != expected)
            return ::testing::AssertionFailure() << name << ": " << error::describe(r.error());
        return ::testing::AssertionSuccess();
    }
}

TEST(Dispatcher, ParsesEveryActionKind)
{
    auto land = ActionDispatcher::Parse("play_land", Payload{{"index", std::int64_t{3}}});
    ASSERT_TRUE(land.has_value());
    EXPECT_EQ(std::get<PlayLandAction>(*land).index, 3);

    auto claim = ActionDispatcher::Parse("claim_gift", Payload{{"gift_id", std::string{"gift-1"}}});
    ASSERT_TRUE(claim.has_value());
    EXPECT_EQ(std::get<ClaimGiftAction>(*claim).gift_id, "gift-1");

    auto wrap = ActionDispatcher::Parse("wrap_gift", Payload{{"gift_id", std::string{"gift-2"}}});
    ASSERT_TRUE(wrap.has_value());
    EXPECT_EQ(std::get<WrapGiftAction>(*wrap).gift_id, "gift-2");

    auto build = ActionDispatcher::Parse("build_building", Payload{{"building", std::string{"reinforced_ribbon"}}});
    ASSERT_TRUE(build.has_value());
    EXPECT_EQ(std::get<BuildBuildingAction>(*build).building, BuildingType::ReinforcedRibbon);

    auto discard = ActionDispatcher::Parse("discard", Payload{{"index", std::int64_t{0}}});
    ASSERT_TRUE(discard.has_value());
    EXPECT_TRUE(std::holds_alternative<DiscardAction>(*discard));

    auto recycle = ActionDispatcher::Parse("recycle", Payload{});
    ASSERT_TRUE(recycle.has_value());
    EXPECT_TRUE(std::holds_alternative<RecycleAction>(*recycle));

    auto end = ActionDispatcher::Parse("end_turn", Payload{{"ignored", true}});
    ASSERT_TRUE(end.has_value());
    EXPECT_TRUE(std::holds_alternative<EndTurnAction>(*end));
}

TEST(Dispatcher, StealOptionalFieldsDefault)
{
    auto bare = ActionDispatcher::Parse("steal_gift", Payload{{"gift_id", std::string{"gift-9"}}});
    ASSERT_TRUE(bare.has_value());
    auto const& s = std::get<StealGiftAction>(*bare);
    EXPECT_FALSE(s.add_lock);
    EXPECT_FALSE(s.discard_indices.has_value());

    Payload full{
        {"gift_id", std::string{"gift-9"}},
        {"add_lock", true},
        {"discard_indices", std::vector<std::int64_t>{2, 0}}
    };
    auto parsed = ActionDispatcher::Parse("steal_gift", full);
    ASSERT_TRUE(parsed.has_value());
    auto const& f = std::get<StealGiftAction>(*parsed);
    EXPECT_TRUE(f.add_lock);
    ASSERT_TRUE(f.discard_indices.has_value());
    EXPECT_EQ(*f.discard_indices, (std::vector<std::int64_t>{2, 0}));
}

TEST(Dispatcher, NullCountsAsAbsent)
{
    Payload p{
        {"gift_id", std::string{"gift-9"}},
        {"add_lock", std::monostate{}},
        {"discard_indices", std::monostate{}}
    };
    auto parsed = ActionDispatcher::Parse("steal_gift", p);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(std::get<StealGiftAction>(*parsed).add_lock);
    EXPECT_FALSE(std::get<StealGiftAction>(*parsed).discard_indices.has_value());

    EXPECT_TRUE(ParseFails("play_land", Payload{{"index", std::monostate{}}}, RVC::InvalidPayload));
}

TEST(Dispatcher, RejectsMissingOrMistypedFields)
{
    EXPECT_TRUE(ParseFails("play_land", Payload{}, RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("play_land", Payload{{"index", std::string{"1"}}}, RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("discard", Payload{{"index", true}}, RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("claim_gift", Payload{{"gift_id", std::int64_t{4}}}, RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("claim_gift", Payload{{"gift_id", std::string{}}}, RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("wrap_gift", Payload{}, RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("steal_gift", Payload{{"gift_id", std::string{"g"}}, {"add_lock", std::int64_t{1}}},
                           RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("steal_gift", Payload{{"gift_id", std::string{"g"}}, {"discard_indices", std::int64_t{1}}},
                           RVC::InvalidPayload));
    EXPECT_TRUE(ParseFails("build_building", Payload{{"building", std::string{}}}, RVC::InvalidPayload));
}

TEST(Dispatcher, ReportsTheOffendingField)
{
    auto const r = ActionDispatcher::Parse("steal_gift", Payload{{"gift_id", std::string{"g"}}, {"add_lock", std::string{"yes"}}});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().field, std::string{"add_lock"});
}

TEST(Dispatcher, UnknownNamesAreRejected)
{
    EXPECT_TRUE(ParseFails("draw_card", Payload{}, RVC::UnknownAction));
    EXPECT_TRUE(ParseFails("", Payload{}, RVC::UnknownAction));
    EXPECT_TRUE(ParseFails("build_building", Payload{{"building", std::string{"moat"}}}, RVC::UnknownBuildingType));
}

TEST(Dispatcher, ToPayloadParsesBack)
{
    std::vector<PlayerAction> const actions{
        PlayLandAction{ .index = 4 },
        StealGiftAction{ .gift_id = "gift-3", .add_lock = true, .discard_indices = std::vector<std::int64_t>{1} },
        BuildBuildingAction{ .building = BuildingType::ThiefsGloves },
        EndTurnAction{}
    };
    for (PlayerAction const& a : actions)
    {
        auto const back = ActionDispatcher::Parse(ActionName(a), ActionDispatcher::ToPayload(a));
        ASSERT_TRUE(back.has_value()) << ActionName(a);
        EXPECT_EQ(back->index(), a.index());
    }
}

TEST(Dispatcher, DispatchByNameReachesTheRules)
{
    Session s = MakeSession();
    ActionDispatcher d{std::make_unique<GiftRules>()};

    auto const wrong = d.Dispatch(s, "p1", "end_turn", Payload{});
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, RVC::NotYourTurn);

    auto const bad = d.Dispatch(s, "p0", "play_land", Payload{});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, RVC::InvalidPayload);

    auto const ok = d.Dispatch(s, "p0", "end_turn", Payload{});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, MoveOutcome::TurnEnded);
    EXPECT_EQ(s.Turn().player_id, "p1");
}

TEST(Dispatcher, RefusesToRunWithoutRules)
{
    EXPECT_THROW(ActionDispatcher{nullptr}, error::AssertionError);
}
