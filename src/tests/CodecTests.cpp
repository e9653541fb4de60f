#include <gtest/gtest.h>
#include <cstddef>
#include <span>
#include <vector>

#include "../core/Session.hpp"
#include "../core/Exception.hpp"
#include "../net/codec.hpp"
#include "TestHelpers.hpp"

using namespace siege::core;
using namespace siege::test;
namespace fbn = siege::gen::net;

namespace
{
    inline std::span<const std::byte> AsBytes(flatbuffers::DetachedBuffer const& buf)
    {
        return {reinterpret_cast<const std::byte*>(buf.data()), buf.size()};
    }

    inline std::span<const std::byte> AsBytes(flatbuffers::FlatBufferBuilder const& fbb)
    {
        return {reinterpret_cast<const std::byte*>(fbb.GetBufferPointer()), fbb.GetSize()};
    }

    template <class F>
    F const& Expect(std::expected<net::Frame, net::ParseError> const& r)
    {
        EXPECT_TRUE(r.has_value()) << (r ? "" : r.error().message);
        EXPECT_TRUE(std::holds_alternative<F>(*r));
        return std::get<F>(*r);
    }
}

TEST(Codec, HelloDecodes)
{
    auto const buf = net::BuildHello("alice", "Alice A.", 41);
    auto const r = net::DecodeFrame(AsBytes(buf));
    ASSERT_TRUE(r.has_value());
    auto const& h = Expect<net::HelloFrame>(r);
    EXPECT_EQ(h.msg_id, 41u);
    EXPECT_EQ(h.member_id, "alice");
    EXPECT_EQ(h.name, "Alice A.");
}

TEST(Codec, HelloWithoutMemberIsRejected)
{
    flatbuffers::FlatBufferBuilder fbb;
    auto const name = fbb.CreateString("nobody");
    auto const hello = fbn::CreateHello(fbb, 1, 0, name);
    fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::Hello, hello.Union()));

    auto const r = net::DecodeFrame(AsBytes(fbb));
    ASSERT_FALSE(r.has_value());
}

TEST(Codec, ActionRequestCarriesTypedPayload)
{
    StealGiftAction const steal{
        .gift_id = "gift-00ab",
        .add_lock = true,
        .discard_indices = std::vector<std::int64_t>{2, 0}
    };
    auto const buf = net::BuildAction("game-1", steal, 9);
    auto const r = net::DecodeFrame(AsBytes(buf));
    ASSERT_TRUE(r.has_value());
    auto const& a = Expect<net::ActionFrame>(r);
    EXPECT_EQ(a.msg_id, 9u);
    EXPECT_EQ(a.session_id, "game-1");
    EXPECT_EQ(a.action, "steal_gift");

    auto const parsed = ActionDispatcher::Parse(a.action, a.payload);
    ASSERT_TRUE(parsed.has_value());
    auto const& back = std::get<StealGiftAction>(*parsed);
    EXPECT_EQ(back.gift_id, steal.gift_id);
    EXPECT_TRUE(back.add_lock);
    EXPECT_EQ(back.discard_indices, steal.discard_indices);
}

TEST(Codec, NullAndDuplicatePayloadFields)
{
    Payload const p{
        {"index", std::monostate{}},
        {"gift_id", std::string{"g"}}
    };
    auto const buf = net::BuildActionRequest("game-1", "claim_gift", p, 1);
    auto const r = net::DecodeFrame(AsBytes(buf));
    ASSERT_TRUE(r.has_value());
    auto const& a = Expect<net::ActionFrame>(r);
    ASSERT_TRUE(a.payload.contains("index"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(a.payload.at("index")));

    // Hand-built request repeating a key: the later value is kept.
    flatbuffers::FlatBufferBuilder fbb;
    std::vector<flatbuffers::Offset<fbn::PayloadField>> fields;
    fields.push_back(fbn::CreatePayloadField(fbb, fbb.CreateString("index"), fbn::Value::IntValue,
                                             fbn::CreateIntValue(fbb, 1).Union()));
    fields.push_back(fbn::CreatePayloadField(fbb, fbb.CreateString("index"), fbn::Value::IntValue,
                                             fbn::CreateIntValue(fbb, 4).Union()));
    auto const req = fbn::CreateActionRequest(fbb, 2, fbb.CreateString("game-1"),
                                              fbb.CreateString("play_land"), fbb.CreateVector(fields));
    fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::ActionRequest, req.Union()));

    auto const dup = net::DecodeFrame(AsBytes(fbb));
    ASSERT_TRUE(dup.has_value());
    auto const& d = Expect<net::ActionFrame>(dup);
    EXPECT_EQ(std::get<std::int64_t>(d.payload.at("index")), 4);
}

TEST(Codec, SnapshotKeepsThePerViewerProjection)
{
    Session s = MakeSession(3);
    GiftSP const g = s.Display().front();
    GiveGift(s, "p2", g->id, 3);
    StateOf(s, "p2").building = BuildingType::ReinforcedRibbon;
    StateOf(s, "p1").lands_in_play = Untapped({Color::Green, Color::Black});
    StateOf(s, "p1").lands_in_play[0].tapped = true;
    StateOf(s, "p1").pending_discard = 1;

    SnapshotCSP const snap = s.SnapshotFor("p1");
    auto const buf = net::BuildSnapshot(*snap, 77);
    auto const r = net::DecodeFrame(AsBytes(buf));
    ASSERT_TRUE(r.has_value());
    auto const& f = Expect<net::SnapshotFrame>(r);
    GameSnapshot const& back = f.snapshot;

    EXPECT_EQ(f.msg_id, 77u);
    EXPECT_EQ(back.game_id, snap->game_id);
    EXPECT_EQ(back.room_id, snap->room_id);
    EXPECT_EQ(back.status, Status::Active);
    EXPECT_EQ(back.created_at_ms, snap->created_at_ms);
    EXPECT_EQ(back.deck_count, snap->deck_count);
    EXPECT_EQ(back.turn.player_id, "p0");
    EXPECT_EQ(back.turn.number, 1u);

    ASSERT_EQ(back.players.size(), 3u);
    EXPECT_EQ(back.players[0].hand_count, 6u);
    EXPECT_EQ(back.players[2].building, BuildingType::ReinforcedRibbon);
    EXPECT_EQ(back.players[2].score, snap->players[2].score);
    ASSERT_EQ(back.players[2].gifts.size(), 1u);
    EXPECT_EQ(back.players[2].gifts[0].gift_id, g->id);
    EXPECT_EQ(back.players[2].gifts[0].locks, 3);
    EXPECT_EQ(back.players[2].gifts[0].owner_id, MemberId{"p2"});
    EXPECT_FALSE(back.players[0].building.has_value());

    ASSERT_EQ(back.gifts_display.size(), snap->gifts_display.size());
    for (std::size_t i{}; i < back.gifts_display.size(); ++i)
    {
        EXPECT_EQ(back.gifts_display[i].gift_id, snap->gifts_display[i].gift_id);
        EXPECT_EQ(back.gifts_display[i].color, snap->gifts_display[i].color);
        EXPECT_EQ(back.gifts_display[i].gift_class, snap->gifts_display[i].gift_class);
        EXPECT_FALSE(back.gifts_display[i].owner_id.has_value());
    }

    EXPECT_EQ(back.viewer.member_id, "p1");
    EXPECT_EQ(back.viewer.hand, snap->viewer.hand);
    EXPECT_EQ(back.viewer.pending_discard, 1);
    ASSERT_EQ(back.viewer.lands_in_play.size(), 2u);
    EXPECT_TRUE(back.viewer.lands_in_play[0].tapped);
    EXPECT_EQ(back.viewer.lands_in_play[1].color, Color::Black);
}

TEST(Codec, ViolationKeepsCodeAndText)
{
    error::RuleViolation v = error::Viol(error::RuleViolationCode::GiftSealed);
    v.with_actor("p1").with_gift("gift-7");

    auto const buf = net::BuildViolation(v, 5);
    auto const r = net::DecodeFrame(AsBytes(buf));
    ASSERT_TRUE(r.has_value());
    auto const& f = Expect<net::ViolationFrame>(r);
    EXPECT_EQ(f.msg_id, 5u);
    EXPECT_EQ(f.code, error::RuleViolationCode::GiftSealed);
    EXPECT_EQ(f.text, error::describe(v));
}

TEST(Codec, ViolationWithUnknownCodeIsRejected)
{
    flatbuffers::FlatBufferBuilder fbb;
    auto const vio = fbn::CreateViolation(fbb, 1, 999, fbb.CreateString("?"));
    fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::Violation, vio.Union()));
    EXPECT_FALSE(net::DecodeFrame(AsBytes(fbb)).has_value());
}

TEST(Codec, MessageTagWithoutBodyIsRejected)
{
    for (fbn::Message const tag : {fbn::Message::Hello, fbn::Message::ActionRequest,
                                   fbn::Message::SnapshotMsg, fbn::Message::Violation})
    {
        flatbuffers::FlatBufferBuilder fbb;
        fbb.Finish(fbn::CreateEnvelope(fbb, tag, 0));
        auto const r = net::DecodeFrame(AsBytes(fbb));
        EXPECT_FALSE(r.has_value()) << fbn::EnumNameMessage(tag);
    }
}

TEST(Codec, PayloadTagWithoutValueDecodesAsNull)
{
    flatbuffers::FlatBufferBuilder fbb;
    std::vector<flatbuffers::Offset<fbn::PayloadField>> fields;
    fields.push_back(fbn::CreatePayloadField(fbb, fbb.CreateString("index"), fbn::Value::IntValue, 0));
    fields.push_back(fbn::CreatePayloadField(fbb, fbb.CreateString("gift_id"), fbn::Value::StringValue, 0));
    auto const req = fbn::CreateActionRequest(fbb, 3, fbb.CreateString("game-1"),
                                              fbb.CreateString("play_land"), fbb.CreateVector(fields));
    fbb.Finish(fbn::CreateEnvelope(fbb, fbn::Message::ActionRequest, req.Union()));

    auto const r = net::DecodeFrame(AsBytes(fbb));
    ASSERT_TRUE(r.has_value());
    auto const& a = Expect<net::ActionFrame>(r);
    ASSERT_TRUE(a.payload.contains("index"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(a.payload.at("index")));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(a.payload.at("gift_id")));

    auto const parsed = ActionDispatcher::Parse(a.action, a.payload);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error::RuleViolationCode::InvalidPayload);
}

TEST(Codec, GarbageAndEmptyFramesAreRejected)
{
    std::vector<std::byte> junk(64, std::byte{0xAB});
    EXPECT_FALSE(net::DecodeFrame(junk).has_value());

    std::vector<std::byte> const tiny(2, std::byte{0});
    EXPECT_FALSE(net::DecodeFrame(tiny).has_value());

    flatbuffers::FlatBufferBuilder fbb;
    fbb.Finish(fbn::CreateEnvelope(fbb));
    EXPECT_FALSE(net::DecodeFrame(AsBytes(fbb)).has_value());

    auto const good = net::BuildHello("bob", "Bob", 1);
    std::vector<std::byte> truncated(reinterpret_cast<std::byte const*>(good.data()),
                                     reinterpret_cast<std::byte const*>(good.data()) + good.size() / 2);
    EXPECT_FALSE(net::DecodeFrame(truncated).has_value());
}
