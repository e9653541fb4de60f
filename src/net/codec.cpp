//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <vector>

namespace fb = siege::gen::net;

namespace siege::core::net
{
    auto ToFbColor(Color c) noexcept -> fb::Color
    {
        switch (c)
        {
        case Color::White: return fb::Color::White;
        case Color::Blue:  return fb::Color::Blue;
        case Color::Black: return fb::Color::Black;
        case Color::Red:   return fb::Color::Red;
        case Color::Green: return fb::Color::Green;
        }
        return fb::Color::White;
    }

    auto FromFbColor(fb::Color c) noexcept -> Color
    {
        switch (c)
        {
        case fb::Color::White: return Color::White;
        case fb::Color::Blue:  return Color::Blue;
        case fb::Color::Black: return Color::Black;
        case fb::Color::Red:   return Color::Red;
        case fb::Color::Green: return Color::Green;
        }
        return Color::White;
    }

    auto ToFbGiftClass(GiftClass c) noexcept -> fb::GiftClass
    {
        switch (c)
        {
        case GiftClass::I:   return fb::GiftClass::ClassI;
        case GiftClass::II:  return fb::GiftClass::ClassII;
        case GiftClass::III: return fb::GiftClass::ClassIII;
        }
        return fb::GiftClass::ClassI;
    }

    auto FromFbGiftClass(fb::GiftClass c) noexcept -> GiftClass
    {
        switch (c)
        {
        case fb::GiftClass::ClassI:   return GiftClass::I;
        case fb::GiftClass::ClassII:  return GiftClass::II;
        case fb::GiftClass::ClassIII: return GiftClass::III;
        }
        return GiftClass::I;
    }

    auto ToFbBuilding(std::optional<BuildingType> b) noexcept -> fb::Building
    {
        if (!b) return fb::Building::Unbuilt;
        switch (*b)
        {
        case BuildingType::ThiefsGloves:     return fb::Building::ThiefsGloves;
        case BuildingType::Crowbar:          return fb::Building::Crowbar;
        case BuildingType::ReinforcedRibbon: return fb::Building::ReinforcedRibbon;
        case BuildingType::SupplyWarehouse:  return fb::Building::SupplyWarehouse;
        }
        return fb::Building::Unbuilt;
    }

    auto FromFbBuilding(fb::Building b) noexcept -> std::optional<BuildingType>
    {
        switch (b)
        {
        case fb::Building::Unbuilt:          return std::nullopt;
        case fb::Building::ThiefsGloves:     return BuildingType::ThiefsGloves;
        case fb::Building::Crowbar:          return BuildingType::Crowbar;
        case fb::Building::ReinforcedRibbon: return BuildingType::ReinforcedRibbon;
        case fb::Building::SupplyWarehouse:  return BuildingType::SupplyWarehouse;
        }
        return std::nullopt;
    }

    auto ToFbStatus(Status s) noexcept -> fb::Status
    {
        return s == Status::Ended ? fb::Status::Ended : fb::Status::Active;
    }

    auto FromFbStatus(fb::Status s) noexcept -> Status
    {
        return s == fb::Status::Ended ? Status::Ended : Status::Active;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(siege::core::Color::Green) == static_cast<int>(fb::Color::Green));
    static_assert(static_cast<int>(siege::core::GiftClass::III) == static_cast<int>(fb::GiftClass::ClassIII));

    using siege::core::Payload;
    using siege::core::PayloadValue;

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto ToFbLands(std::vector<siege::core::LandInPlay> const& lands) -> std::vector<fb::LandView>
    {
        std::vector<fb::LandView> out;
        out.reserve(lands.size());
        for (siege::core::LandInPlay const& l : lands)
        {
            out.emplace_back(siege::core::net::ToFbColor(l.color), l.tapped);
        }
        return out;
    }

    auto FromFbLands(flatbuffers::Vector<fb::LandView const*> const* v) -> std::vector<siege::core::LandInPlay>
    {
        std::vector<siege::core::LandInPlay> out;
        if (!v) return out;
        out.reserve(v->size());
        for (fb::LandView const* l : *v)
        {
            out.push_back(siege::core::LandInPlay{ .color = siege::core::net::FromFbColor(l->color()),
                                                   .tapped = l->tapped() });
        }
        return out;
    }

    auto ToFbGift(flatbuffers::FlatBufferBuilder& fbb, siege::core::GiftView const& g)
        -> flatbuffers::Offset<fb::GiftView>
    {
        return fb::CreateGiftViewDirect(
            fbb,
            g.gift_id.c_str(),
            siege::core::net::ToFbColor(g.color),
            siege::core::net::ToFbGiftClass(g.gift_class),
            g.locks,
            g.owner_id ? g.owner_id->c_str() : nullptr,
            g.sealed);
    }

    auto ToFbGifts(flatbuffers::FlatBufferBuilder& fbb, std::vector<siege::core::GiftView> const& gifts)
        -> std::vector<flatbuffers::Offset<fb::GiftView>>
    {
        std::vector<flatbuffers::Offset<fb::GiftView>> out;
        out.reserve(gifts.size());
        for (siege::core::GiftView const& g : gifts) out.push_back(ToFbGift(fbb, g));
        return out;
    }

    auto FromFbGifts(flatbuffers::Vector<flatbuffers::Offset<fb::GiftView>> const* v)
        -> std::vector<siege::core::GiftView>
    {
        std::vector<siege::core::GiftView> out;
        if (!v) return out;
        out.reserve(v->size());
        for (fb::GiftView const* g : *v)
        {
            siege::core::GiftView gv{
                .gift_id = Str(g->gift_id()),
                .color = siege::core::net::FromFbColor(g->color()),
                .gift_class = siege::core::net::FromFbGiftClass(g->gift_class()),
                .locks = g->locks(),
                .owner_id = std::nullopt,
                .sealed = g->sealed()
            };
            if (g->owner_id()) gv.owner_id = g->owner_id()->str();
            out.push_back(std::move(gv));
        }
        return out;
    }

    auto ToFbValue(flatbuffers::FlatBufferBuilder& fbb, PayloadValue const& v)
        -> std::pair<fb::Value, flatbuffers::Offset<void>>
    {
        return std::visit([&fbb]<typename T0>(T0 const& x) -> std::pair<fb::Value, flatbuffers::Offset<void>>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return {fb::Value::NullValue, fb::CreateNullValue(fbb).Union()};
            else if constexpr (std::is_same_v<T, bool>)
                return {fb::Value::BoolValue, fb::CreateBoolValue(fbb, x).Union()};
            else if constexpr (std::is_same_v<T, std::int64_t>)
                return {fb::Value::IntValue, fb::CreateIntValue(fbb, x).Union()};
            else if constexpr (std::is_same_v<T, std::string>)
                return {fb::Value::StringValue, fb::CreateStringValueDirect(fbb, x.c_str()).Union()};
            else
                return {fb::Value::IntListValue, fb::CreateIntListValueDirect(fbb, &x).Union()};
        }, v);
    }

    auto FromFbValue(fb::PayloadField const& f) -> PayloadValue
    {
        // A tag without its table decodes as null.
        switch (f.value_type())
        {
        case fb::Value::BoolValue:
            if (auto const* b = f.value_as_BoolValue()) return b->value();
            break;
        case fb::Value::IntValue:
            if (auto const* n = f.value_as_IntValue()) return n->value();
            break;
        case fb::Value::StringValue:
            if (auto const* str = f.value_as_StringValue()) return Str(str->value());
            break;
        case fb::Value::IntListValue:
            if (auto const* list = f.value_as_IntListValue())
            {
                std::vector<std::int64_t> out;
                if (auto const* vs = list->values())
                    out.assign(vs->begin(), vs->end());
                return out;
            }
            break;
        case fb::Value::NONE:
        case fb::Value::NullValue:
            break;
        }
        return std::monostate{};
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, fb::Message type, flatbuffers::Offset<void> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace siege::core::net
{
    // ---------- Builders (client -> server) ----------

    auto BuildHello(MemberId const& member_id, std::string_view name, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const id = fbb.CreateString(member_id);
        auto const nm = fbb.CreateString(name.data(), name.size());
        auto const h = fb::CreateHello(fbb, msg_id, id, nm);
        return Finish(fbb, fb::Message::Hello, h.Union());
    }

    auto BuildActionRequest(SessionId const& session_id,
                            std::string_view action_name,
                            Payload const& payload,
                            std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::PayloadField>> fields;
        fields.reserve(payload.size());
        for (auto const& [key, value] : payload)
        {
            auto const k = fbb.CreateString(key);
            auto const [type, off] = ToFbValue(fbb, value);
            fields.push_back(fb::CreatePayloadField(fbb, k, type, off));
        }

        auto const sid = fbb.CreateString(session_id);
        auto const act = fbb.CreateString(action_name.data(), action_name.size());
        auto const fv = fbb.CreateVector(fields);
        auto const req = fb::CreateActionRequest(fbb, msg_id, sid, act, fv);
        return Finish(fbb, fb::Message::ActionRequest, req.Union());
    }

    auto BuildAction(SessionId const& session_id, PlayerAction const& action, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        return BuildActionRequest(session_id, ActionName(action), ActionDispatcher::ToPayload(action), msg_id);
    }

    // ---------- Snapshot (server -> client) ----------

    auto BuildSnapshot(GameSnapshot const& snap, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::PlayerView>> players;
        players.reserve(snap.players.size());
        for (PlayerView const& p : snap.players)
        {
            auto const lands = ToFbLands(p.lands_in_play);
            auto const gifts = ToFbGifts(fbb, p.gifts);
            players.push_back(fb::CreatePlayerViewDirect(
                fbb,
                p.member_id.c_str(),
                p.name.c_str(),
                p.score,
                p.hand_count,
                &lands,
                &gifts,
                ToFbBuilding(p.building)));
        }

        auto const display = ToFbGifts(fbb, snap.gifts_display);

        std::vector<std::uint8_t> hand;
        hand.reserve(snap.viewer.hand.size());
        for (Color const c : snap.viewer.hand) hand.push_back(static_cast<std::uint8_t>(ToFbColor(c)));
        auto const my_lands = ToFbLands(snap.viewer.lands_in_play);
        auto const viewer = fb::CreateViewerViewDirect(
            fbb,
            snap.viewer.member_id.c_str(),
            snap.viewer.name.c_str(),
            &hand,
            &my_lands,
            ToFbBuilding(snap.viewer.building),
            snap.viewer.pending_discard);

        auto const turn = fb::CreateTurnViewDirect(
            fbb,
            snap.turn.player_id.c_str(),
            snap.turn.number,
            snap.turn.has_played_land,
            snap.turn.has_taken_action);

        auto const view = fb::CreateSeatViewDirect(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*game_id*/ snap.game_id.c_str(),
            /*room_id*/ snap.room_id.c_str(),
            /*status*/ ToFbStatus(snap.status),
            /*created_at_ms*/ snap.created_at_ms,
            /*turn*/ turn,
            /*players*/ &players,
            /*gifts_display*/ &display,
            /*viewer*/ viewer,
            /*deck_count*/ snap.deck_count
        );

        auto const sm = fb::CreateSnapshotMsg(fbb, msg_id, view);
        return Finish(fbb, fb::Message::SnapshotMsg, sm.Union());
    }

    // ---------- Violation (server -> client) ----------

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, msg_id, static_cast<int16_t>(v.code), txt);
        return Finish(fbb, fb::Message::Violation, vio.Union());
    }

    // ---------- Decode ----------

    static auto DecodeSnapshot(fb::SnapshotMsg const& m) -> std::expected<SnapshotFrame, ParseError>
    {
        fb::SeatView const* v = m.view();
        if (!v) return std::unexpected(ParseError{"snapshot without a view"});
        if (v->schema_version() != SchemaVersion)
            return std::unexpected(ParseError{"unsupported schema version"});

        SnapshotFrame out{ .msg_id = m.msg_id() };
        GameSnapshot& s = out.snapshot;
        s.game_id = Str(v->game_id());
        s.room_id = Str(v->room_id());
        s.status = FromFbStatus(v->status());
        s.created_at_ms = v->created_at_ms();
        s.deck_count = v->deck_count();

        if (fb::TurnView const* t = v->turn())
        {
            s.turn = TurnState{
                .player_id = Str(t->player_id()),
                .number = t->number(),
                .has_played_land = t->has_played_land(),
                .has_taken_action = t->has_taken_action()
            };
        }

        if (auto const* ps = v->players())
        {
            s.players.reserve(ps->size());
            for (fb::PlayerView const* p : *ps)
            {
                s.players.push_back(PlayerView{
                    .member_id = Str(p->member_id()),
                    .name = Str(p->name()),
                    .score = p->score(),
                    .hand_count = p->hand_count(),
                    .lands_in_play = FromFbLands(p->lands_in_play()),
                    .gifts = FromFbGifts(p->gifts()),
                    .building = FromFbBuilding(p->building())
                });
            }
        }

        s.gifts_display = FromFbGifts(v->gifts_display());

        if (fb::ViewerView const* me = v->viewer())
        {
            s.viewer.member_id = Str(me->member_id());
            s.viewer.name = Str(me->name());
            if (auto const* h = me->hand())
            {
                for (std::uint8_t const c : *h)
                {
                    if (c > static_cast<std::uint8_t>(fb::Color::MAX))
                        return std::unexpected(ParseError{"hand card with unknown color"});
                    s.viewer.hand.push_back(FromFbColor(static_cast<fb::Color>(c)));
                }
            }
            s.viewer.lands_in_play = FromFbLands(me->lands_in_play());
            s.viewer.building = FromFbBuilding(me->building());
            s.viewer.pending_discard = me->pending_discard();
        }
        return out;
    }

    auto DecodeFrame(std::span<std::byte const> bytes) -> std::expected<Frame, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        fb::Envelope const* env = fb::GetEnvelope(data);
        switch (env->message_type())
        {
        case fb::Message::Hello:
        {
            auto const* h = env->message_as_Hello();
            if (!h) return std::unexpected(ParseError{"hello tag without a body"});
            if (!h->member_id() || h->member_id()->size() == 0)
                return std::unexpected(ParseError{"hello without member_id"});
            return HelloFrame{ .msg_id = h->msg_id(), .member_id = Str(h->member_id()), .name = Str(h->name()) };
        }

        case fb::Message::ActionRequest:
        {
            auto const* r = env->message_as_ActionRequest();
            if (!r) return std::unexpected(ParseError{"action tag without a body"});
            ActionFrame out{
                .msg_id = r->msg_id(),
                .session_id = Str(r->session_id()),
                .action = Str(r->action()),
                .payload = {}
            };
            if (auto const* fields = r->payload())
            {
                for (fb::PayloadField const* f : *fields)
                {
                    // later duplicates win
                    out.payload.insert_or_assign(f->key()->str(), FromFbValue(*f));
                }
            }
            return out;
        }

        case fb::Message::SnapshotMsg:
        {
            auto const* m = env->message_as_SnapshotMsg();
            if (!m) return std::unexpected(ParseError{"snapshot tag without a body"});
            auto snap = DecodeSnapshot(*m);
            if (!snap) return std::unexpected(std::move(snap.error()));
            return std::move(*snap);
        }

        case fb::Message::Violation:
        {
            auto const* v = env->message_as_Violation();
            if (!v) return std::unexpected(ParseError{"violation tag without a body"});
            auto const raw = v->code();
            if (raw < 0 || raw > static_cast<int16_t>(error::RuleViolationCode::Internal_Unreachable))
                return std::unexpected(ParseError{"violation with unknown code"});
            return ViolationFrame{
                .msg_id = v->msg_id(),
                .code = static_cast<error::RuleViolationCode>(raw),
                .text = Str(v->text())
            };
        }

        default:
            return std::unexpected(ParseError{"empty or unknown message"});
        }
    }
} // namespace siege::core::net
