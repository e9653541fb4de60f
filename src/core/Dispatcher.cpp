//
// Dispatcher.cpp
//

#include "Dispatcher.hpp"

#include <utility>

#include "Session.hpp"

namespace
{
    using siege::core::Payload;
    using siege::core::PayloadValue;
    using siege::core::error::RuleViolationCode;
    using siege::core::error::Viol;

    template <typename T>
    using FieldResult = siege::core::error::Result<T>;

    auto Malformed(std::string_view field) -> siege::core::error::RuleViolation
    {
        return Viol(RuleViolationCode::InvalidPayload).with_field(std::string{field});
    }

    // null counts as absent
    auto Lookup(Payload const& payload, std::string_view key) -> PayloadValue const*
    {
        auto const it = payload.find(key);
        if (it == payload.end() || std::holds_alternative<std::monostate>(it->second)) return nullptr;
        return &it->second;
    }

    template <typename T>
    auto Required(Payload const& payload, std::string_view key) -> FieldResult<T>
    {
        PayloadValue const* v = Lookup(payload, key);
        if (!v || !std::holds_alternative<T>(*v)) return std::unexpected(Malformed(key));
        return std::get<T>(*v);
    }

    template <typename T>
    auto Optional(Payload const& payload, std::string_view key) -> FieldResult<std::optional<T>>
    {
        PayloadValue const* v = Lookup(payload, key);
        if (!v) return std::optional<T>{};
        if (!std::holds_alternative<T>(*v)) return std::unexpected(Malformed(key));
        return std::optional<T>{std::get<T>(*v)};
    }

    auto RequiredGiftId(Payload const& payload) -> FieldResult<std::string>
    {
        auto id = Required<std::string>(payload, "gift_id");
        if (id && id->empty()) return std::unexpected(Malformed("gift_id"));
        return id;
    }
}

namespace siege::core
{
    ActionDispatcher::ActionDispatcher(std::unique_ptr<Rules> rules) :
        rules_(std::move(rules))
    {
        GSG_ASSERT(rules_ != nullptr, "Dispatcher built without rules");
    }

    auto ActionDispatcher::Parse(std::string_view action_name, Payload const& payload)
        -> error::Result<PlayerAction>
    {
        if (action_name == "play_land")
        {
            auto idx = Required<std::int64_t>(payload, "index");
            if (!idx) return std::unexpected(std::move(idx.error()));
            return PlayLandAction{ .index = *idx };
        }
        if (action_name == "claim_gift")
        {
            auto id = RequiredGiftId(payload);
            if (!id) return std::unexpected(std::move(id.error()));
            return ClaimGiftAction{ .gift_id = std::move(*id) };
        }
        if (action_name == "steal_gift")
        {
            auto id = RequiredGiftId(payload);
            if (!id) return std::unexpected(std::move(id.error()));
            auto add_lock = Optional<bool>(payload, "add_lock");
            if (!add_lock) return std::unexpected(std::move(add_lock.error()));
            auto idxs = Optional<std::vector<std::int64_t>>(payload, "discard_indices");
            if (!idxs) return std::unexpected(std::move(idxs.error()));
            return StealGiftAction{
                .gift_id = std::move(*id),
                .add_lock = add_lock->value_or(false),
                .discard_indices = std::move(*idxs)
            };
        }
        if (action_name == "wrap_gift")
        {
            auto id = RequiredGiftId(payload);
            if (!id) return std::unexpected(std::move(id.error()));
            return WrapGiftAction{ .gift_id = std::move(*id) };
        }
        if (action_name == "build_building")
        {
            auto raw = Required<std::string>(payload, "building");
            if (!raw || raw->empty()) return std::unexpected(Malformed("building"));
            std::optional<BuildingType> const b = ParseBuilding(*raw);
            if (!b)
                return std::unexpected(Viol(RuleViolationCode::UnknownBuildingType).with_field(*raw));
            return BuildBuildingAction{ .building = *b };
        }
        if (action_name == "recycle")
        {
            return RecycleAction{};
        }
        if (action_name == "discard")
        {
            auto idx = Required<std::int64_t>(payload, "index");
            if (!idx) return std::unexpected(std::move(idx.error()));
            return DiscardAction{ .index = *idx };
        }
        if (action_name == "end_turn")
        {
            return EndTurnAction{};
        }
        return std::unexpected(Viol(RuleViolationCode::UnknownAction).with_field(std::string{action_name}));
    }

    auto ActionDispatcher::ToPayload(PlayerAction const& action) -> Payload
    {
        return std::visit([]<typename T0>(T0 const& act) -> Payload
        {
            using T = std::decay_t<T0>;
            Payload out;
            if constexpr (std::is_same_v<T, PlayLandAction> || std::is_same_v<T, DiscardAction>)
            {
                out.emplace("index", act.index);
            }
            else if constexpr (std::is_same_v<T, ClaimGiftAction> || std::is_same_v<T, WrapGiftAction>)
            {
                out.emplace("gift_id", act.gift_id);
            }
            else if constexpr (std::is_same_v<T, StealGiftAction>)
            {
                out.emplace("gift_id", act.gift_id);
                out.emplace("add_lock", act.add_lock);
                if (act.discard_indices) out.emplace("discard_indices", *act.discard_indices);
            }
            else if constexpr (std::is_same_v<T, BuildBuildingAction>)
            {
                out.emplace("building", std::string{to_string(act.building)});
            }
            else if constexpr (std::is_same_v<T, RecycleAction> || std::is_same_v<T, EndTurnAction>)
            {
            }
            else
            {
                static_assert(UnhandledAction<T>, "ToPayload is missing an action kind");
            }
            return out;
        }, action);
    }

    auto ActionDispatcher::Dispatch(Session& s, MemberId const& requester, PlayerAction const& action)
        -> Rules::ApplyResult
    {
        if (auto ok = rules_->Validate(s, requester, action); !ok)
        {
            return std::unexpected(std::move(ok.error()));
        }
        return rules_->Apply(s, requester, action);
    }

    auto ActionDispatcher::Dispatch(Session& s, MemberId const& requester,
                                    std::string_view action_name, Payload const& payload)
        -> Rules::ApplyResult
    {
        auto action = Parse(action_name, payload);
        if (!action) return std::unexpected(std::move(action.error()));
        return Dispatch(s, requester, *action);
    }
}
