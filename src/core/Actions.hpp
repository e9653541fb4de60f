//
// Actions.hpp
//

#ifndef GIFTSIEGE_ACTIONS_HPP
#define GIFTSIEGE_ACTIONS_HPP

#include <string_view>
#include <variant>

#include "Types.hpp"

namespace siege::core
{
    // Indices stay signed so range checks happen with the rules, not the parser.
    struct PlayLandAction     { std::int64_t index{}; };
    struct ClaimGiftAction    { GiftId gift_id; };
    struct StealGiftAction
    {
        GiftId gift_id;
        bool add_lock{false};
        std::optional<std::vector<std::int64_t>> discard_indices{};
    };
    struct WrapGiftAction     { GiftId gift_id; };
    struct BuildBuildingAction{ BuildingType building{}; };
    struct RecycleAction      {};
    struct DiscardAction      { std::int64_t index{}; };
    struct EndTurnAction      {};

    using PlayerAction = std::variant<
      PlayLandAction, ClaimGiftAction, StealGiftAction, WrapGiftAction,
      BuildBuildingAction, RecycleAction, DiscardAction, EndTurnAction>;

    // Dependent false for exhaustive if-constexpr chains over PlayerAction.
    template <class>
    inline constexpr bool UnhandledAction = false;

    enum class MoveOutcome : uint8_t
    {
        Applied,
        TurnEnded
    };

    // Wire name of each action kind.
    inline auto ActionName(PlayerAction const& a) -> std::string_view
    {
        return std::visit([]<typename T0>(T0 const&) -> std::string_view
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, PlayLandAction>) return "play_land";
            else if constexpr (std::is_same_v<T, ClaimGiftAction>) return "claim_gift";
            else if constexpr (std::is_same_v<T, StealGiftAction>) return "steal_gift";
            else if constexpr (std::is_same_v<T, WrapGiftAction>) return "wrap_gift";
            else if constexpr (std::is_same_v<T, BuildBuildingAction>) return "build_building";
            else if constexpr (std::is_same_v<T, RecycleAction>) return "recycle";
            else if constexpr (std::is_same_v<T, DiscardAction>) return "discard";
            else if constexpr (std::is_same_v<T, EndTurnAction>) return "end_turn";
            else static_assert(UnhandledAction<T>, "Unhandled action kind");
        }, a);
    }
} // namespace siege::core

#endif //GIFTSIEGE_ACTIONS_HPP
