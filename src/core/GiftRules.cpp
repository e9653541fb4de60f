//
// GiftRules.cpp
//

#include "GiftRules.hpp"

#include "Session.hpp"
#include "Turn.hpp"
#include "Util.hpp"
#include <algorithm>
#include <ranges>

namespace siege::core
{
    using error::RuleViolationCode;
    using error::Viol;

    auto GiftRules::GiftCost(GiftClass const c, Color const color) -> ManaCost
    {
        switch (c)
        {
        case GiftClass::I:   return ManaCost{ .total = 3, .color_amount = 2, .color = color };
        case GiftClass::II:  return ManaCost{ .total = 5, .color_amount = 3, .color = color };
        case GiftClass::III: return ManaCost{ .total = 7, .color_amount = 4, .color = color };
        }
        GSG_THROW(error::Code::Rules, "Unknown gift class");
    }

    auto GiftRules::BuildingColor(BuildingType const b) -> Color
    {
        switch (b)
        {
        case BuildingType::ThiefsGloves:     return Color::Black;
        case BuildingType::Crowbar:          return Color::Red;
        case BuildingType::ReinforcedRibbon: return Color::Green;
        case BuildingType::SupplyWarehouse:  return Color::Blue;
        }
        GSG_THROW(error::Code::Rules, "Unknown building type");
    }

    auto GiftRules::BuildingCost(BuildingType const b) -> ManaCost
    {
        return ManaCost{ .total = 4, .color_amount = 2, .color = BuildingColor(b) };
    }

    auto GiftRules::WrapCost() -> ManaCost
    {
        return ManaCost{ .total = 2, .color_amount = 0, .color = std::nullopt };
    }

    auto GiftRules::StealDiscardCount(uint8_t const locks, bool const has_gloves) -> std::size_t
    {
        std::size_t count = locks;
        if (has_gloves)
            count = count > 2 ? count - 2 : 0;
        return count;
    }

    static auto HasGift(PlayerState const& p, GiftId const& id) -> GiftSP
    {
        auto const it = std::ranges::find_if(p.gifts, [&id](GiftSP const& g) { return g->id == id; });
        return it != p.gifts.end() ? *it : GiftSP{};
    }

    static auto CanAfford(PlayerState const& p, ManaCost const& cost, MemberId const& requester)
        -> error::CheckResult
    {
        auto selection = mana::SelectLands(p.lands_in_play, cost);
        if (!selection)
        {
            error::RuleViolation v = std::move(selection.error());
            v.with_actor(requester);
            return std::unexpected(std::move(v));
        }
        return {};
    }

    static auto ValidateDiscardSelection(std::vector<std::int64_t> const& idxs,
                                         std::size_t const discard_count,
                                         std::size_t const hand_size,
                                         MemberId const& requester) -> error::CheckResult
    {
        using RVC = RuleViolationCode;
        if (idxs.size() != discard_count)
            return std::unexpected(Viol(RVC::InvalidDiscardSelection).with_actor(requester)
                                   .with_needed(static_cast<std::uint32_t>(discard_count))
                                   .with_available(static_cast<std::uint32_t>(idxs.size())));

        util::IndexUniqueChecker checker{hand_size};
        for (std::int64_t const i : idxs)
        {
            if (!util::InRange(i, hand_size))
                return std::unexpected(Viol(RVC::InvalidDiscardSelection).with_actor(requester).with_index(i));
            checker.Add(static_cast<std::size_t>(i));
        }
        if (checker.ContainsDup())
            return std::unexpected(Viol(RVC::InvalidDiscardSelection).with_actor(requester));
        return {};
    }

    auto GiftRules::Validate(Session const& s, MemberId const& requester, PlayerAction const& a) const -> CheckResult
    {
        using RVC = RuleViolationCode;

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayLandAction>)
            {
                if (auto ok = TurnController::RequireTurn(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                if (s.turn_.has_played_land)
                    return std::unexpected(Viol(RVC::LandAlreadyPlayed).with_actor(requester));

                if (p.lands_in_play.size() >= s.cfg_.land_limit)
                    return std::unexpected(Viol(RVC::LandLimitReached).with_actor(requester)
                                           .with_available(static_cast<std::uint32_t>(p.lands_in_play.size())));

                if (!util::InRange(act.index, p.hand.size()))
                    return std::unexpected(Viol(RVC::InvalidHandIndex).with_actor(requester).with_index(act.index));

                // Playing the card must not leave the pending discard unpayable.
                if (p.pending_discard > 0 && p.hand.size() <= p.pending_discard)
                    return std::unexpected(Viol(RVC::DiscardRequired).with_actor(requester)
                                           .with_needed(p.pending_discard));
                return {};
            }
            else if constexpr (std::is_same_v<T, ClaimGiftAction>)
            {
                if (auto ok = TurnController::RequireMainAction(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                GiftSP const gift = s.FindDisplayGift(act.gift_id);
                if (!gift)
                    return std::unexpected(Viol(RVC::GiftNotAvailable).with_actor(requester).with_gift(act.gift_id));

                return CanAfford(p, GiftCost(*gift), requester);
            }
            else if constexpr (std::is_same_v<T, StealGiftAction>)
            {
                if (auto ok = TurnController::RequireMainAction(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                auto const [gift, owner] = s.FindOwnedGift(act.gift_id);
                if (!gift)
                    return std::unexpected(Viol(RVC::GiftNotFound).with_actor(requester).with_gift(act.gift_id));

                if (owner->member_id == requester)
                    return std::unexpected(Viol(RVC::CannotStealOwnGift).with_actor(requester).with_gift(act.gift_id));

                if (gift->Sealed())
                    return std::unexpected(Viol(RVC::GiftSealed).with_actor(requester).with_gift(act.gift_id));

                if (auto ok = CanAfford(p, GiftCost(*gift), requester); !ok) return ok;

                std::size_t const discard_count = StealDiscardCount(*gift, p);
                if (p.hand.size() < discard_count)
                    return std::unexpected(Viol(RVC::InsufficientHandForDiscard).with_actor(requester)
                                           .with_gift(act.gift_id)
                                           .with_needed(static_cast<std::uint32_t>(discard_count))
                                           .with_available(static_cast<std::uint32_t>(p.hand.size())));

                if (act.discard_indices)
                    return ValidateDiscardSelection(*act.discard_indices, discard_count, p.hand.size(), requester);
                return {};
            }
            else if constexpr (std::is_same_v<T, WrapGiftAction>)
            {
                if (auto ok = TurnController::RequireMainAction(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                if (!HasGift(p, act.gift_id))
                    return std::unexpected(Viol(RVC::NotYourGift).with_actor(requester).with_gift(act.gift_id));

                return CanAfford(p, WrapCost(), requester);
            }
            else if constexpr (std::is_same_v<T, BuildBuildingAction>)
            {
                if (auto ok = TurnController::RequireTurn(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                // Checked ahead of the action budget: a second building is never possible.
                if (p.building)
                    return std::unexpected(Viol(RVC::BuildingAlreadyBuilt).with_actor(requester));

                if (auto ok = TurnController::RequireMainAction(s, requester); !ok) return ok;
                return CanAfford(p, BuildingCost(act.building), requester);
            }
            else if constexpr (std::is_same_v<T, RecycleAction>)
            {
                if (auto ok = TurnController::RequireMainAction(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                if (p.pending_discard > 0)
                    return std::unexpected(Viol(RVC::DiscardAlreadyPending).with_actor(requester));
                return {};
            }
            else if constexpr (std::is_same_v<T, DiscardAction>)
            {
                if (auto ok = TurnController::RequireTurn(s, requester); !ok) return ok;
                PlayerState const& p = *s.FindPlayer(requester);

                if (p.pending_discard == 0)
                    return std::unexpected(Viol(RVC::NoDiscardPending).with_actor(requester));

                if (!util::InRange(act.index, p.hand.size()))
                    return std::unexpected(Viol(RVC::InvalidHandIndex).with_actor(requester).with_index(act.index));
                return {};
            }
            else if constexpr (std::is_same_v<T, EndTurnAction>)
            {
                return TurnController::CanEndTurn(s, requester);
            }
            else
            {
                static_assert(UnhandledAction<T>, "Validate is missing an action kind");
            }
        }, a);
    }

    auto GiftRules::Apply(Session& s, MemberId const& requester, PlayerAction const& a) -> ApplyResult
    {
        PlayerState* const player = s.FindPlayer(requester);
        GSG_ASSERT(player != nullptr, "Apply for a non-member");
        PlayerState& p = *player;

        auto pay = [&p](ManaCost const& cost)
        {
            auto const paid = mana::Pay(p.lands_in_play, cost);
            if (!paid) GSG_THROW(error::Code::InvalidAction, "Payment failed after validation: " +
                                 error::describe(paid.error()));
        };

        return std::visit([&]<typename T0>(T0 const& act) -> ApplyResult
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PlayLandAction>)
                {
                    auto const idx = static_cast<std::size_t>(act.index);
                    GSG_ASSERT(idx < p.hand.size(), "Land index out of range");
                    p.lands_in_play.push_back(LandInPlay{ .color = p.hand[idx].color, .tapped = false });
                    p.hand.erase(p.hand.begin() + static_cast<std::ptrdiff_t>(idx));
                    TurnController::MarkLandPlayed(s);
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, ClaimGiftAction>)
                {
                    GiftSP const gift = s.FindDisplayGift(act.gift_id);
                    GSG_ASSERT(gift != nullptr, "Claimed gift not in display");

                    pay(GiftCost(*gift));
                    std::erase(s.display_, gift);
                    gift->AddLocks(1);
                    gift->owner = requester;
                    p.gifts.push_back(gift);
                    TurnController::MarkMainActionTaken(s);
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, StealGiftAction>)
                {
                    auto const [gift, owner] = s.FindOwnedGift(act.gift_id);
                    GSG_ASSERT(gift != nullptr && owner != &p, "Stolen gift has no valid owner");

                    std::size_t const discard_count = StealDiscardCount(*gift, p);
                    GSG_ASSERT(p.hand.size() >= discard_count, "Hand cannot cover the lock cost");

                    pay(GiftCost(*gift));

                    std::vector<std::size_t> idxs;
                    if (act.discard_indices)
                    {
                        std::ranges::transform(*act.discard_indices, std::back_inserter(idxs),
                                               [](std::int64_t i) { return static_cast<std::size_t>(i); });
                    }
                    else
                    {
                        for (std::size_t i{}; i < discard_count; ++i) idxs.push_back(i);
                    }
                    for (Land const& l : util::EraseIndices(p.hand, std::move(idxs)))
                    {
                        s.discard_.push_back(l);
                    }

                    std::erase(owner->gifts, gift);
                    gift->owner = requester;
                    if (act.add_lock && p.Has(BuildingType::Crowbar))
                    {
                        gift->AddLocks(1);
                    }
                    p.gifts.push_back(gift);
                    TurnController::MarkMainActionTaken(s);
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, WrapGiftAction>)
                {
                    GiftSP const gift = HasGift(p, act.gift_id);
                    GSG_ASSERT(gift != nullptr, "Wrapped gift not owned by requester");

                    pay(WrapCost());
                    gift->AddLocks(p.Has(BuildingType::ReinforcedRibbon) ? 2 : 1);
                    TurnController::MarkMainActionTaken(s);
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, BuildBuildingAction>)
                {
                    GSG_ASSERT(!p.building, "Building already present");
                    pay(BuildingCost(act.building));
                    p.building = act.building;
                    TurnController::MarkMainActionTaken(s);
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, RecycleAction>)
                {
                    std::size_t const count = p.Has(BuildingType::SupplyWarehouse) ? 2 : 1;
                    if (auto drawn = s.DrawCards(p, count); !drawn)
                        return std::unexpected(std::move(drawn.error()));
                    p.pending_discard = 1;
                    TurnController::MarkMainActionTaken(s);
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, DiscardAction>)
                {
                    GSG_ASSERT(p.pending_discard > 0, "Discard without a pending discard");
                    s.DiscardFromHand(p, static_cast<std::size_t>(act.index));
                    --p.pending_discard;
                    return MoveOutcome::Applied;
                }
                else if constexpr (std::is_same_v<T, EndTurnAction>)
                {
                    if (auto started = TurnController::EndTurn(s); !started)
                        return std::unexpected(std::move(started.error()));
                    return MoveOutcome::TurnEnded;
                }
                else
                {
                    static_assert(UnhandledAction<T>, "Apply is missing an action kind");
                }
            }, a);
    }

} // siege
