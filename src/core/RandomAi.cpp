//
// RandomAi.cpp
//

#include "RandomAi.hpp"

#include <ranges>

#include "GiftRules.hpp"
#include "Mana.hpp"

namespace siege::core
{
    RandomAI::RandomAI(uint64_t rng_seed, uint8_t land_limit):
        rng_(rng_seed), land_limit_(land_limit) {}

    static auto Affordable(ViewerView const& me, ManaCost const& cost) -> bool
    {
        return mana::SelectLands(me.lands_in_play, cost).has_value();
    }

    auto RandomAI::Play(SnapshotCSP snapshot) -> PlayerAction
    {
        GSG_ASSERT(snapshot != nullptr, "RandomAI needs a snapshot");
        GameSnapshot const& s = *snapshot;
        ViewerView const& me = s.viewer;

        if (me.pending_discard > 0 && !me.hand.empty())
        {
            return DiscardAction{ .index = static_cast<std::int64_t>(pick(me.hand)) };
        }

        if (!s.turn.has_played_land && !me.hand.empty() && me.lands_in_play.size() < land_limit_)
        {
            return PlayLandAction{ .index = static_cast<std::int64_t>(pick(me.hand)) };
        }

        if (!s.turn.has_taken_action)
        {
            return MainAction(s);
        }
        return EndTurnAction{};
    }

    auto RandomAI::MainAction(GameSnapshot const& s) -> PlayerAction
    {
        ViewerView const& me = s.viewer;
        std::vector<PlayerAction> options;

        if (!me.building)
        {
            for (BuildingType const b : {BuildingType::ThiefsGloves, BuildingType::Crowbar,
                                         BuildingType::ReinforcedRibbon, BuildingType::SupplyWarehouse})
            {
                if (Affordable(me, GiftRules::BuildingCost(b)))
                    options.emplace_back(BuildBuildingAction{ .building = b });
            }
        }

        for (GiftView const& g : s.gifts_display)
        {
            if (Affordable(me, GiftRules::GiftCost(g.gift_class, g.color)))
                options.emplace_back(ClaimGiftAction{ .gift_id = g.gift_id });
        }

        bool const gloves = me.building == BuildingType::ThiefsGloves;
        bool const can_wrap = Affordable(me, GiftRules::WrapCost());
        for (PlayerView const& p : s.players)
        {
            bool const mine = p.member_id == me.member_id;
            for (GiftView const& g : p.gifts | std::views::filter([](GiftView const& gv) { return !gv.sealed; }))
            {
                if (mine)
                {
                    if (can_wrap) options.emplace_back(WrapGiftAction{ .gift_id = g.gift_id });
                    continue;
                }
                if (GiftRules::StealDiscardCount(g.locks, gloves) <= me.hand.size() &&
                    Affordable(me, GiftRules::GiftCost(g.gift_class, g.color)))
                {
                    options.emplace_back(StealGiftAction{ .gift_id = g.gift_id, .add_lock = true });
                }
            }
        }

        if (s.deck_count > 0) options.emplace_back(RecycleAction{});

        if (options.empty()) return EndTurnAction{};
        return options[pick(options)];
    }
}
