//
// Invariants.hpp
//

#ifndef GIFTSIEGE_INVARIANTS_HPP
#define GIFTSIEGE_INVARIANTS_HPP

#include "../core/Session.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>
#include <ranges>
#include <unordered_set>
#include <vector>

namespace siege::core::debug
{
    // Whole-session consistency checks, run after every step by the self-play tests.
    // Throws AssertionError naming the first broken rule.
    inline auto CheckInvariants(Session const& session) -> void
    {
#if GSG_ENABLE_TEST_HOOKS == false
        (void)session;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(session);

    // 1) Exactly one turn owner, and it is a member
    {
        auto const owners = std::ranges::count(s.players, s.turn.player_id,
                                               [](PlayerState const* p) { return p->member_id; });
        GSG_ASSERT(owners == 1, std::format("Turn owner {} seated {} times", s.turn.player_id, owners));
    }

    // 2) Every gift sits in exactly one place and its owner field agrees
    std::size_t gifts = 0;
    {
        std::unordered_set<Gift const*> seen;
        for (Gift const* g : s.display)
        {
            GSG_ASSERT(seen.insert(g).second, std::format("Gift {} appears twice", g->id));
            GSG_ASSERT(!g->owner.has_value(), std::format("Display gift {} has an owner", g->id));
            GSG_ASSERT(g->locks == 0, std::format("Display gift {} is locked", g->id));
        }
        for (PlayerState const* p : s.players)
        {
            for (GiftSP const& g : p->gifts)
            {
                GSG_ASSERT(seen.insert(g.get()).second, std::format("Gift {} appears twice", g->id));
                GSG_ASSERT(g->owner == p->member_id,
                           std::format("Gift {} held by {} but owned by {}", g->id, p->member_id,
                                       g->owner.value_or("<none>")));
                // 3) Owned gifts carry at least the claim lock
                GSG_ASSERT(g->locks >= 1 && g->locks <= constants::MaxLocks,
                           std::format("Gift {} has {} locks", g->id, g->locks));
            }
        }
        gifts = seen.size();
    }

    // 4) Gift count is fixed at setup
    {
        std::size_t const expected = std::min<std::size_t>(s.cfg.gift_pool_size, s.cfg.gifts_in_display);
        GSG_ASSERT(gifts == expected, std::format("{} gifts in play, expected {}", gifts, expected));
    }

    // 5) Lands: cap, pending discard bounded by what can be paid, conservation
    {
        std::size_t lands = s.deck.size() + s.discard.size();
        for (PlayerState const* p : s.players)
        {
            GSG_ASSERT(p->lands_in_play.size() <= s.cfg.land_limit,
                       std::format("{} has {} lands in play", p->member_id, p->lands_in_play.size()));
            GSG_ASSERT(p->pending_discard <= 1,
                       std::format("{} owes {} discards", p->member_id, p->pending_discard));
            lands += p->hand.size() + p->lands_in_play.size();
        }
        std::size_t const total = constants::ColorCount * s.cfg.deck_size_per_color;
        GSG_ASSERT(lands == total, std::format("{} land cards accounted for, expected {}", lands, total));
    }

    // 6) Only the turn owner can owe a discard while the game is running
    if (s.status == Status::Active)
    {
        for (PlayerState const* p : s.players)
        {
            GSG_ASSERT(p->pending_discard == 0 || p->member_id == s.turn.player_id,
                       std::format("{} owes a discard outside their turn", p->member_id));
        }
    }

#endif // GSG_ENABLE_TEST_HOOKS == true
    }
}
#endif //GIFTSIEGE_INVARIANTS_HPP
