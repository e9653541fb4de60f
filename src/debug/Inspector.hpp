//
// Inspector.hpp
//

#ifndef GIFTSIEGE_INSPECTOR_HPP
#define GIFTSIEGE_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Session.hpp"

namespace siege::core::debug
{
    struct Inspector
    {
        // Raw, unprojected view of a session. Pointers stay valid until the next mutation.
        struct SnapshotAll
        {
            std::vector<Land> deck;
            std::vector<Land> discard;
            std::vector<PlayerState const*> players;
            std::vector<Gift const*> display;
            TurnState turn{};
            Status status{};
            Config cfg{};
        };

        static inline auto Gather(Session const& s) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.deck = s.deck_;
            ret.discard = s.discard_;
            ret.turn = s.turn_;
            ret.status = s.status_;
            ret.cfg = s.cfg_;

            ret.players.reserve(s.players_.size());
            std::ranges::transform(s.players_, std::back_inserter(ret.players),
                                   [](PlayerState const& p) -> PlayerState const* { return &p; });

            ret.display.reserve(s.display_.size());
            std::ranges::transform(std::as_const(s.display_), std::back_inserter(ret.display),
                                   [](GiftSP const& g) -> Gift const* { return g.get(); });
            return ret;
        }

#if GSG_ENABLE_TEST_HOOKS == true
        // Direct access for scenario setup in tests. Callers keep the invariants themselves.
        struct Handles
        {
            std::vector<Land>& deck;
            std::vector<Land>& discard;
            std::vector<PlayerState>& players;
            std::vector<GiftSP>& display;
            TurnState& turn;
            Status& status;
        };

        static inline auto Edit(Session& s) -> Handles
        {
            return Handles{ s.deck_, s.discard_, s.players_, s.display_, s.turn_, s.status_ };
        }
#endif
    };
}

#endif //GIFTSIEGE_INSPECTOR_HPP
