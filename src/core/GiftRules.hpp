//
// GiftRules.hpp
//

#ifndef GIFTSIEGE_GIFTRULES_HPP
#define GIFTSIEGE_GIFTRULES_HPP
#include "Rules.hpp"
#include "Mana.hpp"

namespace siege::core
{
    class GiftRules final : public Rules
    {
    public:
        auto Validate(Session const& s, MemberId const& requester,
                      PlayerAction const& a) const -> CheckResult override;
        auto Apply(Session& s, MemberId const& requester,
                   PlayerAction const& a) -> ApplyResult override;

        // I: 3/2, II: 5/3, III: 7/4, in the gift's own color
        static auto GiftCost(GiftClass c, Color color) -> ManaCost;
        static auto GiftCost(Gift const& g) -> ManaCost { return GiftCost(g.gift_class, g.color); }
        // 4/2 in the building's color
        static auto BuildingCost(BuildingType b) -> ManaCost;
        static auto BuildingColor(BuildingType b) -> Color;
        // 2, any color
        static auto WrapCost() -> ManaCost;
        // Hand cards a thief must discard: the gift's locks, less 2 with thiefs gloves.
        static auto StealDiscardCount(Gift const& g, PlayerState const& thief) -> std::size_t
        {
            return StealDiscardCount(g.locks, thief.Has(BuildingType::ThiefsGloves));
        }
        static auto StealDiscardCount(uint8_t locks, bool has_gloves) -> std::size_t;
    };
}

#endif //GIFTSIEGE_GIFTRULES_HPP
