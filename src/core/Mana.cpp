//
// Mana.cpp
//

#include "Mana.hpp"

#include <algorithm>
#include <ranges>

namespace siege::core::mana
{
    using error::RuleViolationCode;
    using error::Viol;

    auto CountUntapped(std::span<LandInPlay const> lands) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(lands,
            [](LandInPlay const& l) { return !l.tapped; }));
    }

    auto SelectLands(std::span<LandInPlay const> lands, ManaCost const& cost)
        -> error::Result<std::vector<std::size_t>>
    {
        GSG_ASSERT(cost.color_amount <= cost.total, "Color requirement larger than total cost");

        std::size_t const untapped = CountUntapped(lands);
        if (untapped < cost.total)
            return std::unexpected(Viol(RuleViolationCode::InsufficientMana)
                                   .with_needed(cost.total)
                                   .with_available(static_cast<std::uint32_t>(untapped)));

        std::vector<std::size_t> chosen;
        chosen.reserve(cost.total);

        if (cost.color && cost.color_amount > 0)
        {
            for (std::size_t i{}; i < lands.size() && chosen.size() < cost.color_amount; ++i)
            {
                if (!lands[i].tapped && lands[i].color == *cost.color) chosen.push_back(i);
            }
            if (chosen.size() < cost.color_amount)
                return std::unexpected(Viol(RuleViolationCode::InsufficientColor)
                                       .with_color(*cost.color)
                                       .with_needed(cost.color_amount)
                                       .with_available(static_cast<std::uint32_t>(chosen.size())));
        }

        for (std::size_t i{}; i < lands.size() && chosen.size() < cost.total; ++i)
        {
            if (lands[i].tapped) continue;
            if (std::ranges::find(chosen, i) != chosen.end()) continue;
            chosen.push_back(i);
        }

        GSG_ASSERT(chosen.size() == cost.total, "Selection does not cover the cost");
        std::ranges::sort(chosen);
        return chosen;
    }

    auto TapLands(std::span<LandInPlay> lands, std::span<std::size_t const> selection) -> void
    {
        for (std::size_t const i : selection)
        {
            GSG_ASSERT(i < lands.size(), "Selected land out of range");
            GSG_ASSERT(!lands[i].tapped, "Selected land already tapped");
        }
        for (std::size_t const i : selection) lands[i].tapped = true;
    }

    auto Pay(std::span<LandInPlay> lands, ManaCost const& cost) -> error::CheckResult
    {
        auto selection = SelectLands(std::span<LandInPlay const>{lands.data(), lands.size()}, cost);
        if (!selection) return std::unexpected(std::move(selection.error()));
        TapLands(lands, *selection);
        return {};
    }
}
