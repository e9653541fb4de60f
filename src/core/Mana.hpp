//
// Mana.hpp
//

#ifndef GIFTSIEGE_MANA_HPP
#define GIFTSIEGE_MANA_HPP

#include <span>
#include <vector>

#include "Types.hpp"
#include "Exception.hpp"

namespace siege::core
{
    // total lands to tap, of which color_amount must match color (when set)
    struct ManaCost
    {
        uint8_t total{};
        uint8_t color_amount{};
        std::optional<Color> color{};
    };

    namespace mana
    {
        // Picks the lands a payment would tap, in play order, without touching them.
        // Required-color lands are taken first, the remainder is filled with the
        // earliest untapped lands not already chosen.
        auto SelectLands(std::span<LandInPlay const> lands, ManaCost const& cost)
            -> error::Result<std::vector<std::size_t>>;

        // Taps exactly the selected lands. Throws if a selected land is already tapped.
        auto TapLands(std::span<LandInPlay> lands, std::span<std::size_t const> selection) -> void;

        // Select + tap. On failure nothing is tapped.
        auto Pay(std::span<LandInPlay> lands, ManaCost const& cost) -> error::CheckResult;

        auto CountUntapped(std::span<LandInPlay const> lands) -> std::size_t;
    }
}

#endif //GIFTSIEGE_MANA_HPP
