//
// Types.hpp
//

#ifndef GIFTSIEGE_TYPES_HPP
#define GIFTSIEGE_TYPES_HPP

#define GSG_ALLOW_EXCEPTIONS true
#define GSG_ENABLE_TEST_HOOKS true

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace siege::core::constants
{
    inline constexpr std::uint8_t MaxLocks = 5;
    inline constexpr std::size_t ColorCount = 5;
}

namespace siege::core
{
    using MemberId  = std::string;
    using GiftId    = std::string;
    using SessionId = std::string;

    enum class Color : uint8_t
    {
        White = 0,
        Blue,
        Black,
        Red,
        Green
    };

    inline constexpr std::array<Color, constants::ColorCount> AllColors{
        Color::White, Color::Blue, Color::Black, Color::Red, Color::Green
    };

    enum class GiftClass : uint8_t
    {
        I = 0,
        II,
        III
    };

    enum class BuildingType : uint8_t
    {
        ThiefsGloves = 0, // steal discard cost -2
        Crowbar,          // steal may add a lock
        ReinforcedRibbon, // wrap adds 2 locks
        SupplyWarehouse   // recycle draws 2
    };

    enum class Status : uint8_t
    {
        Active = 0,
        Ended
    };

    // A land in hand has no tap state.
    struct Land
    {
        Color color{};
    };

    struct LandInPlay
    {
        Color color{};
        bool tapped{false};
    };

    struct Gift
    {
        GiftId id;
        Color color{};
        GiftClass gift_class{};
        uint8_t locks{0};
        std::optional<MemberId> owner{};

        [[nodiscard]]
        auto Sealed() const noexcept -> bool { return locks >= constants::MaxLocks; }

        auto AddLocks(uint8_t n) noexcept -> void
        {
            unsigned const total = static_cast<unsigned>(locks) + n;
            locks = static_cast<uint8_t>(total > constants::MaxLocks ? constants::MaxLocks : total);
        }
    };
    using GiftSP  = std::shared_ptr<Gift>;
    using CGiftSP = std::shared_ptr<Gift const>;

    inline constexpr auto GiftValue(GiftClass c) noexcept -> uint32_t
    {
        return static_cast<uint32_t>(c) + 1;
    }

    struct PlayerState
    {
        MemberId member_id;
        std::string name;
        std::vector<Land> hand;
        std::vector<LandInPlay> lands_in_play;
        std::vector<GiftSP> gifts;
        std::optional<BuildingType> building{};
        uint8_t pending_discard{0};

        [[nodiscard]]
        auto Score() const -> uint32_t
        {
            uint32_t score = 0;
            for (GiftSP const& g : gifts) score += GiftValue(g->gift_class);
            return score;
        }

        [[nodiscard]]
        auto Has(BuildingType b) const noexcept -> bool { return building && *building == b; }
    };

    struct TurnState
    {
        MemberId player_id;
        uint32_t number{1};
        bool has_played_land{false};
        bool has_taken_action{false};
    };

    // One member as handed over by the room collaborator, in turn order.
    struct Seat
    {
        MemberId member_id;
        std::string name;
    };

    struct Config
    {
        uint8_t  gifts_in_display{8};
        uint8_t  initial_hand{5};
        uint8_t  hand_limit{7};
        uint8_t  land_limit{10};
        uint16_t deck_size_per_color{12};
        uint16_t gift_pool_size{24};
        uint64_t seed{std::random_device{}()};
    };

    inline auto to_string(Color c) -> std::string_view
    {
        switch (c)
        {
        case Color::White: return "W";
        case Color::Blue:  return "U";
        case Color::Black: return "B";
        case Color::Red:   return "R";
        case Color::Green: return "G";
        }
        return "?";
    }

    inline auto to_string(GiftClass c) -> std::string_view
    {
        switch (c)
        {
        case GiftClass::I:   return "I";
        case GiftClass::II:  return "II";
        case GiftClass::III: return "III";
        }
        return "?";
    }

    inline auto to_string(BuildingType b) -> std::string_view
    {
        switch (b)
        {
        case BuildingType::ThiefsGloves:     return "thiefs_gloves";
        case BuildingType::Crowbar:          return "crowbar";
        case BuildingType::ReinforcedRibbon: return "reinforced_ribbon";
        case BuildingType::SupplyWarehouse:  return "supply_warehouse";
        }
        return "?";
    }

    inline auto to_string(Status s) -> std::string_view
    {
        return s == Status::Active ? "active" : "ended";
    }

    inline auto ParseBuilding(std::string_view s) -> std::optional<BuildingType>
    {
        for (BuildingType b : {BuildingType::ThiefsGloves, BuildingType::Crowbar,
                               BuildingType::ReinforcedRibbon, BuildingType::SupplyWarehouse})
        {
            if (to_string(b) == s) return b;
        }
        return std::nullopt;
    }
}

#endif //GIFTSIEGE_TYPES_HPP
