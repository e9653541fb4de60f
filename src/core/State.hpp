//
// State.hpp
//

#ifndef GIFTSIEGE_STATE_HPP
#define GIFTSIEGE_STATE_HPP

#include "Types.hpp"

namespace siege::core
{
    struct GiftView
    {
        GiftId gift_id;
        Color color{};
        GiftClass gift_class{};
        uint8_t locks{};
        std::optional<MemberId> owner_id{};
        bool sealed{false};
    };

    struct PlayerView
    {
        MemberId member_id;
        std::string name;
        uint32_t score{};
        uint32_t hand_count{};
        std::vector<LandInPlay> lands_in_play;
        std::vector<GiftView> gifts;
        std::optional<BuildingType> building{};
    };

    struct ViewerView
    {
        MemberId member_id;
        std::string name;
        std::vector<Color> hand;
        std::vector<LandInPlay> lands_in_play;
        std::optional<BuildingType> building{};
        uint8_t pending_discard{};
    };

    // Per-viewer copy of a session, detached from the live state so it can be
    // encoded and sent after the session lock is released.
    struct GameSnapshot
    {
        SessionId game_id;
        std::string room_id;
        Status status{Status::Active};
        std::int64_t created_at_ms{};

        TurnState turn{};

        // for UI: hand counts for everyone, hand contents only in viewer
        std::vector<PlayerView> players;
        std::vector<GiftView> gifts_display;
        ViewerView viewer{};

        uint32_t deck_count{};
    };

    using SnapshotCSP = std::shared_ptr<GameSnapshot const>;

} // namespace siege::core

#endif //GIFTSIEGE_STATE_HPP
