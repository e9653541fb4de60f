//
// Player.hpp
//

#ifndef GIFTSIEGE_PLAYER_HPP
#define GIFTSIEGE_PLAYER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace siege::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called whenever the snapshot says it is this member's turn.
        virtual auto Play(SnapshotCSP snapshot) -> PlayerAction = 0;
    };
}
#endif //GIFTSIEGE_PLAYER_HPP
