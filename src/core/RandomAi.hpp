//
// RandomAi.hpp
//

#ifndef GIFTSIEGE_RANDOMAI_HPP
#define GIFTSIEGE_RANDOMAI_HPP

#include <random>

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace siege::core
{
    // Plays a random action the rules would accept, judged from the snapshot alone.
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed, uint8_t land_limit = Config{}.land_limit);

        auto Play(SnapshotCSP snapshot) -> PlayerAction override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto MainAction(GameSnapshot const&) -> PlayerAction;

    private:
        std::mt19937 rng_;
        uint8_t land_limit_;
    };
}

#endif //GIFTSIEGE_RANDOMAI_HPP
