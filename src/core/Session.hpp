//
// Session.hpp
//

#ifndef GIFTSIEGE_SESSION_HPP
#define GIFTSIEGE_SESSION_HPP

#include <algorithm>
#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "State.hpp"
#include "Exception.hpp"

namespace siege::core::debug {struct Inspector;}
namespace siege::core
{
    // Aggregate state of one live game. Mutated only through the rules and the
    // turn controller; everything else gets a projection.
    class Session
    {
    public:
        Session() = delete;
        Session(SessionId id,
                std::string room_id,
                std::vector<Seat> const& seats,
                Config const& config);

        // Fresh read projection for one member. Throws StateError for a non-member.
        auto SnapshotFor(MemberId const& viewer) const -> SnapshotCSP;

        auto Id() const noexcept            -> SessionId const& { return id_; }
        auto RoomId() const noexcept        -> std::string const& { return room_id_; }
        auto StatusNow() const noexcept     -> Status { return status_; }
        auto Turn() const noexcept          -> TurnState const& { return turn_; }
        auto Cfg() const noexcept           -> Config const& { return cfg_; }
        auto DeckCount() const noexcept     -> std::size_t { return deck_.size(); }
        auto PlayerCount() const noexcept   -> std::size_t { return players_.size(); }
        auto Players() const noexcept       -> std::vector<PlayerState> const& { return players_; }
        auto Display() const noexcept       -> std::vector<GiftSP> const& { return display_; }
        auto IsMember(MemberId const& id) const -> bool;

        //allows class to directly access private data on an instance
        friend class GiftRules;
        friend class TurnController;
        friend struct debug::Inspector;

        //returns nullptr if doesnt exist
        auto FindPlayer(MemberId const& id) -> PlayerState*;
        auto FindPlayer(MemberId const& id) const -> PlayerState const*;
        auto FindDisplayGift(GiftId const& id) const -> GiftSP;
        //gift held by any player, paired with its holder
        auto FindOwnedGift(GiftId const& id) -> std::pair<GiftSP, PlayerState*>;
        auto FindOwnedGift(GiftId const& id) const -> std::pair<GiftSP, PlayerState const*>;

        // Draws from the front of the deck one card at a time. Running dry ends
        // the session; cards drawn before that stay in hand.
        auto DrawCards(PlayerState& player, std::size_t count) -> error::CheckResult;
        auto DiscardFromHand(PlayerState& player, std::size_t idx) -> void;
        auto PlayerIndex(MemberId const& id) const -> std::size_t;
        auto CurrentPlayer() -> PlayerState&;
    private:
        //Produces a shuffled deck
        auto BuildDeck() -> void;
        auto BuildGifts() -> void;
        auto DealInitialHands() -> void;
        auto NextGiftId() -> GiftId;
    private:
        Config cfg_;
        std::mt19937_64 rng_;

        SessionId id_;
        std::string room_id_;
        std::chrono::system_clock::time_point created_at_;
        Status status_{Status::Active};

        // Authoritative state
        std::vector<PlayerState> players_;   // seat order == turn order
        std::vector<Land> deck_;             // front is the next draw
        std::vector<Land> discard_;          // cards that left a hand without entering play
        std::vector<GiftSP> display_;        // unowned gifts

        TurnState turn_{};
    };
}
#endif //GIFTSIEGE_SESSION_HPP
