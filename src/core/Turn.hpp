//
// Turn.hpp
//

#ifndef GIFTSIEGE_TURN_HPP
#define GIFTSIEGE_TURN_HPP

#include "Session.hpp"
#include "Exception.hpp"

namespace siege::core
{
    // Owns turn ownership, the per-turn flags and round-robin advancement.
    class TurnController
    {
    public:
        using CheckResult = error::CheckResult;

        // Shared guard for every mutating action: game active, requester owns the turn.
        static auto RequireTurn(Session const& s, MemberId const& requester) -> CheckResult;

        // RequireTurn plus the once-per-turn main action budget.
        static auto RequireMainAction(Session const& s, MemberId const& requester) -> CheckResult;

        static auto CanEndTurn(Session const& s, MemberId const& requester) -> CheckResult;

        static auto MarkMainActionTaken(Session& s) noexcept -> void { s.turn_.has_taken_action = true; }
        static auto MarkLandPlayed(Session& s) noexcept -> void { s.turn_.has_played_land = true; }

        // Untap the turn owner's lands, reset flags, draw one. An empty deck ends the session.
        static auto StartTurn(Session& s) -> CheckResult;

        // Trim the hand from the tail to the hand limit, pass the turn to the next
        // seat and start it. Caller must have checked CanEndTurn.
        static auto EndTurn(Session& s) -> CheckResult;

        static auto NextSeat(Session const& s, std::size_t idx) -> std::size_t
        {
            return (idx + 1) % s.players_.size();
        }
    };
}

#endif //GIFTSIEGE_TURN_HPP
