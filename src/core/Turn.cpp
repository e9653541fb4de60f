//
// Turn.cpp
//

#include "Turn.hpp"

namespace siege::core
{
    using error::RuleViolationCode;
    using error::Viol;

    auto TurnController::RequireTurn(Session const& s, MemberId const& requester) -> CheckResult
    {
        if (s.status_ != Status::Active)
            return std::unexpected(Viol(RuleViolationCode::GameEnded).with_actor(requester));

        if (s.turn_.player_id != requester)
            return std::unexpected(Viol(RuleViolationCode::NotYourTurn)
                                   .with_actor(requester).with_turn_owner(s.turn_.player_id));
        return {};
    }

    auto TurnController::RequireMainAction(Session const& s, MemberId const& requester) -> CheckResult
    {
        if (auto ok = RequireTurn(s, requester); !ok) return ok;

        if (s.turn_.has_taken_action)
            return std::unexpected(Viol(RuleViolationCode::ActionAlreadyTaken).with_actor(requester));
        return {};
    }

    auto TurnController::CanEndTurn(Session const& s, MemberId const& requester) -> CheckResult
    {
        if (auto ok = RequireTurn(s, requester); !ok) return ok;

        PlayerState const* p = s.FindPlayer(requester);
        GSG_ASSERT(p != nullptr, "Turn owner is not a member");
        if (p->pending_discard > 0)
            return std::unexpected(Viol(RuleViolationCode::DiscardRequired)
                                   .with_actor(requester).with_needed(p->pending_discard));
        return {};
    }

    auto TurnController::StartTurn(Session& s) -> CheckResult
    {
        PlayerState& p = s.CurrentPlayer();
        for (LandInPlay& land : p.lands_in_play)
        {
            land.tapped = false;
        }
        s.turn_.has_played_land = false;
        s.turn_.has_taken_action = false;
        return s.DrawCards(p, 1);
    }

    auto TurnController::EndTurn(Session& s) -> CheckResult
    {
        PlayerState& p = s.CurrentPlayer();
        GSG_ASSERT(p.pending_discard == 0, "EndTurn with a discard pending");

        // Tail trim; the player gets no say in which cards go.
        while (p.hand.size() > s.cfg_.hand_limit)
        {
            s.DiscardFromHand(p, p.hand.size() - 1);
        }

        std::size_t const next = NextSeat(s, s.PlayerIndex(s.turn_.player_id));
        s.turn_ = TurnState{
            .player_id = s.players_[next].member_id,
            .number = s.turn_.number + 1
        };
        return StartTurn(s);
    }
}
