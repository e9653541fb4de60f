//
// Rules.hpp
//

#ifndef GIFTSIEGE_RULES_HPP
#define GIFTSIEGE_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace siege::core
{
    //forward declaration
    class Session;

    class Rules
    {
    public:
        using CheckResult = error::CheckResult;
        using ApplyResult = error::Result<MoveOutcome>;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Never mutates; every check an action needs happens here.
        virtual auto Validate(Session const& s, MemberId const& requester,
                              PlayerAction const& a) const -> CheckResult = 0;

        // Mutates a validated action in full. The only failure left is the deck
        // running dry, which ends the session and is still reported to the caller.
        // Throws only for engine misuse / broken invariants.
        virtual auto Apply(Session& s, MemberId const& requester,
                           PlayerAction const& a) -> ApplyResult = 0;
    };
}

#endif //GIFTSIEGE_RULES_HPP
