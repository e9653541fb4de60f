//
// Dispatcher.hpp
//

#ifndef GIFTSIEGE_DISPATCHER_HPP
#define GIFTSIEGE_DISPATCHER_HPP

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "Actions.hpp"
#include "Exception.hpp"
#include "Rules.hpp"

namespace siege::core
{
    class Session;

    // Loosely typed request body as it arrives from the transport.
    using PayloadValue = std::variant<std::monostate, bool, std::int64_t, std::string, std::vector<std::int64_t>>;
    using Payload      = std::map<std::string, PayloadValue, std::less<>>;

    class ActionDispatcher
    {
    public:
        explicit ActionDispatcher(std::unique_ptr<Rules> rules);

        // Name + payload -> one strongly typed action. UnknownAction / InvalidPayload /
        // UnknownBuildingType on failure; no session state is consulted.
        static auto Parse(std::string_view action_name, Payload const& payload)
            -> error::Result<PlayerAction>;

        // Inverse of Parse, used by clients to put an action on the wire.
        static auto ToPayload(PlayerAction const& action) -> Payload;

        // Validate then apply; a rejected action leaves the session untouched.
        auto Dispatch(Session& s, MemberId const& requester, PlayerAction const& action)
            -> Rules::ApplyResult;

        auto Dispatch(Session& s, MemberId const& requester,
                      std::string_view action_name, Payload const& payload) -> Rules::ApplyResult;

    private:
        std::unique_ptr<Rules> rules_;
    };
}

#endif //GIFTSIEGE_DISPATCHER_HPP
