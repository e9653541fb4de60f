//
// Exception.hpp
//

#ifndef GIFTSIEGE_EXCEPTION_HPP
#define GIFTSIEGE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <stdexcept>
#include <utility>
#include "Types.hpp"

namespace siege::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // session state misuse (not user invalid move)
        InvalidAction, // action reached Apply without passing Validate
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define GSG_THROW(code_enum, msg) ::siege::core::error::fail((code_enum), (msg))
#define GSG_ASSERT(cond, msg) do { if(!(cond)) ::siege::core::error::fail(::siege::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by the check that raises them.
    enum class RuleViolationCode : std::uint16_t
    {
        // Turn guard
        GameEnded,
        NotYourTurn,
        ActionAlreadyTaken,
        DiscardRequired,
        DiscardAlreadyPending,
        NoDiscardPending,

        // Lands
        LandAlreadyPlayed,
        LandLimitReached,
        InvalidHandIndex,

        // Gifts
        GiftNotAvailable,
        GiftNotFound,
        NotYourGift,
        CannotStealOwnGift,
        GiftSealed,
        InsufficientHandForDiscard,
        InvalidDiscardSelection,

        // Payment
        InsufficientMana,
        InsufficientColor,

        // Buildings
        BuildingAlreadyBuilt,
        UnknownBuildingType,

        // Dispatch
        UnknownAction,
        InvalidPayload,

        // Session
        DeckEmpty,
        SessionNotFound,
        PlayerNotFound,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<MemberId> actor{};
        std::optional<MemberId> turn_owner{};
        std::optional<GiftId> gift{};
        std::optional<Color> color{};
        std::optional<std::string> field{}; // payload field at fault

        // Small integers useful in error messages
        std::optional<std::int64_t> index{};
        std::optional<std::uint32_t> needed{};
        std::optional<std::uint32_t> available{};

        auto with_actor(MemberId id) -> RuleViolation&
        {
            actor = std::move(id);
            return *this;
        }

        auto with_turn_owner(MemberId id) -> RuleViolation&
        {
            turn_owner = std::move(id);
            return *this;
        }

        auto with_gift(GiftId id) -> RuleViolation&
        {
            gift = std::move(id);
            return *this;
        }

        auto with_color(Color c) -> RuleViolation&
        {
            color = c;
            return *this;
        }

        auto with_field(std::string f) -> RuleViolation&
        {
            field = std::move(f);
            return *this;
        }

        auto with_index(std::int64_t i) -> RuleViolation&
        {
            index = i;
            return *this;
        }

        auto with_needed(std::uint32_t n) -> RuleViolation&
        {
            needed = n;
            return *this;
        }

        auto with_available(std::uint32_t n) -> RuleViolation&
        {
            available = n;
            return *this;
        }
    };

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::GameEnded: return "The game has ended";
        case E::NotYourTurn: return "It is not your turn";
        case E::ActionAlreadyTaken: return "You already took a main action this turn";
        case E::DiscardRequired: return "You must discard first";
        case E::DiscardAlreadyPending: return "You must discard before recycling again";
        case E::NoDiscardPending: return "No discard is required";

        case E::LandAlreadyPlayed: return "You already played a land this turn";
        case E::LandLimitReached: return "Land limit reached";
        case E::InvalidHandIndex: return "Invalid hand selection";

        case E::GiftNotAvailable: return "Gift not available";
        case E::GiftNotFound: return "Gift not found";
        case E::NotYourGift: return "You do not own that gift";
        case E::CannotStealOwnGift: return "You must steal from another player";
        case E::GiftSealed: return "That gift is sealed and cannot be stolen";
        case E::InsufficientHandForDiscard: return "Not enough cards in hand to pay lock cost";
        case E::InvalidDiscardSelection: return "Invalid discard selection";

        case E::InsufficientMana: return "Not enough untapped lands";
        case E::InsufficientColor: return "Not enough required color mana";

        case E::BuildingAlreadyBuilt: return "You already built a building";
        case E::UnknownBuildingType: return "Unknown building type";

        case E::UnknownAction: return "Unknown action";
        case E::InvalidPayload: return "Malformed action payload";

        case E::DeckEmpty: return "The deck is empty";
        case E::SessionNotFound: return "Game not found";
        case E::PlayerNotFound: return "Player not found";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.field) s += std::format(" | field={}", *v.field);
        if (v.actor) s += std::format(" | actor={}", *v.actor);
        if (v.turn_owner) s += std::format(" | turn={}", *v.turn_owner);
        if (v.gift) s += std::format(" | gift={}", *v.gift);
        if (v.color) s += std::format(" | color={}", to_string(*v.color));
        if (v.index) s += std::format(" | index={}", *v.index);
        if (v.needed) s += std::format(" | need={}", *v.needed);
        if (v.available) s += std::format(" | have={}", *v.available);
        return s;
    }

    using CheckResult = std::expected<void, RuleViolation>;

    template <typename T>
    using Result = std::expected<T, RuleViolation>;
}

#endif //GIFTSIEGE_EXCEPTION_HPP
