//
// codec.hpp
//

#ifndef GIFTSIEGE_CODEC_HPP
#define GIFTSIEGE_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Dispatcher.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/siege_net_generated.h"

namespace siege::core::net
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    // Decoded frames, detached from the receive buffer.
    struct HelloFrame
    {
        std::uint64_t msg_id{};
        MemberId member_id;
        std::string name;
    };

    struct ActionFrame
    {
        std::uint64_t msg_id{};
        SessionId session_id;
        std::string action;
        Payload payload;
    };

    struct SnapshotFrame
    {
        std::uint64_t msg_id{};
        GameSnapshot snapshot;
    };

    struct ViolationFrame
    {
        std::uint64_t msg_id{};
        error::RuleViolationCode code{};
        std::string text;
    };

    using Frame = std::variant<HelloFrame, ActionFrame, SnapshotFrame, ViolationFrame>;

    auto ToFbColor(Color c) noexcept -> siege::gen::net::Color;
    auto ToFbGiftClass(GiftClass c) noexcept -> siege::gen::net::GiftClass;
    auto ToFbBuilding(std::optional<BuildingType> b) noexcept -> siege::gen::net::Building;
    auto ToFbStatus(Status s) noexcept -> siege::gen::net::Status;

    auto FromFbColor(siege::gen::net::Color c) noexcept -> Color;
    auto FromFbGiftClass(siege::gen::net::GiftClass c) noexcept -> GiftClass;
    auto FromFbBuilding(siege::gen::net::Building b) noexcept -> std::optional<BuildingType>;
    auto FromFbStatus(siege::gen::net::Status s) noexcept -> Status;

    // --- Outbound builders (client -> server) ---

    auto BuildHello(MemberId const& member_id, std::string_view name, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildActionRequest(SessionId const& session_id,
                            std::string_view action_name,
                            Payload const& payload,
                            std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // Typed convenience over BuildActionRequest.
    auto BuildAction(SessionId const& session_id, PlayerAction const& action, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Outbound builders (server -> client) ---

    auto BuildSnapshot(GameSnapshot const& snap, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode ---

    // Verifies the buffer before touching it; a truncated or hostile frame is a ParseError.
    auto DecodeFrame(std::span<std::byte const> bytes) -> std::expected<Frame, ParseError>;
} // namespace siege::core::net


#endif //GIFTSIEGE_CODEC_HPP
