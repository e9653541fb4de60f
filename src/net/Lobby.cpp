//
// Lobby.cpp
//

#include "Lobby.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "../core/Exception.hpp"

namespace siege::core::net
{
    Lobby::Lobby(std::size_t const room_size) :
        room_size_(room_size)
    {
        GSG_ASSERT(room_size_ > 0, "Rooms need at least one seat");
    }

    auto Lobby::Join(Seat seat) -> std::optional<Room>
    {
        if (IsWaiting(seat.member_id)) return std::nullopt;

        waiting_.push_back(std::move(seat));
        if (waiting_.size() < room_size_) return std::nullopt;

        Room room{ .room_id = std::format("room-{}", ++rooms_formed_), .seats = {} };
        room.seats.assign(std::make_move_iterator(waiting_.begin()),
                          std::make_move_iterator(waiting_.begin() + static_cast<std::ptrdiff_t>(room_size_)));
        waiting_.erase(waiting_.begin(), waiting_.begin() + static_cast<std::ptrdiff_t>(room_size_));
        return room;
    }

    auto Lobby::Leave(MemberId const& member_id) -> bool
    {
        return std::erase_if(waiting_, [&member_id](Seat const& s) { return s.member_id == member_id; }) > 0;
    }

    auto Lobby::IsWaiting(MemberId const& member_id) const -> bool
    {
        return std::ranges::any_of(waiting_, [&member_id](Seat const& s) { return s.member_id == member_id; });
    }
}
