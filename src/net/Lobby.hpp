//
// Lobby.hpp
//

#ifndef GIFTSIEGE_LOBBY_HPP
#define GIFTSIEGE_LOBBY_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../core/Types.hpp"

namespace siege::core::net
{
    struct Room
    {
        std::string room_id;
        std::vector<Seat> seats; // arrival order == turn order
    };

    // Seats greeted members into rooms of a fixed size, first come first seated.
    // Not synchronized; the server guards it with its own lock.
    class Lobby
    {
    public:
        explicit Lobby(std::size_t room_size);

        // Returns the room this arrival completed, if any. A member already waiting is ignored.
        auto Join(Seat seat) -> std::optional<Room>;

        // Drops a waiting member. False if they were not waiting.
        auto Leave(MemberId const& member_id) -> bool;

        auto IsWaiting(MemberId const& member_id) const -> bool;
        auto Waiting() const noexcept -> std::size_t { return waiting_.size(); }
        auto RoomSize() const noexcept -> std::size_t { return room_size_; }

    private:
        std::size_t room_size_;
        std::vector<Seat> waiting_;
        std::uint64_t rooms_formed_{0};
    };
}

#endif //GIFTSIEGE_LOBBY_HPP
