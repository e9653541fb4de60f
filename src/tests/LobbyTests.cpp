#include <gtest/gtest.h>

#include "../core/Exception.hpp"
#include "../net/Lobby.hpp"

using namespace siege::core;
using siege::core::net::Lobby;

namespace
{
    auto S(std::string id) -> Seat
    {
        return Seat{ .member_id = id, .name = "name-" + id };
    }
}

TEST(Lobby, FillsRoomsInArrivalOrder)
{
    Lobby lobby{3};
    EXPECT_FALSE(lobby.Join(S("c")).has_value());
    EXPECT_FALSE(lobby.Join(S("a")).has_value());
    EXPECT_EQ(lobby.Waiting(), 2u);

    auto const room = lobby.Join(S("b"));
    ASSERT_TRUE(room.has_value());
    EXPECT_EQ(room->room_id, "room-1");
    ASSERT_EQ(room->seats.size(), 3u);
    EXPECT_EQ(room->seats[0].member_id, "c");
    EXPECT_EQ(room->seats[1].member_id, "a");
    EXPECT_EQ(room->seats[2].member_id, "b");
    EXPECT_EQ(room->seats[2].name, "name-b");
    EXPECT_EQ(lobby.Waiting(), 0u);

    (void)lobby.Join(S("d"));
    (void)lobby.Join(S("e"));
    auto const second = lobby.Join(S("f"));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->room_id, "room-2");
}

TEST(Lobby, DuplicateArrivalIsIgnored)
{
    Lobby lobby{2};
    EXPECT_FALSE(lobby.Join(S("a")).has_value());
    EXPECT_FALSE(lobby.Join(S("a")).has_value());
    EXPECT_EQ(lobby.Waiting(), 1u);
    EXPECT_TRUE(lobby.IsWaiting("a"));
}

TEST(Lobby, LeavingFreesTheSeat)
{
    Lobby lobby{2};
    (void)lobby.Join(S("a"));
    EXPECT_TRUE(lobby.Leave("a"));
    EXPECT_FALSE(lobby.Leave("a"));
    EXPECT_FALSE(lobby.IsWaiting("a"));

    EXPECT_FALSE(lobby.Join(S("b")).has_value());
    auto const room = lobby.Join(S("c"));
    ASSERT_TRUE(room.has_value());
    EXPECT_EQ(room->seats[0].member_id, "b");
}

TEST(Lobby, SingleSeatRoomsFormImmediately)
{
    Lobby lobby{1};
    EXPECT_TRUE(lobby.Join(S("solo")).has_value());
    EXPECT_EQ(lobby.RoomSize(), 1u);
}

TEST(Lobby, ZeroSizedRoomsAreRefused)
{
    EXPECT_THROW(Lobby{0}, error::AssertionError);
}
