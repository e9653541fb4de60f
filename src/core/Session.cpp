//
// Session.cpp
//
#include "Session.hpp"

#include <format>
#include <print>
#include <ranges>
#include <unordered_set>
#include <utility>

#include "Turn.hpp"

namespace siege::core
{
    Session::Session(SessionId id,
                     std::string room_id,
                     std::vector<Seat> const& seats,
                     Config const& config) :
        cfg_(config),
        rng_{cfg_.seed},
        id_(std::move(id)),
        room_id_(std::move(room_id)),
        created_at_(std::chrono::system_clock::now())
    {
        GSG_ASSERT(!seats.empty(), "Session needs at least one player");
        std::unordered_set<MemberId> ids;
        for (Seat const& s : seats)
        {
            GSG_ASSERT(ids.insert(s.member_id).second, "Duplicate member in session seats");
            players_.push_back(PlayerState{ .member_id = s.member_id, .name = s.name });
        }

        BuildDeck();
        BuildGifts();
        DealInitialHands();

        turn_ = TurnState{ .player_id = players_.front().member_id, .number = 1 };
        // Turn 1 starts like every other turn. An exhausted deck already ends the game here.
        if (auto const started = TurnController::StartTurn(*this); !started)
        {
            std::print("[session] {} ended during setup: {}\n", id_, error::describe(started.error()));
        }
    }

    auto Session::BuildDeck() -> void
    {
        deck_.clear();
        deck_.reserve(constants::ColorCount * cfg_.deck_size_per_color);
        for (Color const c : AllColors)
        {
            for (std::size_t i{}; i < cfg_.deck_size_per_color; ++i)
            {
                deck_.push_back(Land{c});
            }
        }
        std::ranges::shuffle(deck_, rng_);
    }

    auto Session::NextGiftId() -> GiftId
    {
        return std::format("gift-{:012x}", rng_() & 0xFFFFFFFFFFFFULL);
    }

    auto Session::BuildGifts() -> void
    {
        std::discrete_distribution<int> class_dist{5, 3, 2};
        std::uniform_int_distribution<std::size_t> color_dist{0, constants::ColorCount - 1};

        std::vector<GiftSP> pool;
        pool.reserve(cfg_.gift_pool_size);
        for (std::size_t i{}; i < cfg_.gift_pool_size; ++i)
        {
            auto const gift_class = static_cast<GiftClass>(class_dist(rng_));
            Color const color = AllColors[color_dist(rng_)];
            pool.push_back(std::make_shared<Gift>(Gift{
                .id = NextGiftId(), .color = color, .gift_class = gift_class }));
        }
        std::size_t const shown = std::min<std::size_t>(pool.size(), cfg_.gifts_in_display);
        display_.assign(std::make_move_iterator(pool.begin()),
                        std::make_move_iterator(pool.begin() + static_cast<std::ptrdiff_t>(shown)));
    }

    auto Session::DealInitialHands() -> void
    {
        std::size_t const target = cfg_.initial_hand;
        if (target * players_.size() > deck_.size())
            GSG_THROW(error::Code::State, "Less cards in deck than required to deal initial hands");

        for (PlayerState& p : players_)
        {
            auto const drawn = DrawCards(p, target);
            GSG_ASSERT(drawn.has_value(), "Initial deal ran out of cards");
        }
    }

    auto Session::IsMember(MemberId const& id) const -> bool
    {
        return FindPlayer(id) != nullptr;
    }

    auto Session::FindPlayer(MemberId const& id) -> PlayerState*
    {
        auto const it = std::ranges::find(players_, id, &PlayerState::member_id);
        return it != players_.end() ? &*it : nullptr;
    }

    auto Session::FindPlayer(MemberId const& id) const -> PlayerState const*
    {
        auto const it = std::ranges::find(players_, id, &PlayerState::member_id);
        return it != players_.end() ? &*it : nullptr;
    }

    auto Session::FindDisplayGift(GiftId const& id) const -> GiftSP
    {
        auto const it = std::ranges::find_if(display_, [&id](GiftSP const& g) { return g->id == id; });
        return it != display_.end() ? *it : GiftSP{};
    }

    auto Session::FindOwnedGift(GiftId const& id) -> std::pair<GiftSP, PlayerState*>
    {
        for (PlayerState& p : players_)
        {
            for (GiftSP const& g : p.gifts)
            {
                if (g->id == id) return {g, &p};
            }
        }
        return {GiftSP{}, nullptr};
    }

    auto Session::FindOwnedGift(GiftId const& id) const -> std::pair<GiftSP, PlayerState const*>
    {
        for (PlayerState const& p : players_)
        {
            for (GiftSP const& g : p.gifts)
            {
                if (g->id == id) return {g, &p};
            }
        }
        return {GiftSP{}, nullptr};
    }

    auto Session::PlayerIndex(MemberId const& id) const -> std::size_t
    {
        auto const it = std::ranges::find(players_, id, &PlayerState::member_id);
        if (it == players_.end()) GSG_THROW(error::Code::State, std::format("Unknown member {}", id));
        return static_cast<std::size_t>(std::distance(players_.begin(), it));
    }

    auto Session::CurrentPlayer() -> PlayerState&
    {
        return players_[PlayerIndex(turn_.player_id)];
    }

    auto Session::DrawCards(PlayerState& player, std::size_t const count) -> error::CheckResult
    {
        for (std::size_t i{}; i < count; ++i)
        {
            if (deck_.empty())
            {
                status_ = Status::Ended;
                return std::unexpected(error::Viol(error::RuleViolationCode::DeckEmpty)
                                       .with_actor(player.member_id)
                                       .with_needed(static_cast<std::uint32_t>(count - i)));
            }
            player.hand.push_back(deck_.front());
            deck_.erase(deck_.begin());
        }
        return {};
    }

    auto Session::DiscardFromHand(PlayerState& player, std::size_t const idx) -> void
    {
        GSG_ASSERT(idx < player.hand.size(), "Discard index out of range");
        discard_.push_back(player.hand[idx]);
        player.hand.erase(player.hand.begin() + static_cast<std::ptrdiff_t>(idx));
    }

    //helpers for SnapshotFor
    static auto ViewGift(Gift const& g) -> GiftView
    {
        return GiftView{
            .gift_id = g.id,
            .color = g.color,
            .gift_class = g.gift_class,
            .locks = g.locks,
            .owner_id = g.owner,
            .sealed = g.Sealed()
        };
    }

    static auto ViewGifts(std::vector<GiftSP> const& gifts) -> std::vector<GiftView>
    {
        std::vector<GiftView> out;
        out.reserve(gifts.size());
        std::ranges::transform(gifts, std::back_inserter(out), [](GiftSP const& g) { return ViewGift(*g); });
        return out;
    }

    auto Session::SnapshotFor(MemberId const& viewer) const -> SnapshotCSP
    {
        PlayerState const* me = FindPlayer(viewer);
        if (!me) GSG_THROW(error::Code::State, std::format("Snapshot requested for non-member {}", viewer));

        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->game_id = id_;
        snap->room_id = room_id_;
        snap->status = status_;
        snap->created_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            created_at_.time_since_epoch()).count();
        snap->turn = turn_;

        snap->players.reserve(players_.size());
        for (PlayerState const& p : players_)
        {
            snap->players.push_back(PlayerView{
                .member_id = p.member_id,
                .name = p.name,
                .score = p.Score(),
                .hand_count = static_cast<uint32_t>(p.hand.size()),
                .lands_in_play = p.lands_in_play,
                .gifts = ViewGifts(p.gifts),
                .building = p.building
            });
        }
        snap->gifts_display = ViewGifts(display_);

        snap->viewer.member_id = me->member_id;
        snap->viewer.name = me->name;
        snap->viewer.hand.reserve(me->hand.size());
        std::ranges::transform(me->hand, std::back_inserter(snap->viewer.hand),
                               [](Land const& l) { return l.color; });
        snap->viewer.lands_in_play = me->lands_in_play;
        snap->viewer.building = me->building;
        snap->viewer.pending_discard = me->pending_discard;

        snap->deck_count = static_cast<uint32_t>(deck_.size());
        return snap;
    }
}
