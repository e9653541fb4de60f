#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace siege::core;

namespace
{

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Applied:   return "Applied";
        case MoveOutcome::TurnEnded: return "TurnEnded";
    }
    return "Invalid";
}

auto s_gift(GiftView const& g) -> std::string
{
    return std::format("{}:{}{}x{}", g.gift_id, to_string(g.gift_class), to_string(g.color),
                       static_cast<int>(g.locks));
}

auto s_gifts(std::vector<GiftView> const& gifts) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < gifts.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_gift(gifts[i]);
    }
    return body;
}

auto s_indices(std::vector<std::int64_t> const& idxs) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < idxs.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::to_string(idxs[i]);
    }
    return body;
}

} // anonymous namespace

namespace siege::core::debug
{

auto FormatAction(PlayerAction const& a) -> std::string
{
    return std::visit(
        []<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayLandAction> || std::is_same_v<T, DiscardAction>)
            {
                return std::format("{}({})", ActionName(act), act.index);
            }
            else if constexpr (std::is_same_v<T, ClaimGiftAction> || std::is_same_v<T, WrapGiftAction>)
            {
                return std::format("{}({})", ActionName(act), act.gift_id);
            }
            else if constexpr (std::is_same_v<T, StealGiftAction>)
            {
                std::string out = std::format("steal_gift({}", act.gift_id);
                if (act.add_lock) out += ", add_lock";
                if (act.discard_indices) out += std::format(", discard=[{}]", s_indices(*act.discard_indices));
                return out + ")";
            }
            else if constexpr (std::is_same_v<T, BuildBuildingAction>)
            {
                return std::format("build_building({})", to_string(act.building));
            }
            else
            {
                return std::string{ActionName(act)};
            }
        },
        a
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::IsOpen() const -> bool
{
    return out_.is_open();
}

auto AuditLogger::start(GameSnapshot const& s, std::optional<std::uint64_t> seed) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Game={} Room={} CreatedAt={}\n", s.game_id, s.room_id, s.created_at_ms);
    if (seed) out_ << std::format("Seed={}\n", *seed);
    out_ << std::format("Players={}\n", s.players.size());
    for (std::size_t i{}; i < s.players.size(); ++i)
    {
        out_ << std::format("  P{} {} \"{}\"\n", i, s.players[i].member_id, s.players[i].name);
    }
    out_ << std::format("Display=[{}]\n", s_gifts(s.gifts_display));
    out_ << std::format("Deck={}\n", s.deck_count);
    out_.flush();
}

auto AuditLogger::action(MemberId const& requester, PlayerAction const& a, MoveOutcome m) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("#{} {} {} -> {}\n", ++lines_, requester, FormatAction(a), s_outcome(m));
}

auto AuditLogger::rejected(MemberId const& requester, PlayerAction const& a, error::RuleViolation const& v) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("#{} {} {} -> REJECTED {}\n", ++lines_, requester, FormatAction(a), error::describe(v));
}

auto AuditLogger::end(GameSnapshot const& s) -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_ << std::format("Status={} Turn={} Deck={}\n", to_string(s.status), s.turn.number, s.deck_count);
    for (PlayerView const& p : s.players)
    {
        out_ << std::format("  {} score={} gifts=[{}]\n", p.member_id, p.score, s_gifts(p.gifts));
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(mtx_);
    out_.flush();
}

} // namespace siege::core::debug
