//
// SessionRegistry.cpp
//

#include "SessionRegistry.hpp"

#include <format>
#include <print>
#include <utility>

#include "GiftRules.hpp"

namespace siege::core
{
    SessionRegistry::SessionRegistry(Config base_config) :
        base_cfg_(base_config),
        rng_{base_cfg_.seed},
        dispatcher_(std::make_unique<GiftRules>())
    {
    }

    auto SessionRegistry::Find(SessionId const& id) const -> EntrySP
    {
        std::shared_lock<std::shared_mutex> lock(map_mtx_);
        auto const it = sessions_.find(id);
        return it != sessions_.end() ? it->second : EntrySP{};
    }

    auto SessionRegistry::SnapshotAll(Session const& s) -> std::vector<ViewerSnapshot>
    {
        std::vector<ViewerSnapshot> out;
        out.reserve(s.PlayerCount());
        for (PlayerState const& p : s.Players())
        {
            out.push_back(ViewerSnapshot{ .viewer = p.member_id, .snapshot = s.SnapshotFor(p.member_id) });
        }
        return out;
    }

    auto SessionRegistry::Create(std::string room_id, std::vector<Seat> const& seats) -> CreatedSession
    {
        // The map lock covers drawing the id and seed and the insert; the session is built outside it.
        for (;;)
        {
            SessionId id;
            Config cfg = base_cfg_;
            {
                std::unique_lock<std::shared_mutex> lock(map_mtx_);
                do
                {
                    id = std::format("game-{:016x}", rng_());
                }
                while (sessions_.contains(id));
                cfg.seed = rng_();
            }

            auto entry = std::make_shared<Entry>(Session{id, room_id, seats, cfg});
            CreatedSession created{ .id = id, .snapshots = SnapshotAll(entry->session) };
            {
                std::unique_lock<std::shared_mutex> lock(map_mtx_);
                // Another Create took the same id meanwhile.
                if (!sessions_.try_emplace(id, std::move(entry)).second) continue;
            }

            std::print("[registry] created session {} for room {} with {} player(s)\n", id, room_id, seats.size());
            return created;
        }
    }

    auto SessionRegistry::Remove(SessionId const& id) -> void
    {
        EntrySP entry;
        {
            std::unique_lock<std::shared_mutex> lock(map_mtx_);
            auto const it = sessions_.find(id);
            if (it == sessions_.end()) return;
            entry = std::move(it->second);
            sessions_.erase(it);
        }

        // Waits for an in-flight mutation; later callers holding the entry see removed.
        std::lock_guard<std::mutex> guard(entry->mtx);
        entry->removed = true;
        std::print("[registry] session {} removed\n", id);
    }

    template <typename Fn>
    auto SessionRegistry::Mutate(SessionId const& id, MemberId const& requester, Fn&& fn)
        -> std::expected<ActionReport, ActionFailure>
    {
        using error::RuleViolationCode;
        using error::Viol;

        EntrySP const entry = Find(id);
        if (!entry)
            return std::unexpected(ActionFailure{
                .violation = Viol(RuleViolationCode::SessionNotFound).with_actor(requester) });

        std::lock_guard<std::mutex> guard(entry->mtx);
        if (entry->removed)
            return std::unexpected(ActionFailure{
                .violation = Viol(RuleViolationCode::SessionNotFound).with_actor(requester) });

        Session& s = entry->session;
        Status const before = s.StatusNow();
        Rules::ApplyResult result = fn(s);

        if (!result)
        {
            ActionFailure failure{ .violation = std::move(result.error()) };
            if (before != s.StatusNow())
            {
                std::print("[registry] session {} ended: {}\n", id, error::describe(failure.violation));
                failure.snapshots = SnapshotAll(s);
            }
            return std::unexpected(std::move(failure));
        }
        return ActionReport{ .outcome = *result, .snapshots = SnapshotAll(s) };
    }

    auto SessionRegistry::ApplyAction(SessionId const& id, MemberId const& requester,
                                      std::string_view action_name, Payload const& payload)
        -> std::expected<ActionReport, ActionFailure>
    {
        // Payload shape is checked before taking the session lock.
        auto action = ActionDispatcher::Parse(action_name, payload);
        if (!action)
        {
            error::RuleViolation v = std::move(action.error());
            v.with_actor(requester);
            return std::unexpected(ActionFailure{ .violation = std::move(v) });
        }
        return ApplyAction(id, requester, *action);
    }

    auto SessionRegistry::ApplyAction(SessionId const& id, MemberId const& requester, PlayerAction const& action)
        -> std::expected<ActionReport, ActionFailure>
    {
        return Mutate(id, requester, [&](Session& s)
        {
            return dispatcher_.Dispatch(s, requester, action);
        });
    }

    auto SessionRegistry::Snapshot(SessionId const& id, MemberId const& viewer) const
        -> error::Result<SnapshotCSP>
    {
        using error::RuleViolationCode;
        using error::Viol;

        EntrySP const entry = Find(id);
        if (!entry) return std::unexpected(Viol(RuleViolationCode::SessionNotFound));

        std::lock_guard<std::mutex> guard(entry->mtx);
        if (entry->removed) return std::unexpected(Viol(RuleViolationCode::SessionNotFound));
        if (!entry->session.IsMember(viewer))
            return std::unexpected(Viol(RuleViolationCode::PlayerNotFound).with_actor(viewer));
        return entry->session.SnapshotFor(viewer);
    }

    auto SessionRegistry::Members(SessionId const& id) const -> std::vector<MemberId>
    {
        std::vector<MemberId> out;
        EntrySP const entry = Find(id);
        if (!entry) return out;

        std::lock_guard<std::mutex> guard(entry->mtx);
        if (entry->removed) return out;
        for (PlayerState const& p : entry->session.Players()) out.push_back(p.member_id);
        return out;
    }

    auto SessionRegistry::Contains(SessionId const& id) const -> bool
    {
        std::shared_lock<std::shared_mutex> lock(map_mtx_);
        return sessions_.contains(id);
    }

    auto SessionRegistry::Size() const -> std::size_t
    {
        std::shared_lock<std::shared_mutex> lock(map_mtx_);
        return sessions_.size();
    }
}
