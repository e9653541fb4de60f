//
// SessionRegistry.hpp
//

#ifndef GIFTSIEGE_SESSIONREGISTRY_HPP
#define GIFTSIEGE_SESSIONREGISTRY_HPP

#include <mutex>
#include <random>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Dispatcher.hpp"
#include "Session.hpp"
#include "State.hpp"

namespace siege::core
{
    struct ViewerSnapshot
    {
        MemberId viewer;
        SnapshotCSP snapshot;
    };

    struct CreatedSession
    {
        SessionId id;
        std::vector<ViewerSnapshot> snapshots;
    };

    struct ActionReport
    {
        MoveOutcome outcome{};
        std::vector<ViewerSnapshot> snapshots; // one per member, taken under the session lock
    };

    // A rejection. snapshots is non-empty only when the failure still changed
    // the session (the deck ran dry), so members must be told.
    struct ActionFailure
    {
        error::RuleViolation violation;
        std::vector<ViewerSnapshot> snapshots;
    };

    // Thread-safe owner of all live sessions. One mutation in flight per
    // session; unrelated sessions never wait on each other.
    class SessionRegistry
    {
    public:
        explicit SessionRegistry(Config base_config);

        SessionRegistry(SessionRegistry const&) = delete;
        auto operator=(SessionRegistry const&) -> SessionRegistry& = delete;

        auto Create(std::string room_id, std::vector<Seat> const& seats) -> CreatedSession;

        // Idempotent: removing an unknown session is not an error.
        auto Remove(SessionId const& id) -> void;

        auto ApplyAction(SessionId const& id, MemberId const& requester,
                         std::string_view action_name, Payload const& payload)
            -> std::expected<ActionReport, ActionFailure>;

        auto ApplyAction(SessionId const& id, MemberId const& requester, PlayerAction const& action)
            -> std::expected<ActionReport, ActionFailure>;

        auto Snapshot(SessionId const& id, MemberId const& viewer) const -> error::Result<SnapshotCSP>;

        // Members of a session in turn order; empty if the session is gone.
        auto Members(SessionId const& id) const -> std::vector<MemberId>;

        auto Contains(SessionId const& id) const -> bool;
        auto Size() const -> std::size_t;

    private:
        struct Entry
        {
            explicit Entry(Session s) : session(std::move(s)) {}

            mutable std::mutex mtx;
            Session session;
            bool removed{false}; // guarded by mtx
        };
        using EntrySP = std::shared_ptr<Entry>;

        auto Find(SessionId const& id) const -> EntrySP;
        static auto SnapshotAll(Session const& s) -> std::vector<ViewerSnapshot>;

        template <typename Fn>
        auto Mutate(SessionId const& id, MemberId const& requester, Fn&& fn)
            -> std::expected<ActionReport, ActionFailure>;

    private:
        Config base_cfg_;

        mutable std::shared_mutex map_mtx_;
        std::unordered_map<SessionId, EntrySP> sessions_; // guarded by map_mtx_
        std::mt19937_64 rng_;                             // guarded by map_mtx_

        // Shared by all sessions without a lock; its rules must be stateless.
        ActionDispatcher dispatcher_;
    };
}

#endif //GIFTSIEGE_SESSIONREGISTRY_HPP
