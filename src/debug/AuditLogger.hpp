//
// AuditLogger.hpp
//

#ifndef GIFTSIEGE_AUDITLOGGER_HPP
#define GIFTSIEGE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace siege::core::debug
{
    // Human-readable transcript of one session. Safe to share between threads.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        auto IsOpen() const -> bool;

        // Session header (ids, seed when known, seats, display pool)
        auto start(GameSnapshot const& s, std::optional<std::uint64_t> seed = std::nullopt) -> void;

        // One accepted action
        auto action(MemberId const& requester, PlayerAction const& a, MoveOutcome m) -> void;

        // One rejected action
        auto rejected(MemberId const& requester, PlayerAction const& a, error::RuleViolation const& v) -> void;

        // Footer with final scores
        auto end(GameSnapshot const& s) -> void;

        auto flush() -> void;

    private:
        std::mutex mtx_;
        std::ofstream out_;
        std::uint64_t lines_{0};
    };

    // "steal_gift(gift-..., add_lock, discard=[0,2])" style rendering
    auto FormatAction(PlayerAction const& a) -> std::string;
}

#endif //GIFTSIEGE_AUDITLOGGER_HPP
