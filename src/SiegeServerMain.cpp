//
// SiegeServerMain.cpp
//
// Authoritative game server using WebSocket++ (no TLS) over standalone Asio.
// Members greet with Hello, are seated into rooms in arrival order and every
// full room becomes one session in the registry. The Asio loop runs on a
// thread pool; sessions serialize themselves inside the registry.
//

#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Dispatcher.hpp"
#include "core/Exception.hpp"
#include "core/SessionRegistry.hpp"
#include "debug/AuditLogger.hpp"
#include "net/Lobby.hpp"
#include "net/SeatChannel.hpp"
#include "net/codec.hpp"

namespace
{
    using siege::net::WsServer;
    using siege::net::Hdl;
    using siege::net::SeatChannel;
    using siege::net::SeatChannelSP;
    using siege::core::MemberId;
    using siege::core::SessionId;
    using siege::core::error::RuleViolation;
    using siege::core::error::RuleViolationCode;
    using siege::core::error::Viol;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint32_t room_size{2};
        std::uint32_t threads{std::max(1u, std::thread::hardware_concurrency())};
        std::optional<std::uint64_t> seed{};
        siege::core::Config game{};
        std::string audit_dir{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out, std::uint64_t const max)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                if (res.ec != std::errc{} || out > max)
                {
                    std::print("[siege-server] Ignoring bad value '{}' for {}\n", s, arg);
                    return false;
                }
                return true;
            };

            std::uint64_t v{};
            if (arg == "--port")
            {
                if (next_uint(v, 65535)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--room-size")
            {
                if (next_uint(v, 16) && v > 0) { cfg.room_size = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--threads")
            {
                if (next_uint(v, 256) && v > 0) { cfg.threads = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                if (next_uint(v, UINT64_MAX)) { cfg.seed = v; }
            }
            else if (arg == "--hand-limit")
            {
                if (next_uint(v, 255)) { cfg.game.hand_limit = static_cast<std::uint8_t>(v); }
            }
            else if (arg == "--land-limit")
            {
                if (next_uint(v, 255)) { cfg.game.land_limit = static_cast<std::uint8_t>(v); }
            }
            else if (arg == "--initial-hand")
            {
                if (next_uint(v, 255)) { cfg.game.initial_hand = static_cast<std::uint8_t>(v); }
            }
            else if (arg == "--audit-dir")
            {
                if (i + 1 < argc) { cfg.audit_dir = argv[++i]; }
            }
            else
            {
                std::print("[siege-server] Unknown option {}\n", arg);
            }
        }
        if (cfg.seed) { cfg.game.seed = *cfg.seed; }
        return cfg;
    }

    class SiegeServer
    {
    public:
        SiegeServer(siege::core::SessionRegistry& registry, ServerConfig const& cfg)
            : ep_(std::make_shared<WsServer>())
              , registry_(registry)
              , cfg_(cfg)
              , lobby_(cfg.room_size)
        {
        }

        auto Run() -> int;

    private:
        auto OnOpen(Hdl hdl) -> void;
        auto OnClose(Hdl hdl) -> void;
        auto OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void;

        auto OnHello(SeatChannelSP const& chan, siege::core::net::HelloFrame const& hello) -> void;
        auto OnAction(SeatChannelSP const& chan, siege::core::net::ActionFrame const& req) -> void;
        auto StartRoom(siege::core::net::Room room) -> void;

        auto Broadcast(std::vector<siege::core::ViewerSnapshot> const& snaps) -> void;
        auto SendViolation(SeatChannelSP const& chan, RuleViolation const& v, std::uint64_t reply_to) -> void;
        auto Send(SeatChannelSP const& chan, flatbuffers::DetachedBuffer const& buf) -> bool;
        auto Evict(SeatChannelSP const& chan) -> void;

        auto Lookup(Hdl const& hdl) -> SeatChannelSP;
        auto MemberOf(SeatChannelSP const& chan) -> std::string;
        auto AuditFor(SessionId const& id) -> std::shared_ptr<siege::core::debug::AuditLogger>;

    private:
        std::shared_ptr<WsServer>                                    ep_;
        siege::core::SessionRegistry&                                registry_;
        ServerConfig                                                 cfg_;

        std::mutex                                                   mtx_;
        siege::core::net::Lobby                                      lobby_;   // guarded by mtx_
        std::map<Hdl, SeatChannelSP, std::owner_less<Hdl>>           conns_;   // guarded by mtx_
        std::unordered_map<MemberId, SeatChannelSP>                  members_; // guarded by mtx_
        std::unordered_map<SessionId, std::size_t>                   live_;    // connected members per session
        std::unordered_map<SessionId,
                           std::shared_ptr<siege::core::debug::AuditLogger>> audits_;

        std::atomic<std::uint64_t>                                   next_msg_id_{1};
    };

    auto SiegeServer::Run() -> int
    {
        ep_->clear_access_channels(websocketpp::log::alevel::all);
        ep_->set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        ep_->init_asio();
        ep_->set_reuse_addr(true);

        ep_->set_open_handler([this](Hdl hdl) { OnOpen(std::move(hdl)); });
        ep_->set_close_handler([this](Hdl hdl) { OnClose(std::move(hdl)); });
        ep_->set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            OnMessage(std::move(hdl), std::move(msg));
        });

        websocketpp::lib::error_code ec;
        ep_->listen(cfg_.port, ec);
        if (ec)
        {
            std::print("[siege-server] listen on {} failed: {}\n", cfg_.port, ec.message());
            return 1;
        }
        ep_->start_accept(ec);
        if (ec)
        {
            std::print("[siege-server] start_accept failed: {}\n", ec.message());
            return 1;
        }

        std::print("[siege-server] Listening on port {} | room size {} | {} thread(s)\n",
                   cfg_.port, cfg_.room_size, cfg_.threads);

        std::atomic<int> failures{0};
        std::vector<std::thread> pool;
        pool.reserve(cfg_.threads);
        for (std::uint32_t t = 0; t < cfg_.threads; ++t)
        {
            pool.emplace_back([this, t, &failures]()
            {
                try
                {
                    ep_->run();
                }
                catch (std::exception const& e)
                {
                    std::print("[siege-server] worker {} died: {}\n", t, e.what());
                    ++failures;
                    ep_->stop();
                }
            });
        }
        for (std::thread& th : pool)
        {
            th.join();
        }
        return failures.load() == 0 ? 0 : 1;
    }

    auto SiegeServer::Lookup(Hdl const& hdl) -> SeatChannelSP
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = conns_.find(hdl);
        return it != conns_.end() ? it->second : SeatChannelSP{};
    }

    auto SiegeServer::MemberOf(SeatChannelSP const& chan) -> std::string
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return chan->member_id.empty() ? std::string{"<anonymous>"} : chan->member_id;
    }

    auto SiegeServer::AuditFor(SessionId const& id) -> std::shared_ptr<siege::core::debug::AuditLogger>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = audits_.find(id);
        return it != audits_.end() ? it->second : nullptr;
    }

    auto SiegeServer::OnOpen(Hdl hdl) -> void
    {
        SeatChannelSP chan = std::make_shared<SeatChannel>();
        chan->ep = ep_;
        chan->hdl = hdl;

        std::lock_guard<std::mutex> lock(mtx_);
        conns_.emplace(std::move(hdl), std::move(chan));
    }

    auto SiegeServer::OnClose(Hdl hdl) -> void
    {
        SeatChannelSP chan;
        std::optional<SessionId> abandoned;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto const it = conns_.find(hdl);
            if (it == conns_.end())
            {
                return;
            }
            chan = std::move(it->second);
            conns_.erase(it);

            if (!chan->member_id.empty())
            {
                if (auto const m = members_.find(chan->member_id); m != members_.end() && m->second == chan)
                {
                    members_.erase(m);
                }
                if (lobby_.Leave(chan->member_id))
                {
                    std::print("[siege-server] {} left the lobby\n", chan->member_id);
                }
            }

            if (!chan->session_id.empty())
            {
                auto const live = live_.find(chan->session_id);
                if (live != live_.end() && --live->second == 0)
                {
                    live_.erase(live);
                    abandoned = chan->session_id;
                    if (auto const a = audits_.find(chan->session_id); a != audits_.end())
                    {
                        a->second->flush();
                        audits_.erase(a);
                    }
                }
            }
        }

        {
            std::lock_guard<std::mutex> send_lock(chan->send_mtx);
            chan->connected = false;
        }

        if (abandoned)
        {
            registry_.Remove(*abandoned);
            std::print("[siege-server] every member of {} disconnected, session dropped\n", *abandoned);
        }
    }

    auto SiegeServer::OnMessage(Hdl hdl, WsServer::message_ptr msg) -> void
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[siege-server] Ignoring non-binary frame from client\n");
            return;
        }

        SeatChannelSP const chan = Lookup(hdl);
        if (!chan)
        {
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<const std::byte> bytes{
            reinterpret_cast<const std::byte*>(payload.data()), payload.size()
        };

        auto frame = siege::core::net::DecodeFrame(bytes);
        if (!frame)
        {
            std::print("[siege-server] Parse error from {}: {}\n", MemberOf(chan), frame.error().message);
            SendViolation(chan, Viol(RuleViolationCode::InvalidPayload).with_field("frame"), 0);
            return;
        }

        std::visit([&]<typename T0>(T0 const& f)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, siege::core::net::HelloFrame>)
            {
                OnHello(chan, f);
            }
            else if constexpr (std::is_same_v<T, siege::core::net::ActionFrame>)
            {
                OnAction(chan, f);
            }
            else
            {
                std::print("[siege-server] Ignoring server-bound frame of the wrong direction\n");
            }
        }, *frame);
    }

    auto SiegeServer::OnHello(SeatChannelSP const& chan, siege::core::net::HelloFrame const& hello) -> void
    {
        std::optional<siege::core::net::Room> room;
        bool duplicate = false;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!chan->member_id.empty())
            {
                std::print("[siege-server] {} greeted twice, ignoring\n", chan->member_id);
                return;
            }
            if (members_.contains(hello.member_id))
            {
                duplicate = true;
            }
            else
            {
                chan->member_id = hello.member_id;
                chan->name = hello.name.empty() ? hello.member_id : hello.name;
                members_.emplace(chan->member_id, chan);
                room = lobby_.Join(siege::core::Seat{ .member_id = chan->member_id, .name = chan->name });
                std::print("[siege-server] {} (\"{}\") waiting in lobby ({} of {})\n",
                           chan->member_id, chan->name,
                           room ? lobby_.RoomSize() : lobby_.Waiting(), lobby_.RoomSize());
            }
        }

        if (duplicate)
        {
            std::print("[siege-server] Rejecting second connection for member {}\n", hello.member_id);
            if (auto const ec = chan->Close(websocketpp::close::status::policy_violation, "member already connected"))
            {
                std::print("[siege-server] close failed: {}\n", ec.message());
            }
            return;
        }

        if (room)
        {
            StartRoom(std::move(*room));
        }
    }

    auto SiegeServer::StartRoom(siege::core::net::Room room) -> void
    {
        siege::core::CreatedSession created;
        try
        {
            created = registry_.Create(room.room_id, room.seats);
        }
        catch (siege::core::error::StateError const& e)
        {
            std::print("[siege-server] Could not start {}: {}\n", room.room_id, e.what());
            return;
        }

        std::shared_ptr<siege::core::debug::AuditLogger> audit;
        if (!cfg_.audit_dir.empty())
        {
            audit = std::make_shared<siege::core::debug::AuditLogger>(
                std::format("{}/{}.log", cfg_.audit_dir, created.id));
            if (!audit->IsOpen())
            {
                std::print("[siege-server] Cannot write transcript for {} under {}\n", created.id, cfg_.audit_dir);
                audit.reset();
            }
            else if (!created.snapshots.empty())
            {
                audit->start(*created.snapshots.front().snapshot);
            }
        }

        std::size_t live = 0;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (siege::core::Seat const& seat : room.seats)
            {
                if (auto const it = members_.find(seat.member_id); it != members_.end())
                {
                    it->second->session_id = created.id;
                    ++live;
                }
            }
            if (live > 0)
            {
                live_[created.id] = live;
                if (audit) audits_[created.id] = audit;
            }
        }

        if (live == 0)
        {
            // Everyone left while the session was being built.
            registry_.Remove(created.id);
            return;
        }

        std::print("[siege-server] {} started as session {}\n", room.room_id, created.id);
        Broadcast(created.snapshots);
    }

    auto SiegeServer::OnAction(SeatChannelSP const& chan, siege::core::net::ActionFrame const& req) -> void
    {
        MemberId member;
        SessionId session;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            member = chan->member_id;
            session = chan->session_id;
        }

        if (member.empty())
        {
            SendViolation(chan, Viol(RuleViolationCode::PlayerNotFound).with_field("hello"), req.msg_id);
            return;
        }
        if (session.empty() || (!req.session_id.empty() && req.session_id != session))
        {
            SendViolation(chan, Viol(RuleViolationCode::SessionNotFound).with_actor(member), req.msg_id);
            return;
        }

        auto action = siege::core::ActionDispatcher::Parse(req.action, req.payload);
        if (!action)
        {
            RuleViolation v = std::move(action.error());
            v.with_actor(member);
            SendViolation(chan, v, req.msg_id);
            return;
        }

        auto const audit = AuditFor(session);
        auto result = registry_.ApplyAction(session, member, *action);

        std::vector<siege::core::ViewerSnapshot> const* to_send = nullptr;
        if (result)
        {
            if (audit) audit->action(member, *action, result->outcome);
            to_send = &result->snapshots;
        }
        else
        {
            if (audit) audit->rejected(member, *action, result.error().violation);
            SendViolation(chan, result.error().violation, req.msg_id);
            to_send = &result.error().snapshots;
        }

        if (to_send->empty())
        {
            return;
        }
        Broadcast(*to_send);

        siege::core::GameSnapshot const& after = *to_send->front().snapshot;
        if (after.status == siege::core::Status::Ended)
        {
            std::print("[siege-server] session {} ended on turn {}\n", session, after.turn.number);
            if (audit) audit->end(after);
        }
    }

    auto SiegeServer::Send(SeatChannelSP const& chan, flatbuffers::DetachedBuffer const& buf) -> bool
    {
        std::span<const std::byte> bytes{
            reinterpret_cast<const std::byte*>(buf.data()), buf.size()
        };
        return chan->SendBinary(bytes);
    }

    auto SiegeServer::Broadcast(std::vector<siege::core::ViewerSnapshot> const& snaps) -> void
    {
        std::vector<std::pair<SeatChannelSP, siege::core::SnapshotCSP>> targets;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (siege::core::ViewerSnapshot const& vs : snaps)
            {
                if (auto const it = members_.find(vs.viewer); it != members_.end())
                {
                    targets.emplace_back(it->second, vs.snapshot);
                }
            }
        }

        for (auto const& [chan, snap] : targets)
        {
            flatbuffers::DetachedBuffer const buf = siege::core::net::BuildSnapshot(*snap, next_msg_id_++);
            if (!Send(chan, buf))
            {
                Evict(chan);
            }
        }
    }

    auto SiegeServer::SendViolation(SeatChannelSP const& chan, RuleViolation const& v, std::uint64_t reply_to) -> void
    {
        std::print("[siege-server] Rejected {}: {}\n", reply_to, siege::core::error::describe(v));
        flatbuffers::DetachedBuffer const buf = siege::core::net::BuildViolation(v, reply_to);
        if (!Send(chan, buf))
        {
            Evict(chan);
        }
    }

    auto SiegeServer::Evict(SeatChannelSP const& chan) -> void
    {
        std::print("[siege-server] send to {} failed, closing its connection\n", MemberOf(chan));
        if (auto const ec = chan->Close(websocketpp::close::status::going_away, "send failed"))
        {
            std::print("[siege-server] close failed: {}\n", ec.message());
        }
    }
} // anon

int main(int argc, char** argv)
{
    ServerConfig cfg = ParseArgs(argc, argv);

    std::size_t const deck = siege::core::constants::ColorCount * cfg.game.deck_size_per_color;
    if (static_cast<std::size_t>(cfg.game.initial_hand) * cfg.room_size > deck)
    {
        std::print("[siege-server] {} players x {} cards exceeds the {} card deck\n",
                   cfg.room_size, cfg.game.initial_hand, deck);
        return 2;
    }

    if (!cfg.audit_dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(cfg.audit_dir, ec);
        if (ec)
        {
            std::print("[siege-server] Cannot create audit dir {}: {}\n", cfg.audit_dir, ec.message());
            return 2;
        }
    }

    std::print("[siege-server] Booting | hand limit {} | land limit {} | initial hand {}\n",
               cfg.game.hand_limit, cfg.game.land_limit, cfg.game.initial_hand);

    siege::core::SessionRegistry registry{cfg.game};
    SiegeServer server{registry, cfg};
    return server.Run();
}
