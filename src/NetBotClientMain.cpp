//
// NetBotClientMain.cpp
//
// A headless client that plays via RandomAI. Connects to the server, greets
// with Hello, decodes each SnapshotMsg and answers with one ActionRequest
// whenever the snapshot says it owns the turn.
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <random>
#include <string>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Types.hpp"
#include "core/State.hpp"
#include "core/Actions.hpp"
#include "core/RandomAi.hpp"
#include "debug/AuditLogger.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string host{"127.0.0.1"};
        std::uint16_t port{9002};
        std::string member{};
        std::string name{};
        std::uint64_t seed{std::random_device{}()};
        // Must match the server's --land-limit.
        std::uint8_t land_limit{siege::core::Config{}.land_limit};
    };

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string k = argv[i];
            if (i + 1 >= argc)
            {
                std::print("[siege-bot] Missing value for {}\n", k);
                break;
            }
            char const* v = argv[++i];
            if (k == "--host") { c.host = v; }
            else if (k == "--member") { c.member = v; }
            else if (k == "--name") { c.name = v; }
            else if (k == "--port" || k == "--seed" || k == "--land-limit")
            {
                std::uint64_t n{};
                auto const res = std::from_chars(v, v + std::strlen(v), n);
                if (res.ec != std::errc{} || (k == "--port" && n > 65535) ||
                    (k == "--land-limit" && (n == 0 || n > 255)))
                {
                    std::print("[siege-bot] Ignoring bad value '{}' for {}\n", v, k);
                    continue;
                }
                if (k == "--port") { c.port = static_cast<std::uint16_t>(n); }
                else if (k == "--land-limit") { c.land_limit = static_cast<std::uint8_t>(n); }
                else { c.seed = n; }
            }
            else
            {
                std::print("[siege-bot] Unknown option {}\n", k);
            }
        }
        if (c.member.empty()) { c.member = std::format("bot-{:08x}", c.seed & 0xFFFFFFFFULL); }
        if (c.name.empty()) { c.name = c.member; }
        return c;
    }

    class Bot
    {
    public:
        explicit Bot(CmdLine const& cfg)
            : cfg_(cfg)
              , ai_(cfg.seed, cfg.land_limit)
        {
        }

        auto Run() -> int;

    private:
        auto OnMessage(websocketpp::connection_hdl hdl, WsClient::message_ptr msg) -> void;
        auto OnSnapshot(siege::core::net::SnapshotFrame const& f) -> void;
        auto OnViolation(siege::core::net::ViolationFrame const& f) -> void;
        auto SendAction(siege::core::PlayerAction const& act) -> void;
        auto Send(flatbuffers::DetachedBuffer const& buf) -> void;

    private:
        CmdLine cfg_;
        WsClient client_;
        websocketpp::connection_hdl hdl_;
        siege::core::RandomAI ai_;
        std::shared_ptr<siege::core::GameSnapshot const> last_{};
        std::uint64_t next_msg_id_{1};
    };

    auto Bot::Run() -> int
    {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.init_asio();

        client_.set_open_handler([this](websocketpp::connection_hdl hdl)
        {
            hdl_ = hdl;
            std::print("[siege-bot] Connected as {}\n", cfg_.member);
            Send(siege::core::net::BuildHello(cfg_.member, cfg_.name, next_msg_id_++));
        });

        client_.set_close_handler([](websocketpp::connection_hdl)
        {
            std::print("[siege-bot] Closed by server.\n");
        });

        client_.set_message_handler([this](websocketpp::connection_hdl hdl, WsClient::message_ptr msg)
        {
            OnMessage(std::move(hdl), std::move(msg));
        });

        std::string const url = std::format("ws://{}:{}", cfg_.host, cfg_.port);
        websocketpp::lib::error_code ec;
        WsClient::connection_ptr con = client_.get_connection(url, ec);
        if (ec)
        {
            std::print("[siege-bot] get_connection error: {}\n", ec.message());
            return 2;
        }

        client_.connect(con);

        // Run the client loop (blocking)
        client_.run();
        return 0;
    }

    auto Bot::OnMessage(websocketpp::connection_hdl, WsClient::message_ptr msg) -> void
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[siege-bot] Ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(pl.data()), pl.size()};

        auto frame = siege::core::net::DecodeFrame(bytes);
        if (!frame)
        {
            std::print("[siege-bot] Bad frame: {}\n", frame.error().message);
            return;
        }

        if (auto const* snap = std::get_if<siege::core::net::SnapshotFrame>(&*frame))
        {
            OnSnapshot(*snap);
        }
        else if (auto const* vio = std::get_if<siege::core::net::ViolationFrame>(&*frame))
        {
            OnViolation(*vio);
        }
        else
        {
            std::print("[siege-bot] Ignoring client-bound frame of the wrong direction\n");
        }
    }

    auto Bot::OnSnapshot(siege::core::net::SnapshotFrame const& f) -> void
    {
        last_ = std::make_shared<siege::core::GameSnapshot const>(f.snapshot);
        siege::core::GameSnapshot const& s = *last_;

        std::print("[siege-bot] {} turn {} owner={} deck={} hand={} lands={} pending={}\n",
                   s.game_id, s.turn.number, s.turn.player_id, s.deck_count,
                   s.viewer.hand.size(), s.viewer.lands_in_play.size(), s.viewer.pending_discard);

        if (s.status == siege::core::Status::Ended)
        {
            for (siege::core::PlayerView const& p : s.players)
            {
                std::print("[siege-bot]   {} finished with {} point(s)\n", p.member_id, p.score);
            }
            websocketpp::lib::error_code ec;
            client_.close(hdl_, websocketpp::close::status::normal, "game over", ec);
            if (ec)
            {
                std::print("[siege-bot] close failed: {}\n", ec.message());
            }
            return;
        }

        if (s.turn.player_id != cfg_.member)
        {
            return;
        }
        SendAction(ai_.Play(last_));
    }

    auto Bot::OnViolation(siege::core::net::ViolationFrame const& f) -> void
    {
        std::print("[siege-bot] Rejected #{}: {}\n", f.msg_id, f.text);
        if (!last_ || last_->status == siege::core::Status::Ended || last_->turn.player_id != cfg_.member)
        {
            return;
        }

        // Give the turn back rather than repeating a rejected move.
        if (last_->viewer.pending_discard > 0 && !last_->viewer.hand.empty())
        {
            SendAction(siege::core::DiscardAction{ .index = 0 });
        }
        else if (f.code != siege::core::error::RuleViolationCode::DiscardRequired)
        {
            SendAction(siege::core::EndTurnAction{});
        }
    }

    auto Bot::SendAction(siege::core::PlayerAction const& act) -> void
    {
        std::print("[siege-bot] -> {}\n", siege::core::debug::FormatAction(act));
        Send(siege::core::net::BuildAction(last_->game_id, act, next_msg_id_++));
    }

    auto Bot::Send(flatbuffers::DetachedBuffer const& buf) -> void
    {
        websocketpp::lib::error_code ec;
        client_.send(hdl_, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[siege-bot] send() failed: {}\n", ec.message());
        }
    }
} // anon

int main(int argc, char** argv)
{
    CmdLine cfg = ParseArgs(argc, argv);
    std::print("[siege-bot] Connecting to {}:{} | member={} seed={} land_limit={}\n", cfg.host, cfg.port, cfg.member, cfg.seed,
               cfg.land_limit);

    Bot bot{cfg};
    return bot.Run();
}
