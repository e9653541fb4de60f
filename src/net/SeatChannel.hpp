//
// SeatChannel.hpp - one client connection on the WebSocket++ server
//

#ifndef GIFTSIEGE_SEATCHANNEL_HPP
#define GIFTSIEGE_SEATCHANNEL_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Types.hpp"

namespace siege::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // Routing fields (member_id, name, session_id) are owned by the server and
    // guarded by its lock; the channel only serializes its own sends.
    struct SeatChannel
    {
        std::weak_ptr<WsServer>          ep;
        Hdl                              hdl;

        siege::core::MemberId            member_id;   // empty until Hello
        std::string                      name;
        siege::core::SessionId           session_id;  // empty while in the lobby

        std::mutex                       send_mtx;
        bool                             connected{true}; // guarded by send_mtx

        auto SendBinary(std::span<const std::byte> bytes) -> bool
        {
            auto ep_sp = ep.lock();
            std::lock_guard<std::mutex> lock(send_mtx);
            if (!ep_sp || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(hdl,
                        reinterpret_cast<const void*>(bytes.data()),
                        bytes.size(),
                        websocketpp::frame::opcode::binary,
                        ec);
            return !ec;
        }

        // Starts a close handshake once; later calls are no-ops.
        auto Close(websocketpp::close::status::value code, std::string const& reason) -> websocketpp::lib::error_code
        {
            websocketpp::lib::error_code ec;
            auto ep_sp = ep.lock();
            std::lock_guard<std::mutex> lock(send_mtx);
            if (!ep_sp || !connected)
            {
                return ec;
            }
            connected = false;
            ep_sp->close(hdl, code, reason, ec);
            return ec;
        }
    };

    using SeatChannelSP = std::shared_ptr<SeatChannel>;
}

#endif // GIFTSIEGE_SEATCHANNEL_HPP
