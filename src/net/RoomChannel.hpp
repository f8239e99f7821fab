//
// RoomChannel.hpp
//

#ifndef GUNZI_ROOMCHANNEL_HPP
#define GUNZI_ROOMCHANNEL_HPP

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/EventSink.hpp"
#include "core/Types.hpp"

namespace gunzi::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    class RoomChannel final : public gunzi::core::EventSink
    {
    public:
        explicit RoomChannel(std::weak_ptr<WsServer> ep);

        // Connection enters the room unseated
        void Attach(Hdl hdl);
        // Returns the seat the connection held, if any
        auto Detach(Hdl hdl) -> std::optional<gunzi::core::SeatIdxT>;
        void BindSeat(Hdl hdl, gunzi::core::SeatIdxT seat);
        auto SeatOf(Hdl hdl) const -> std::optional<gunzi::core::SeatIdxT>;
        auto Connections() const -> std::size_t;

        // Targeted events go to the seat's connection, broadcasts to every seated connection
        auto Publish(gunzi::core::OutboundEvent const& ev) -> void override;

        // Direct reply (unseated rejections, snapshots)
        bool SendTo(Hdl hdl, std::span<const std::byte> bytes);
        auto NextMsgId() -> std::uint64_t;

    private:
        bool SendLocked(Hdl const& hdl, std::span<const std::byte> bytes);

    private:
        std::weak_ptr<WsServer> ep_;
        mutable std::mutex mtx_;
        std::map<Hdl, std::optional<gunzi::core::SeatIdxT>, std::owner_less<Hdl>> conns_;
        std::array<std::optional<Hdl>, gunzi::core::constants::SeatCount> seats_{};
        std::uint64_t next_msg_id_{1};
    };
}

#endif // GUNZI_ROOMCHANNEL_HPP
