//
// RoomChannel.cpp
//

#include "net/RoomChannel.hpp"

#include "net/Codec.hpp"

namespace gunzi::net
{
    RoomChannel::RoomChannel(std::weak_ptr<WsServer> ep)
        : ep_{std::move(ep)}
    {
    }

    void RoomChannel::Attach(Hdl hdl)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        conns_.emplace(std::move(hdl), std::nullopt);
    }

    auto RoomChannel::Detach(Hdl hdl) -> std::optional<gunzi::core::SeatIdxT>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = conns_.find(hdl);
        if (it == conns_.end())
        {
            return std::nullopt;
        }
        std::optional<gunzi::core::SeatIdxT> const seat = it->second;
        conns_.erase(it);
        // Seats stay occupied in the room; only the route is dropped
        if (seat)
        {
            seats_[*seat].reset();
        }
        return seat;
    }

    void RoomChannel::BindSeat(Hdl hdl, gunzi::core::SeatIdxT seat)
    {
        GZ_ASSERT(seat < gunzi::core::constants::SeatCount, "Binding out-of-range seat");
        std::lock_guard<std::mutex> lock(mtx_);
        conns_[hdl] = seat;
        seats_[seat] = hdl;
    }

    auto RoomChannel::SeatOf(Hdl hdl) const -> std::optional<gunzi::core::SeatIdxT>
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto const it = conns_.find(hdl);
        return it != conns_.end() ? it->second : std::nullopt;
    }

    auto RoomChannel::Connections() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return conns_.size();
    }

    auto RoomChannel::NextMsgId() -> std::uint64_t
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return next_msg_id_++;
    }

    auto RoomChannel::Publish(gunzi::core::OutboundEvent const& ev) -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        flatbuffers::DetachedBuffer const buf = gunzi::core::net::BuildEvent(ev.event, next_msg_id_++);
        std::span<const std::byte> const bytes = gunzi::core::net::AsBytes(buf);

        if (ev.target)
        {
            if (auto const& hdl = seats_.at(*ev.target))
            {
                SendLocked(*hdl, bytes);
            }
            return;
        }
        for (std::optional<Hdl> const& hdl : seats_)
        {
            if (hdl)
            {
                SendLocked(*hdl, bytes);
            }
        }
    }

    bool RoomChannel::SendTo(Hdl hdl, std::span<const std::byte> bytes)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return SendLocked(hdl, bytes);
    }

    bool RoomChannel::SendLocked(Hdl const& hdl, std::span<const std::byte> bytes)
    {
        auto ep_sp = ep_.lock();
        if (!ep_sp)
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
}
