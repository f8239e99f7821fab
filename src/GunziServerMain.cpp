//
// GunziServerMain.cpp
//
// Clients connect to ws://host:port/<room>. Each connection sends binary
// PlayerActionMsg frames; the room answers with EventMsg frames and, after a
// successful join, a SnapshotMsg for the new seat.

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Arbiter.hpp"
#include "core/Exception.hpp"
#include "net/Codec.hpp"
#include "net/RoomChannel.hpp"
#include "net/RoomRegistry.hpp"

using GzException = gunzi::core::OmegaException<gunzi::core::error::Code>;

namespace
{
    using gunzi::net::WsServer;
    using gunzi::net::Hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::chrono::milliseconds deal_interval{std::chrono::milliseconds(50)};
        gunzi::core::RoomConfig room{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            std::uint64_t v{};
            if (arg == "--port")
            {
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--seed")
            {
                if (next_uint(v)) { cfg.room.seed = v; }
            }
            else if (arg == "--deal-interval-ms")
            {
                if (next_uint(v)) { cfg.deal_interval = std::chrono::milliseconds(v); }
            }
            else if (arg == "--catch-threshold")
            {
                if (next_uint(v) && v <= gunzi::core::constants::TotalPoints)
                {
                    cfg.room.catch_threshold = static_cast<std::uint16_t>(v);
                }
                else
                {
                    std::print("[Server] --catch-threshold must be 0..{}, keeping {}\n",
                               gunzi::core::constants::TotalPoints, cfg.room.catch_threshold);
                }
            }
            else if (arg == "--kou-di-multiplier")
            {
                if (next_uint(v) && v <= gunzi::core::constants::MaxKouDiMultiplier)
                {
                    cfg.room.kou_di_multiplier = static_cast<std::uint16_t>(v);
                }
                else
                {
                    std::print("[Server] --kou-di-multiplier must be 0..{}, keeping {}\n",
                               gunzi::core::constants::MaxKouDiMultiplier, cfg.room.kou_di_multiplier);
                }
            }
            else if (arg == "--start-level")
            {
                // face value, 2..14 (14 = Ace)
                if (next_uint(v) && v >= 2 && v <= 14)
                {
                    cfg.room.start_level = static_cast<gunzi::core::Rank>(v);
                }
            }
            else
            {
                std::print("[Server] Ignoring unknown argument {}\n", arg);
            }
        }
        return cfg;
    }

    auto RoomNameOf(WsServer& server, Hdl const& hdl) -> std::string
    {
        std::string path = server.get_con_from_hdl(hdl)->get_resource();
        while (!path.empty() && path.front() == '/')
        {
            path.erase(path.begin());
        }
        return path.empty() ? std::string{"lobby"} : path;
    }

    void SendSnapshot(gunzi::net::RoomEntry& room, Hdl const& hdl, gunzi::core::SeatIdxT seat)
    {
        auto const view = room.arbiter->SnapshotFor(seat);
        auto const buf = gunzi::core::net::BuildSnapshot(*view, room.channel->NextMsgId());
        room.channel->SendTo(hdl, gunzi::core::net::AsBytes(buf));
    }

    void SendRejection(gunzi::net::RoomEntry& room, Hdl const& hdl, gunzi::core::error::RuleViolation const& v)
    {
        auto const buf = gunzi::core::net::BuildEvent(gunzi::core::ActionRejectedEvent{v},
                                                      room.channel->NextMsgId());
        room.channel->SendTo(hdl, gunzi::core::net::AsBytes(buf));
    }
}

int main(int argc, char** argv)
{
    using namespace gunzi;
    using namespace gunzi::core;

    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[Server] Booting on port {} | seed {} | catch {} | kou di x{} | deal every {}ms\n",
               sc.port, sc.room.seed, sc.room.catch_threshold, sc.room.kou_di_multiplier,
               sc.deal_interval.count());

    std::shared_ptr<WsServer> server = std::make_shared<WsServer>();
    server->clear_access_channels(websocketpp::log::alevel::all);
    server->set_access_channels(websocketpp::log::alevel::connect |
        websocketpp::log::alevel::disconnect);
    server->init_asio();

    net::RoomRegistry registry{sc.room, server};

    std::mutex map_mx;
    std::map<Hdl, std::string, std::owner_less<Hdl>> hdl_to_room;

    // Fatal engine errors drop the room; its connections are closed
    auto teardown = [&](std::string const& name, GzException const& e)
    {
        std::print("[Room {}] Fatal: {}\n", name, e);
        registry.Drop(name);

        std::vector<Hdl> victims;
        {
            std::lock_guard<std::mutex> g(map_mx);
            for (auto it = hdl_to_room.begin(); it != hdl_to_room.end();)
            {
                if (it->second == name)
                {
                    victims.push_back(it->first);
                    it = hdl_to_room.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }
        for (Hdl const& h : victims)
        {
            websocketpp::lib::error_code ec;
            server->close(h, websocketpp::close::status::internal_endpoint_error, "Room failed", ec);
        }
    };

    server->set_open_handler([&](Hdl hdl)
    {
        std::string const name = RoomNameOf(*server, hdl);
        std::shared_ptr<net::RoomEntry> const room = registry.Acquire(name, hdl);
        {
            std::lock_guard<std::mutex> g(map_mx);
            hdl_to_room[hdl] = name;
        }
        std::print("[Room {}] Connection opened ({} attached)\n", name, room->channel->Connections());
    });

    server->set_close_handler([&](Hdl hdl)
    {
        std::string name;
        {
            std::lock_guard<std::mutex> g(map_mx);
            auto it = hdl_to_room.find(hdl);
            if (it == hdl_to_room.end())
            {
                return;
            }
            name = it->second;
            hdl_to_room.erase(it);
        }
        std::shared_ptr<net::RoomEntry> const room = registry.Find(name);
        if (!room)
        {
            return;
        }
        std::optional<SeatIdxT> const seat = room->channel->Detach(hdl);
        std::print("[Room {}] Connection closed (seat {})\n", name, seat ? static_cast<int>(*seat) : -1);
        // a connection opening meanwhile keeps the room alive
        if (registry.DropIfEmpty(name))
        {
            std::print("[Room {}] Empty, dropped\n", name);
        }
    });

    server->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] Ignoring non-binary frame from client\n");
            return;
        }

        std::string name;
        {
            std::lock_guard<std::mutex> g(map_mx);
            auto it = hdl_to_room.find(hdl);
            if (it == hdl_to_room.end())
            {
                return;
            }
            name = it->second;
        }
        std::shared_ptr<net::RoomEntry> const room = registry.Find(name);
        if (!room)
        {
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<const std::byte> bytes{
            reinterpret_cast<const std::byte*>(payload.data()), payload.size()
        };

        auto const parsed = core::net::DecodePlayerAction(bytes);
        if (!parsed.has_value())
        {
            std::print("[Room {}] Parse error: {}\n", name, parsed.error().message);
            return;
        }

        std::optional<SeatIdxT> const actor = room->channel->SeatOf(hdl);
        try
        {
            Arbiter::SubmitResult const res = room->arbiter->Submit(actor, *parsed);
            if (!res)
            {
                // Seated submitters already got ActionRejected through the room's sink
                if (!actor)
                {
                    SendRejection(*room, hdl, res.error());
                }
                std::print("[Room {}] Rejected: {}\n", name, error::describe(res.error()));
                return;
            }
            if (res->seat)
            {
                room->channel->BindSeat(hdl, *res->seat);
                SendSnapshot(*room, hdl, *res->seat);
                std::print("[Room {}] Seat {} joined\n", name, static_cast<int>(*res->seat));
            }
            if (res->outcome == MoveOutcome::RoundEnded || res->outcome == MoveOutcome::MatchEnded)
            {
                std::print("[Room {}] Round {} finished{}\n", name,
                           room->arbiter->Snapshot()->round,
                           res->outcome == MoveOutcome::MatchEnded ? ", match over" : "");
            }
        }
        catch (GzException const& e)
        {
            teardown(name, e);
        }
    });

    // Dealing ticker: one card per interval to every room that is drawing
    std::atomic<bool> running{true};
    std::thread ticker([&]()
    {
        while (running.load())
        {
            std::this_thread::sleep_for(sc.deal_interval);
            for (std::shared_ptr<net::RoomEntry> const& room : registry.All())
            {
                if (room->arbiter->Snapshot()->phase != Phase::Drawing)
                {
                    continue;
                }
                try
                {
                    auto const res = room->arbiter->DealNext();
                    if (res && res->outcome == MoveOutcome::DrawingEnded)
                    {
                        std::print("[Room {}] Drawing finished, dealer is seat {}\n", room->name,
                                   static_cast<int>(room->arbiter->Snapshot()->dealer.value_or(0)));
                    }
                }
                catch (GzException const& e)
                {
                    teardown(room->name, e);
                }
            }
        }
    });

    // Start network
    server->listen(sc.port);
    server->start_accept();
    std::print("[Server] Listening\n");
    server->run();

    running.store(false);
    ticker.join();
    std::print("[Server] Stopped\n");
    return 0;
}
