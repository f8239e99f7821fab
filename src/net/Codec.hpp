//
// Codec.hpp
//

#ifndef GUNZI_CODEC_HPP
#define GUNZI_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/Events.hpp"
#include "../core/State.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/gunzi_net_generated.h"

namespace gunzi::core::net
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    // Lightweight local parse error (as permitted)
    struct ParseError
    {
        std::string message;
    };

    auto ToFbSuit(Suit s) noexcept -> gunzi::gen::net::Suit;
    auto ToFbRank(Rank r) noexcept -> gunzi::gen::net::Rank;
    auto ToFbPhase(Phase p) noexcept -> gunzi::gen::net::Phase;

    auto FromFbSuit(gunzi::gen::net::Suit s) noexcept -> Suit;
    auto FromFbRank(gunzi::gen::net::Rank r) noexcept -> Rank;
    auto FromFbPhase(gunzi::gen::net::Phase p) noexcept -> Phase;

    // --- Builders (client → server) ---
    // Host-only actions (Deal) have no wire form and throw a Serialization error.
    auto BuildAction(PlayerAction const& a, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Builders (server → client) ---
    auto BuildEvent(Event const& ev, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;
    auto BuildSnapshot(SeatView const& view, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // --- Inbound decode; buffers are verified before any field is read ---
    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<PlayerAction, ParseError>;

    auto DecodeEvent(std::span<std::byte const> bytes)
        -> std::expected<Event, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace gunzi::core::net


#endif //GUNZI_CODEC_HPP
