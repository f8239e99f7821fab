//
// AuditLogger.hpp
//

#ifndef GUNZI_AUDITLOGGER_HPP
#define GUNZI_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

#include "../core/Room.hpp"
#include "../core/Events.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace gunzi::core::debug
{
    // Plain-text transcript of a room: one line per action, outcome and event
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, levels, config)
        auto start(RoomImpl const& room, std::uint64_t seed) -> void;

        // Before Submit: phase, turn, actor, proposed action
        auto action(RoomImpl const& room,
                    std::optional<SeatIdxT> actor,
                    PlayerAction const& a) -> void;

        // After Submit
        auto outcome(RoomImpl::SubmitResult const& res) -> void;

        auto event(OutboundEvent const& ev) -> void;

        // Round footer: hand counts, points, settlement
        auto round_end(RoomImpl const& room) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    // Short card/action text shared by the transcript and test messages
    auto CardText(CardVal const& c) -> std::string;
    auto ActionText(PlayerAction const& a) -> std::string;
}

#endif //GUNZI_AUDITLOGGER_HPP
