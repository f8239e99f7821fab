//
// Actions.hpp
//

#ifndef GUNZI_ACTIONS_HPP
#define GUNZI_ACTIONS_HPP

#include "Types.hpp"

namespace gunzi::core
{
    // Seats reference cards by instance id only; the room resolves ids against the hand.
    struct JoinAction           { std::optional<SeatIdxT> seat; std::string name; };
    struct StartGameAction      {};
    struct DeclareMainAction    { std::vector<CardId> cards; std::optional<Suit> suit; };
    struct ExchangeAction       { std::vector<CardId> cards; };
    struct PlayAction           { std::vector<CardId> cards; };
    struct StartNextRoundAction {};
    // Host-driven, never decoded from the wire
    struct DealAction           {};

    using PlayerAction = std::variant<
      JoinAction, StartGameAction, DeclareMainAction, ExchangeAction,
      PlayAction, StartNextRoundAction, DealAction>;

    inline constexpr std::size_t ActionKindCount = std::variant_size_v<PlayerAction>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        DrawingEnded,
        TrickEnded,
        RoundEnded,
        MatchEnded
    };

    enum class Phase : uint8_t
    {
        Waiting,
        Drawing,
        Exchanging,
        Playing,
        Finished
    };

    inline constexpr std::size_t PhaseCount = 5;
} // namespace gunzi::core

#endif //GUNZI_ACTIONS_HPP
