//
// Events.hpp
//

#ifndef GUNZI_EVENTS_HPP
#define GUNZI_EVENTS_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"

namespace gunzi::core
{
    struct SeatJoinedEvent
    {
        SeatIdxT seat{};
        TeamIdxT team{};
        std::string name;
    };

    struct RoundStartedEvent
    {
        uint32_t round{};
        std::optional<SeatIdxT> dealer; // unknown until drawing ends in the first round
        Rank level{Rank::Two};
        TeamLevels team_levels{};
    };

    struct PhaseChangedEvent
    {
        Phase phase{Phase::Waiting};
    };

    // Targeted to the receiving seat
    struct CardDealtEvent
    {
        SeatIdxT seat{};
        CardVal card{};
    };

    struct MainDeclaredEvent
    {
        std::optional<Suit> suit;
        SeatIdxT by_seat{};
        uint16_t strength{};
        uint8_t card_count{};
    };

    struct ExchangeStartedEvent
    {
        SeatIdxT dealer{};
        std::optional<Suit> main_suit;
        Rank level{Rank::Two};
    };

    // Targeted to the dealer when drawing ends, broadcast again at round end
    struct BottomCardsRevealedEvent
    {
        SeatIdxT seat{};
        std::vector<CardVal> cards;
    };

    struct PlayStartedEvent
    {
        SeatIdxT leader{};
    };

    struct PlayAcceptedEvent
    {
        SeatIdxT seat{};
        std::vector<CardVal> cards;
        SeatIdxT next_turn{};
    };

    struct TrickResolvedEvent
    {
        SeatIdxT winner{};
        uint16_t points{};
        TeamScores scores{};
    };

    struct RoundFinishedEvent
    {
        TeamScores scores{};
        TeamLevels levels{};
        SeatIdxT next_dealer{};
        uint16_t bottom_points{};
        uint16_t kou_di_bonus{};
        std::optional<TeamIdxT> catching_winner;
        std::optional<TeamIdxT> match_winner;
    };

    // Targeted to the submitter only
    struct ActionRejectedEvent
    {
        error::RuleViolation reason{};
    };

    using Event = std::variant<
      SeatJoinedEvent, RoundStartedEvent, PhaseChangedEvent, CardDealtEvent,
      MainDeclaredEvent, ExchangeStartedEvent, BottomCardsRevealedEvent, PlayStartedEvent,
      PlayAcceptedEvent, TrickResolvedEvent, RoundFinishedEvent, ActionRejectedEvent>;

    struct OutboundEvent
    {
        std::optional<SeatIdxT> target; // nullopt = broadcast
        Event event;
    };
} // namespace gunzi::core

#endif //GUNZI_EVENTS_HPP
