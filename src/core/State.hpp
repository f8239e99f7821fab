//
// State.hpp
//

#ifndef GUNZI_STATE_HPP
#define GUNZI_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"



namespace gunzi::core
{
    struct SeatInfo
    {
        bool occupied{false};
        std::string name;
        TeamIdxT team{};
        uint8_t hand_count{};
    };

    struct TrickEntryView
    {
        SeatIdxT seat{};
        std::vector<CardVal> cards;
    };

    // Immutable public snapshot exposed to the transport (value copies only)
    struct RoomSnapshot
    {
        Phase phase{Phase::Waiting};
        uint32_t round{};
        std::array<SeatInfo, constants::SeatCount> seats{};

        std::optional<SeatIdxT> dealer;
        std::optional<SeatIdxT> current_turn;

        Rank level{Rank::Two};
        TeamLevels team_levels{};
        std::optional<Suit> main_suit;
        std::optional<SeatIdxT> declarer;
        uint16_t declaration_strength{};

        std::vector<TrickEntryView> trick; // leader first
        TeamScores team_points{};
        uint16_t deck_remaining{};
        std::optional<TeamIdxT> match_winner;
    };

    // Per-seat view: public state plus the seat's own cards
    struct SeatView
    {
        std::shared_ptr<RoomSnapshot const> room;
        SeatIdxT seat{};
        std::vector<CardVal> hand;
        // cards set aside as bottom; visible to the dealer only
        std::vector<CardVal> bottom;
    };

} // namespace gunzi::core

#endif //GUNZI_STATE_HPP
