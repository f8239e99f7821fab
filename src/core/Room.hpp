//
// Room.hpp
//

#ifndef GUNZI_ROOM_HPP
#define GUNZI_ROOM_HPP

#include <expected>
#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "Events.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Hand.hpp"
#include "Trick.hpp"
#include "Trump.hpp"
#include "Declaration.hpp"
#include "Scoring.hpp"

namespace gunzi::core::debug {struct Inspector;}
namespace gunzi::core
{
    struct SeatState
    {
        bool occupied{false};
        std::string name;
    };

    // Authoritative state of one room. Not thread-safe; Arbiter serializes access.
    class RoomImpl
    {
    public:
        struct Accepted
        {
            MoveOutcome outcome{MoveOutcome::Applied};
            std::optional<SeatIdxT> seat; // seat bound by a join
        };
        using SubmitResult = std::expected<Accepted, error::RuleViolation>;

        RoomImpl() = delete;
        RoomImpl(RoomConfig const& config, std::unique_ptr<Rules> rules);

        // Validate, apply and advance one action. Rejections leave the state untouched and
        // queue ActionRejected for a seated submitter.
        auto Submit(std::optional<SeatIdxT> actor, PlayerAction const& a) -> SubmitResult;

        // Events queued since the last drain, in emission order
        auto DrainEvents() -> std::vector<OutboundEvent>;

        auto Snapshot() const -> std::shared_ptr<RoomSnapshot const>;
        auto SnapshotFor(SeatIdxT seat) const -> std::shared_ptr<SeatView const>;

        auto PhaseNow() const noexcept      -> Phase                   { return phase_; }
        auto Dealer() const noexcept        -> std::optional<SeatIdxT> { return dealer_; }
        auto Turn() const noexcept          -> std::optional<SeatIdxT> { return turn_; }
        auto Level() const noexcept         -> Rank                    { return level_; }
        auto MainSuit() const noexcept      -> std::optional<Suit>     { return main_suit_; }
        auto Levels() const noexcept        -> TeamLevels const&       { return team_levels_; }
        auto Points() const noexcept        -> TeamScores const&       { return team_points_; }
        auto MatchWinner() const noexcept   -> std::optional<TeamIdxT> { return match_winner_; }
        auto Round() const noexcept         -> uint32_t                { return round_; }
        auto DeckRemaining() const noexcept -> size_t                  { return deck_.size(); }
        auto Config() const noexcept        -> RoomConfig const&       { return cfg_; }
        auto Settlement() const noexcept    -> std::optional<RoundSettlement> const& { return settlement_; }
        auto HandOf(SeatIdxT seat) const    -> Hand const&             { return hands_.at(seat); }
        auto CurrentTrick() const noexcept  -> Trick const&            { return trick_; }
        auto SeatOccupied(SeatIdxT seat) const -> bool                 { return seats_.at(seat).occupied; }
        auto Ctx() const noexcept           -> TrumpContext            { return TrumpContext{main_suit_, level_}; }

        //allows class to directly access private data on an instance
        friend class GunziRules;
        friend struct debug::Inspector;

        auto FirstFreeSeat() const -> std::optional<SeatIdxT>;
        auto AllSeated() const -> bool;

    private:
        auto Emit(std::optional<SeatIdxT> target, Event ev) -> void;
        auto SetPhase(Phase p) -> void;

        // Builds, verifies and cuts a fresh deck, then enters Drawing
        auto StartRound() -> void;
        auto DealOne() -> void;
        // Fixes dealer and main suit, hands the bottom to the dealer, enters Exchanging
        auto FinishDrawing() -> void;
        auto ReturnBottom(SeatIdxT dealer, std::span<CardId const> ids) -> void;
        auto MoveHandToTrick(SeatIdxT seat, std::span<CardId const> ids) -> void;
        // Credits the trick and clears it; returns the winner
        auto ResolveTrick() -> SeatIdxT;
        auto FinishRound(SeatIdxT final_winner) -> void;
        // Levels, dealer and reset for the next round; back to Waiting
        auto ApplySettlement() -> void;
        auto ResetRound() -> void;

    private:
        RoomConfig cfg_;
        std::unique_ptr<Rules> rules_;
        std::mt19937_64 rng_;

        std::array<SeatState, constants::SeatCount> seats_{};

        // Authoritative card zones; every card of the round lives in exactly one
        std::array<Hand, constants::SeatCount> hands_{};
        std::vector<CardSP> deck_;    // undealt cards
        std::vector<CardSP> bottom_;  // set aside, later the dealer's returned cards
        std::vector<CardSP> played_;  // cards of resolved tricks
        Trick trick_{};

        // Round state
        Phase phase_{Phase::Waiting};
        uint32_t round_{1};
        std::optional<SeatIdxT> dealer_;
        SeatIdxT draw_seat_{0};
        std::optional<SeatIdxT> turn_;
        std::optional<Suit> main_suit_;
        std::optional<Declaration> declaration_;
        Rank level_;
        TeamLevels team_levels_{};
        TeamScores team_points_{};
        std::optional<RoundSettlement> settlement_;
        std::optional<TeamIdxT> match_winner_;

        std::vector<OutboundEvent> outbox_;
    };
}
#endif //GUNZI_ROOM_HPP
