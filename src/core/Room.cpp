//
// Room.cpp
//

#include "Room.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <utility>
#include "Deck.hpp"
#include "Util.hpp"

namespace gunzi::core
{
    RoomImpl::RoomImpl(RoomConfig const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(std::move(rules)),
        rng_{cfg_.seed},
        level_{cfg_.start_level}
    {
        GZ_ASSERT(rules_ != nullptr, "Room created without rules");
        GZ_ASSERT(cfg_.start_level >= Rank::Two && cfg_.start_level <= Rank::Ace, "Start level out of range");
        GZ_ASSERT(cfg_.level_step > 0, "Level step must be positive");
        team_levels_.fill(cfg_.start_level);
    }

    auto RoomImpl::Submit(std::optional<SeatIdxT> const actor, PlayerAction const& a) -> SubmitResult
    {
        if (auto const ok = rules_->Validate(*this, actor, a); !ok)
        {
            if (actor && *actor < constants::SeatCount) Emit(actor, ActionRejectedEvent{ok.error()});
            return std::unexpected(ok.error());
        }
        std::optional<SeatIdxT> const seat = rules_->Apply(*this, actor, a);
        MoveOutcome const outcome = rules_->Advance(*this);
        return Accepted{outcome, seat};
    }

    auto RoomImpl::DrainEvents() -> std::vector<OutboundEvent>
    {
        return std::exchange(outbox_, {});
    }

    auto RoomImpl::Emit(std::optional<SeatIdxT> const target, Event ev) -> void
    {
        outbox_.push_back(OutboundEvent{target, std::move(ev)});
    }

    auto RoomImpl::SetPhase(Phase const p) -> void
    {
        phase_ = p;
        Emit(std::nullopt, PhaseChangedEvent{p});
    }

    auto RoomImpl::FirstFreeSeat() const -> std::optional<SeatIdxT>
    {
        for (SeatIdxT s{0}; s < constants::SeatCount; ++s)
        {
            if (!seats_[s].occupied) return s;
        }
        return std::nullopt;
    }

    auto RoomImpl::AllSeated() const -> bool
    {
        return std::ranges::all_of(seats_, [](SeatState const& s) { return s.occupied; });
    }

    auto RoomImpl::StartRound() -> void
    {
        std::vector<CardSP> deck = BuildDeck(rng_);
        VerifyDeck(deck);

        bottom_.assign(std::make_move_iterator(deck.end() - constants::BottomSize),
                       std::make_move_iterator(deck.end()));
        deck.resize(deck.size() - constants::BottomSize);
        deck_ = std::move(deck);

        // Cards go out from the back of the deck, first to the dealer (seat 0 before one is known)
        draw_seat_ = dealer_.value_or(0);
        turn_ = draw_seat_;
        Emit(std::nullopt, RoundStartedEvent{round_, dealer_, level_, team_levels_});
        SetPhase(Phase::Drawing);
    }

    auto RoomImpl::DealOne() -> void
    {
        GZ_ASSERT(!deck_.empty(), "Dealing from an empty deck");
        CardSP card = std::move(deck_.back());
        deck_.pop_back();

        CardVal const val = util::ToVal(*card);
        hands_[draw_seat_].Add(std::move(card));
        Emit(draw_seat_, CardDealtEvent{draw_seat_, val});

        draw_seat_ = util::NextSeat(draw_seat_);
        turn_ = draw_seat_;
    }

    auto RoomImpl::FinishDrawing() -> void
    {
        GZ_ASSERT(deck_.empty(), "Drawing finished with cards left in deck");

        if (!dealer_)
            dealer_ = declaration_ ? declaration_->seat : SeatIdxT{0};

        if (declaration_)
            main_suit_ = declaration_->suit;
        else
            main_suit_ = SuitFromBottom(bottom_);

        SeatIdxT const dealer = *dealer_;
        std::vector<CardVal> const revealed = util::ToVals(bottom_);
        for (CardSP& c : bottom_) hands_[dealer].Add(std::move(c));
        bottom_.clear();

        Emit(dealer, BottomCardsRevealedEvent{dealer, revealed});
        Emit(std::nullopt, ExchangeStartedEvent{dealer, main_suit_, level_});
        turn_ = dealer;
        SetPhase(Phase::Exchanging);
    }

    auto RoomImpl::ReturnBottom(SeatIdxT const dealer, std::span<CardId const> ids) -> void
    {
        GZ_ASSERT(bottom_.empty(), "Bottom already set");
        bottom_ = hands_[dealer].Take(ids);
        turn_ = dealer;
        SetPhase(Phase::Playing);
        Emit(std::nullopt, PlayStartedEvent{dealer});
    }

    auto RoomImpl::MoveHandToTrick(SeatIdxT const seat, std::span<CardId const> ids) -> void
    {
        std::vector<CardSP> cards = hands_[seat].Take(ids);
        trick_.Add(seat, std::move(cards));
    }

    auto RoomImpl::ResolveTrick() -> SeatIdxT
    {
        GZ_ASSERT(trick_.Full(), "Resolving an incomplete trick");
        SeatIdxT const winner = trick_.Winner(Ctx());
        uint16_t const points = trick_.Points();

        TeamIdxT const team = TeamOf(winner);
        team_points_[team] = static_cast<uint16_t>(team_points_[team] + points);

        std::ranges::move(trick_.Release(), std::back_inserter(played_));
        turn_ = winner;
        Emit(std::nullopt, TrickResolvedEvent{winner, points, team_points_});
        return winner;
    }

    auto RoomImpl::FinishRound(SeatIdxT const final_winner) -> void
    {
        GZ_ASSERT(dealer_.has_value(), "Round finished without a dealer");
        uint16_t const bottom_points = PointsOf(bottom_);
        RoundSettlement s = Settle(team_points_, bottom_points, final_winner, *dealer_, team_levels_, cfg_);

        Emit(std::nullopt, BottomCardsRevealedEvent{*dealer_, util::ToVals(bottom_)});
        Emit(std::nullopt, RoundFinishedEvent{
            s.team_points, s.levels_after, s.next_dealer, s.bottom_points,
            s.kou_di_bonus, s.catching_winner, s.match_winner});

        match_winner_ = s.match_winner;
        settlement_ = std::move(s);
        turn_.reset();
        SetPhase(Phase::Finished);
    }

    auto RoomImpl::ApplySettlement() -> void
    {
        GZ_ASSERT(settlement_.has_value(), "No settlement to apply");
        team_levels_ = settlement_->levels_after;
        dealer_ = settlement_->next_dealer;
        level_ = settlement_->next_level;
        ++round_;
        ResetRound();
        SetPhase(Phase::Waiting);
    }

    auto RoomImpl::ResetRound() -> void
    {
        for (Hand& h : hands_) h.Clear();
        deck_.clear();
        bottom_.clear();
        played_.clear();
        (void)trick_.Release();
        turn_.reset();
        main_suit_.reset();
        declaration_.reset();
        team_points_.fill(0);
        settlement_.reset();
    }

    static auto TrickView(Trick const& t) -> std::vector<TrickEntryView>
    {
        std::vector<TrickEntryView> out;
        out.reserve(t.Size());
        for (TrickPlay const& p : t.Plays())
            out.push_back(TrickEntryView{p.seat, util::ToVals(p.cards)});
        return out;
    }

    auto RoomImpl::Snapshot() const -> std::shared_ptr<RoomSnapshot const>
    {
        std::shared_ptr<RoomSnapshot> snap = std::make_shared<RoomSnapshot>();
        snap->phase = phase_;
        snap->round = round_;
        for (SeatIdxT s{0}; s < constants::SeatCount; ++s)
        {
            snap->seats[s] = SeatInfo{seats_[s].occupied, seats_[s].name, TeamOf(s),
                                      static_cast<uint8_t>(hands_[s].Size())};
        }
        snap->dealer = dealer_;
        snap->current_turn = turn_;
        snap->level = level_;
        snap->team_levels = team_levels_;
        snap->main_suit = main_suit_;
        if (declaration_)
        {
            snap->declarer = declaration_->seat;
            snap->declaration_strength = declaration_->strength;
        }
        snap->trick = TrickView(trick_);
        snap->team_points = team_points_;
        snap->deck_remaining = static_cast<uint16_t>(deck_.size());
        snap->match_winner = match_winner_;
        return snap;
    }

    auto RoomImpl::SnapshotFor(SeatIdxT const seat) const -> std::shared_ptr<SeatView const>
    {
        GZ_ASSERT(seat < constants::SeatCount, "Seat out of range");
        std::shared_ptr<SeatView> view = std::make_shared<SeatView>();
        view->room = Snapshot();
        view->seat = seat;
        view->hand = hands_[seat].Values();
        bool const bottom_visible = phase_ == Phase::Playing || phase_ == Phase::Finished;
        if (bottom_visible && dealer_ == seat)
            view->bottom = util::ToVals(bottom_);
        return view;
    }
}
