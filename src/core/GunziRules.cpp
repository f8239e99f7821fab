//
// GunziRules.cpp
//

#include "GunziRules.hpp"

#include "Room.hpp"
#include "Deck.hpp"
#include "FollowRules.hpp"
#include "Util.hpp"
#include <ranges>
#include <algorithm>

namespace gunzi::core
{
    using error::Viol;

auto GunziRules::Validate(RoomImpl const& room,
                          std::optional<SeatIdxT> const actor,
                          PlayerAction const& a) const -> CheckResult
{
    using RVC = ::gunzi::core::error::RuleViolationCode;

    if (actor && *actor >= constants::SeatCount)
        return std::unexpected(Viol(RVC::InvalidSeat).with_actor(actor));

    if (!IsPermitted(room.phase_, a.index()))
        return std::unexpected(Viol(RVC::InvalidPhase)
                               .with_phase(room.phase_).with_actor(actor));

    // attach where/who to violations produced by the card helpers
    auto const enrich = [&](error::RuleViolation v) -> CheckResult
    {
        return std::unexpected(v.with_phase(room.phase_).with_actor(actor));
    };

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, JoinAction>)
        {
            if (actor)
                return std::unexpected(Viol(RVC::SeatTaken).with_actor(actor));

            if (act.seat)
            {
                if (*act.seat >= constants::SeatCount)
                    return std::unexpected(Viol(RVC::InvalidSeat).with_phase(room.phase_));
                if (room.seats_[*act.seat].occupied)
                    return std::unexpected(Viol(RVC::SeatTaken).with_phase(room.phase_));
                return {};
            }
            if (!room.FirstFreeSeat())
                return std::unexpected(Viol(RVC::RoomFull).with_phase(room.phase_));
            return {};
        }
        else if constexpr (std::is_same_v<T, StartGameAction>)
        {
            if (!actor)
                return std::unexpected(Viol(RVC::NotSeated).with_phase(room.phase_));

            if (!room.AllSeated())
                return std::unexpected(Viol(RVC::NotEnoughPlayers)
                                       .with_phase(room.phase_).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, DeclareMainAction>)
        {
            if (!actor)
                return std::unexpected(Viol(RVC::NotSeated).with_phase(room.phase_));

            Hand::SelectResult const cards = room.hands_[*actor].Select(act.cards);
            if (!cards) return enrich(cards.error());

            uint16_t const strength = DeclarationStrength(*cards, room.level_);
            if (strength == 0)
                return std::unexpected(Viol(RVC::InvalidDeclaration)
                                       .with_phase(room.phase_).with_actor(actor)
                                       .with_attempted(static_cast<uint8_t>(cards->size())));

            auto const suit = ResolveDeclaredSuit(*cards, act.suit);
            if (!suit) return enrich(suit.error());

            uint16_t const current = room.declaration_ ? room.declaration_->strength : 0;
            if (strength <= current)
                return std::unexpected(Viol(RVC::DeclarationTooWeak)
                                       .with_phase(room.phase_).with_actor(actor)
                                       .with_strength(current));
            return {};
        }
        else if constexpr (std::is_same_v<T, ExchangeAction>)
        {
            if (!actor)
                return std::unexpected(Viol(RVC::NotSeated).with_phase(room.phase_));

            if (actor != room.dealer_)
                return std::unexpected(Viol(RVC::NotDealer)
                                       .with_phase(room.phase_).with_actor(actor).with_dealer(room.dealer_));

            if (act.cards.size() != constants::BottomSize)
                return std::unexpected(Viol(RVC::WrongCardCount)
                                       .with_phase(room.phase_).with_actor(actor)
                                       .with_expected(static_cast<uint8_t>(constants::BottomSize))
                                       .with_attempted(static_cast<uint8_t>(act.cards.size())));

            if (auto const cards = room.hands_[*actor].Select(act.cards); !cards)
                return enrich(cards.error());
            return {};
        }
        else if constexpr (std::is_same_v<T, PlayAction>)
        {
            if (!actor)
                return std::unexpected(Viol(RVC::NotSeated).with_phase(room.phase_));

            if (actor != room.turn_)
                return std::unexpected(Viol(RVC::NotYourTurn)
                                       .with_phase(room.phase_).with_actor(actor).with_turn(room.turn_));

            Hand const& hand = room.hands_[*actor];
            Hand::SelectResult const cards = hand.Select(act.cards);
            if (!cards) return enrich(cards.error());

            if (room.trick_.Empty())
            {
                if (auto const ok = ValidateLead(*cards); !ok) return enrich(ok.error());
                return {};
            }

            std::vector<CardSP> const held = hand.Cards();
            if (auto const ok = ValidateFollow(room.trick_.Leader().cards, *cards, held, room.Ctx()); !ok)
                return enrich(ok.error());
            return {};
        }
        else if constexpr (std::is_same_v<T, StartNextRoundAction>)
        {
            if (room.match_winner_)
                return std::unexpected(Viol(RVC::MatchOver).with_phase(room.phase_).with_actor(actor));
            return {};
        }
        else if constexpr (std::is_same_v<T, DealAction>)
        {
            // dealing belongs to the host
            if (actor)
                return std::unexpected(Viol(RVC::InvalidPhase).with_phase(room.phase_).with_actor(actor));
            GZ_ASSERT(!room.deck_.empty(), "Drawing phase with an empty deck");
            return {};
        }

        GZ_THROW(::gunzi::core::error::Code::Unknown, "Unreachable variant in Validate");
    }, a);
}

    auto GunziRules::Apply(RoomImpl& room,
                           std::optional<SeatIdxT> const actor,
                           PlayerAction const& a) -> std::optional<SeatIdxT>
    {
        return std::visit([&]<typename T0>(T0 const& act) -> std::optional<SeatIdxT>
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, JoinAction>)
                {
                    std::optional<SeatIdxT> const free = room.FirstFreeSeat();
                    GZ_ASSERT(act.seat || free, "Join applied to a full room");
                    SeatIdxT const seat = act.seat.value_or(free.value_or(0));
                    room.seats_[seat] = SeatState{true, act.name};
                    room.Emit(std::nullopt, SeatJoinedEvent{seat, TeamOf(seat), act.name});
                    return seat;
                }
                else if constexpr (std::is_same_v<T, StartGameAction>)
                {
                    room.StartRound();
                }
                else if constexpr (std::is_same_v<T, DeclareMainAction>)
                {
                    std::vector<CardSP> const cards = room.hands_[*actor].Select(act.cards).value();
                    uint16_t const strength = DeclarationStrength(cards, room.level_);
                    Suit const suit = ResolveDeclaredSuit(cards, act.suit).value();

                    room.declaration_ = Declaration{*actor, suit, strength, act.cards};
                    room.main_suit_ = suit;
                    room.Emit(std::nullopt, MainDeclaredEvent{
                        suit, *actor, strength, static_cast<uint8_t>(cards.size())});
                }
                else if constexpr (std::is_same_v<T, ExchangeAction>)
                {
                    room.ReturnBottom(*actor, act.cards);
                }
                else if constexpr (std::is_same_v<T, PlayAction>)
                {
                    room.MoveHandToTrick(*actor, act.cards);

                    SeatIdxT const next = room.trick_.Full()
                                              ? room.trick_.Winner(room.Ctx())
                                              : util::NextSeat(*actor);
                    room.turn_ = next;
                    room.Emit(std::nullopt, PlayAcceptedEvent{
                        *actor, util::ToVals(room.trick_.Plays().back().cards), next});
                }
                else if constexpr (std::is_same_v<T, StartNextRoundAction>)
                {
                    room.ApplySettlement();
                }
                else if constexpr (std::is_same_v<T, DealAction>)
                {
                    room.DealOne();
                }
                return std::nullopt;
            }, a);
    }

    auto GunziRules::Advance(RoomImpl& room) -> MoveOutcome
    {
        if (room.phase_ == Phase::Drawing)
        {
            if (!room.deck_.empty()) return MoveOutcome::Applied;
            room.FinishDrawing();
            return MoveOutcome::DrawingEnded;
        }

        if (room.phase_ != Phase::Playing || !room.trick_.Full())
            return MoveOutcome::Applied;

        SeatIdxT const winner = room.ResolveTrick();

        size_t const empty_hands = std::ranges::count_if(room.hands_, [](Hand const& h) { return h.Empty(); });
        if (empty_hands == 0) return MoveOutcome::TrickEnded;
        GZ_ASSERT(empty_hands == constants::SeatCount, "Hands emptied unevenly");

        room.FinishRound(winner);
        return room.match_winner_ ? MoveOutcome::MatchEnded : MoveOutcome::RoundEnded;
    }

} // gunzi::core
