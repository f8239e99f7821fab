//
// Codec.cpp
//
#include "Codec.hpp"

#include <algorithm>
#include <format>
#include <utility>
#include <vector>

namespace gn = ::gunzi::gen::net;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)gunzi::core::Suit::Joker == (int)gn::Suit::Joker);
    static_assert((int)gunzi::core::Rank::Two == (int)gn::Rank::Two);
    static_assert((int)gunzi::core::Rank::BigJoker == (int)gn::Rank::BigJoker);
    static_assert((int)gunzi::core::Phase::Finished == (int)gn::Phase::Finished);

    template <typename T>
    auto OptToByte(std::optional<T> const v) -> int8_t
    {
        return v ? static_cast<int8_t>(*v) : int8_t{-1};
    }

    auto Fail(std::string msg) -> std::unexpected<gunzi::core::net::ParseError>
    {
        return std::unexpected(gunzi::core::net::ParseError{std::move(msg)});
    }

    // -1 means none; anything else must be a valid seat/team/suit index below `limit`
    template <typename T>
    auto ByteToOpt(int8_t const b, std::size_t const limit, char const* what)
        -> std::expected<std::optional<T>, gunzi::core::net::ParseError>
    {
        if (b == -1) return std::optional<T>{};
        if (b < 0 || static_cast<std::size_t>(b) >= limit)
            return Fail(std::format("bad {} {}", what, b));
        return std::optional<T>{static_cast<T>(b)};
    }

    template <typename Fb>
    auto Finish(flatbuffers::FlatBufferBuilder& fbb, gn::Message const type, flatbuffers::Offset<Fb> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = gn::CreateEnvelope(fbb, type, msg.Union());
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace gunzi::core::net
{
    auto ToFbSuit(Suit s) noexcept -> gn::Suit
    {
        switch (s)
        {
        case Suit::Spades: return gn::Suit::Spades;
        case Suit::Hearts: return gn::Suit::Hearts;
        case Suit::Clubs: return gn::Suit::Clubs;
        case Suit::Diamonds: return gn::Suit::Diamonds;
        case Suit::Joker: return gn::Suit::Joker;
        }
        return gn::Suit::Spades;
    }

    auto FromFbSuit(gn::Suit s) noexcept -> Suit
    {
        switch (s)
        {
        case gn::Suit::Spades: return Suit::Spades;
        case gn::Suit::Hearts: return Suit::Hearts;
        case gn::Suit::Clubs: return Suit::Clubs;
        case gn::Suit::Diamonds: return Suit::Diamonds;
        case gn::Suit::Joker: return Suit::Joker;
        }
        return Suit::Spades;
    }

    // Both enums follow face value from Two upward
    auto ToFbRank(Rank r) noexcept -> gn::Rank
    {
        return static_cast<gn::Rank>(static_cast<uint8_t>(r));
    }

    auto FromFbRank(gn::Rank r) noexcept -> Rank
    {
        auto const v = static_cast<uint8_t>(r);
        if (v < static_cast<uint8_t>(Rank::Two) || v > static_cast<uint8_t>(Rank::BigJoker))
            return Rank::Two;
        return static_cast<Rank>(v);
    }

    auto ToFbPhase(Phase p) noexcept -> gn::Phase
    {
        switch (p)
        {
        case Phase::Waiting: return gn::Phase::Waiting;
        case Phase::Drawing: return gn::Phase::Drawing;
        case Phase::Exchanging: return gn::Phase::Exchanging;
        case Phase::Playing: return gn::Phase::Playing;
        case Phase::Finished: return gn::Phase::Finished;
        }
        return gn::Phase::Waiting;
    }

    auto FromFbPhase(gn::Phase p) noexcept -> Phase
    {
        switch (p)
        {
        case gn::Phase::Waiting: return Phase::Waiting;
        case gn::Phase::Drawing: return Phase::Drawing;
        case gn::Phase::Exchanging: return Phase::Exchanging;
        case gn::Phase::Playing: return Phase::Playing;
        case gn::Phase::Finished: return Phase::Finished;
        }
        return Phase::Waiting;
    }

    static inline auto ToFbCard(flatbuffers::FlatBufferBuilder& fbb, CardVal const& cv)
        -> flatbuffers::Offset<gn::Card>
    {
        return gn::CreateCard(fbb, cv.id, ToFbSuit(cv.suit), ToFbRank(cv.rank));
    }

    static inline auto ToFbCards(flatbuffers::FlatBufferBuilder& fbb, std::span<CardVal const> cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<gn::Card>>>
    {
        std::vector<flatbuffers::Offset<gn::Card>> vec;
        vec.reserve(cards.size());
        for (CardVal const& cv : cards) vec.push_back(ToFbCard(fbb, cv));
        return fbb.CreateVector(vec);
    }

    static inline auto ToFbLevels(flatbuffers::FlatBufferBuilder& fbb, TeamLevels const& levels)
        -> flatbuffers::Offset<flatbuffers::Vector<uint8_t>>
    {
        std::vector<uint8_t> vec;
        for (Rank const r : levels) vec.push_back(static_cast<uint8_t>(r));
        return fbb.CreateVector(vec);
    }

    static inline auto ToFbScores(flatbuffers::FlatBufferBuilder& fbb, TeamScores const& scores)
        -> flatbuffers::Offset<flatbuffers::Vector<uint16_t>>
    {
        return fbb.CreateVector(scores.data(), scores.size());
    }

    // ---------- Actions (client → server) ----------

    auto BuildAction(PlayerAction const& a, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const wrap = [&](gn::Action const type, flatbuffers::Offset<void> const body)
        {
            auto const pam = gn::CreatePlayerActionMsg(fbb, msg_id, type, body);
            return Finish(fbb, gn::Message::PlayerActionMsg, pam);
        };

        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, JoinAction>)
            {
                auto const name = fbb.CreateString(act.name);
                auto const j = gn::CreateAction_Join(fbb, OptToByte(act.seat), name);
                return wrap(gn::Action::Action_Join, j.Union());
            }
            else if constexpr (std::is_same_v<T, StartGameAction>)
            {
                return wrap(gn::Action::Action_StartGame, gn::CreateAction_StartGame(fbb).Union());
            }
            else if constexpr (std::is_same_v<T, DeclareMainAction>)
            {
                auto const ids = fbb.CreateVector(act.cards);
                auto const d = gn::CreateAction_DeclareMain(fbb, ids, OptToByte(act.suit));
                return wrap(gn::Action::Action_DeclareMain, d.Union());
            }
            else if constexpr (std::is_same_v<T, ExchangeAction>)
            {
                auto const ids = fbb.CreateVector(act.cards);
                return wrap(gn::Action::Action_Exchange, gn::CreateAction_Exchange(fbb, ids).Union());
            }
            else if constexpr (std::is_same_v<T, PlayAction>)
            {
                auto const ids = fbb.CreateVector(act.cards);
                return wrap(gn::Action::Action_Play, gn::CreateAction_Play(fbb, ids).Union());
            }
            else if constexpr (std::is_same_v<T, StartNextRoundAction>)
            {
                return wrap(gn::Action::Action_StartNextRound, gn::CreateAction_StartNextRound(fbb).Union());
            }
            else
            {
                GZ_THROW(error::Code::Serialization, "Deal is host-only and has no wire form");
            }
        }, a);
    }

    // ---------- Events (server → client) ----------

    auto BuildEvent(Event const& ev, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const wrap = [&](gn::Event const type, flatbuffers::Offset<void> const body)
        {
            auto const em = gn::CreateEventMsg(fbb, msg_id, type, body);
            return Finish(fbb, gn::Message::EventMsg, em);
        };

        return std::visit([&]<typename T0>(T0 const& e) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SeatJoinedEvent>)
            {
                auto const name = fbb.CreateString(e.name);
                return wrap(gn::Event::Event_SeatJoined,
                            gn::CreateEvent_SeatJoined(fbb, e.seat, e.team, name).Union());
            }
            else if constexpr (std::is_same_v<T, RoundStartedEvent>)
            {
                auto const levels = ToFbLevels(fbb, e.team_levels);
                return wrap(gn::Event::Event_RoundStarted,
                            gn::CreateEvent_RoundStarted(fbb, e.round, OptToByte(e.dealer),
                                                         ToFbRank(e.level), levels).Union());
            }
            else if constexpr (std::is_same_v<T, PhaseChangedEvent>)
            {
                return wrap(gn::Event::Event_PhaseChanged,
                            gn::CreateEvent_PhaseChanged(fbb, ToFbPhase(e.phase)).Union());
            }
            else if constexpr (std::is_same_v<T, CardDealtEvent>)
            {
                auto const card = ToFbCard(fbb, e.card);
                return wrap(gn::Event::Event_CardDealt,
                            gn::CreateEvent_CardDealt(fbb, e.seat, card).Union());
            }
            else if constexpr (std::is_same_v<T, MainDeclaredEvent>)
            {
                return wrap(gn::Event::Event_MainDeclared,
                            gn::CreateEvent_MainDeclared(fbb, OptToByte(e.suit), e.by_seat,
                                                         e.strength, e.card_count).Union());
            }
            else if constexpr (std::is_same_v<T, ExchangeStartedEvent>)
            {
                return wrap(gn::Event::Event_ExchangeStarted,
                            gn::CreateEvent_ExchangeStarted(fbb, e.dealer, OptToByte(e.main_suit),
                                                            ToFbRank(e.level)).Union());
            }
            else if constexpr (std::is_same_v<T, BottomCardsRevealedEvent>)
            {
                auto const cards = ToFbCards(fbb, e.cards);
                return wrap(gn::Event::Event_BottomCardsRevealed,
                            gn::CreateEvent_BottomCardsRevealed(fbb, e.seat, cards).Union());
            }
            else if constexpr (std::is_same_v<T, PlayStartedEvent>)
            {
                return wrap(gn::Event::Event_PlayStarted,
                            gn::CreateEvent_PlayStarted(fbb, e.leader).Union());
            }
            else if constexpr (std::is_same_v<T, PlayAcceptedEvent>)
            {
                auto const cards = ToFbCards(fbb, e.cards);
                return wrap(gn::Event::Event_PlayAccepted,
                            gn::CreateEvent_PlayAccepted(fbb, e.seat, cards, e.next_turn).Union());
            }
            else if constexpr (std::is_same_v<T, TrickResolvedEvent>)
            {
                auto const scores = ToFbScores(fbb, e.scores);
                return wrap(gn::Event::Event_TrickResolved,
                            gn::CreateEvent_TrickResolved(fbb, e.winner, e.points, scores).Union());
            }
            else if constexpr (std::is_same_v<T, RoundFinishedEvent>)
            {
                auto const scores = ToFbScores(fbb, e.scores);
                auto const levels = ToFbLevels(fbb, e.levels);
                return wrap(gn::Event::Event_RoundFinished,
                            gn::CreateEvent_RoundFinished(fbb, scores, levels, e.next_dealer,
                                                          e.bottom_points, e.kou_di_bonus,
                                                          OptToByte(e.catching_winner),
                                                          OptToByte(e.match_winner)).Union());
            }
            else
            {
                auto const text = fbb.CreateString(error::describe(e.reason));
                return wrap(gn::Event::Event_ActionRejected,
                            gn::CreateEvent_ActionRejected(fbb, static_cast<uint16_t>(e.reason.code),
                                                           text).Union());
            }
        }, ev);
    }

    // ---------- Snapshot (server → client) ----------

    auto BuildSnapshot(SeatView const& view, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        GZ_ASSERT(view.room != nullptr, "Seat view without room snapshot");
        RoomSnapshot const& snap = *view.room;
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<gn::SeatInfo>> seats;
        seats.reserve(snap.seats.size());
        for (SeatInfo const& s : snap.seats)
        {
            auto const name = fbb.CreateString(s.name);
            seats.push_back(gn::CreateSeatInfo(fbb, s.occupied, name, s.team, s.hand_count));
        }
        auto const seats_vec = fbb.CreateVector(seats);

        std::vector<flatbuffers::Offset<gn::TrickPlay>> trick;
        trick.reserve(snap.trick.size());
        for (TrickEntryView const& t : snap.trick)
        {
            auto const cards = ToFbCards(fbb, t.cards);
            trick.push_back(gn::CreateTrickPlay(fbb, t.seat, cards));
        }
        auto const trick_vec = fbb.CreateVector(trick);

        auto const levels = ToFbLevels(fbb, snap.team_levels);
        auto const points = ToFbScores(fbb, snap.team_points);
        auto const hand = ToFbCards(fbb, view.hand);
        auto const bottom = ToFbCards(fbb, view.bottom);

        auto const sv = gn::CreateSeatView(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*seat*/ view.seat,
            /*phase*/ ToFbPhase(snap.phase),
            /*round_no*/ snap.round,
            /*seats*/ seats_vec,
            /*dealer*/ OptToByte(snap.dealer),
            /*current_turn*/ OptToByte(snap.current_turn),
            /*level*/ ToFbRank(snap.level),
            /*team_levels*/ levels,
            /*main_suit*/ OptToByte(snap.main_suit),
            /*declarer*/ OptToByte(snap.declarer),
            /*declaration_strength*/ snap.declaration_strength,
            /*trick*/ trick_vec,
            /*team_points*/ points,
            /*deck_remaining*/ snap.deck_remaining,
            /*match_winner*/ OptToByte(snap.match_winner),
            /*hand*/ hand,
            /*bottom*/ bottom
        );
        auto const sm = gn::CreateSnapshotMsg(fbb, msg_id, sv);
        return Finish(fbb, gn::Message::SnapshotMsg, sm);
    }

    // ---------- Decode ----------

    static auto VerifiedEnvelope(std::span<std::byte const> bytes)
        -> std::expected<gn::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return Fail("buffer too small");
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!gn::VerifyEnvelopeBuffer(verifier))
            return Fail("buffer failed verification");
        auto const* env = gn::GetEnvelope(data);
        if (!env)
            return Fail("bad root");
        return env;
    }

    static auto CardIds(flatbuffers::Vector<uint16_t> const* v) -> std::vector<CardId>
    {
        if (!v) return {};
        return std::vector<CardId>(v->begin(), v->end());
    }

    static auto CardFromFb(gn::Card const* c) -> std::expected<CardVal, ParseError>
    {
        if (!c) return Fail("missing card");
        if (static_cast<uint8_t>(c->suit()) > static_cast<uint8_t>(gn::Suit::Joker))
            return Fail("bad suit");
        auto const r = static_cast<uint8_t>(c->rank());
        if (r < static_cast<uint8_t>(gn::Rank::Two) || r > static_cast<uint8_t>(gn::Rank::BigJoker))
            return Fail("bad rank");
        return CardVal{c->id(), FromFbSuit(c->suit()), FromFbRank(c->rank())};
    }

    static auto CardsFromFb(flatbuffers::Vector<flatbuffers::Offset<gn::Card>> const* v)
        -> std::expected<std::vector<CardVal>, ParseError>
    {
        std::vector<CardVal> out;
        if (!v) return out;
        out.reserve(v->size());
        for (auto const* c : *v)
        {
            auto cv = CardFromFb(c);
            if (!cv) return std::unexpected(cv.error());
            out.push_back(*cv);
        }
        return out;
    }

    template <typename Arr>
    static auto FixedArray(flatbuffers::Vector<typename Arr::value_type> const* v, char const* what)
        -> std::expected<Arr, ParseError>
    {
        Arr out{};
        if (!v || v->size() != out.size())
            return Fail(std::string{"bad "} + what + " length");
        std::copy(v->begin(), v->end(), out.begin());
        return out;
    }

    static auto LevelsFromFb(flatbuffers::Vector<uint8_t> const* v) -> std::expected<TeamLevels, ParseError>
    {
        TeamLevels out{};
        if (!v || v->size() != out.size())
            return Fail("bad levels length");
        for (size_t i{}; i < out.size(); ++i)
        {
            uint8_t const r = v->Get(static_cast<flatbuffers::uoffset_t>(i));
            if (r < static_cast<uint8_t>(Rank::Two) || r > static_cast<uint8_t>(Rank::Ace))
                return Fail("bad level");
            out[i] = static_cast<Rank>(r);
        }
        return out;
    }

    auto DecodePlayerAction(std::span<std::byte const> bytes)
        -> std::expected<PlayerAction, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());
        if ((*env)->message_type() != gn::Message::PlayerActionMsg)
            return Fail("not a PlayerActionMsg");

        auto const* pam = (*env)->message_as_PlayerActionMsg();
        // a union tag without its table passes verification
        if (!pam || !pam->action()) return Fail("empty action");
        switch (pam->action_type())
        {
        case gn::Action::Action_Join:
        {
            auto const* j = pam->action_as_Action_Join();
            auto const seat = ByteToOpt<SeatIdxT>(j->seat(), constants::SeatCount, "seat");
            if (!seat) return std::unexpected(seat.error());
            return JoinAction{*seat, j->name() ? j->name()->str() : std::string{}};
        }
        case gn::Action::Action_StartGame:
            return StartGameAction{};
        case gn::Action::Action_DeclareMain:
        {
            auto const* d = pam->action_as_Action_DeclareMain();
            auto const suit = ByteToOpt<Suit>(d->suit(), 5, "suit");
            if (!suit) return std::unexpected(suit.error());
            return DeclareMainAction{CardIds(d->cards()), *suit};
        }
        case gn::Action::Action_Exchange:
            return ExchangeAction{CardIds(pam->action_as_Action_Exchange()->cards())};
        case gn::Action::Action_Play:
            return PlayAction{CardIds(pam->action_as_Action_Play()->cards())};
        case gn::Action::Action_StartNextRound:
            return StartNextRoundAction{};
        default:
            return Fail("unknown action variant");
        }
    }

    auto DecodeEvent(std::span<std::byte const> bytes)
        -> std::expected<Event, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());
        if ((*env)->message_type() != gn::Message::EventMsg)
            return Fail("not an EventMsg");

        auto const* em = (*env)->message_as_EventMsg();
        if (!em || !em->event()) return Fail("empty event");
        switch (em->event_type())
        {
        case gn::Event::Event_SeatJoined:
        {
            auto const* e = em->event_as_Event_SeatJoined();
            return SeatJoinedEvent{e->seat(), e->team(), e->name() ? e->name()->str() : std::string{}};
        }
        case gn::Event::Event_RoundStarted:
        {
            auto const* e = em->event_as_Event_RoundStarted();
            auto const dealer = ByteToOpt<SeatIdxT>(e->dealer(), constants::SeatCount, "dealer");
            if (!dealer) return std::unexpected(dealer.error());
            auto const levels = LevelsFromFb(e->team_levels());
            if (!levels) return std::unexpected(levels.error());
            return RoundStartedEvent{e->round_no(), *dealer, FromFbRank(e->level()), *levels};
        }
        case gn::Event::Event_PhaseChanged:
            return PhaseChangedEvent{FromFbPhase(em->event_as_Event_PhaseChanged()->phase())};
        case gn::Event::Event_CardDealt:
        {
            auto const* e = em->event_as_Event_CardDealt();
            auto const card = CardFromFb(e->card());
            if (!card) return std::unexpected(card.error());
            return CardDealtEvent{e->seat(), *card};
        }
        case gn::Event::Event_MainDeclared:
        {
            auto const* e = em->event_as_Event_MainDeclared();
            auto const suit = ByteToOpt<Suit>(e->suit(), 5, "suit");
            if (!suit) return std::unexpected(suit.error());
            return MainDeclaredEvent{*suit, e->by_seat(), e->strength(), e->card_count()};
        }
        case gn::Event::Event_ExchangeStarted:
        {
            auto const* e = em->event_as_Event_ExchangeStarted();
            auto const suit = ByteToOpt<Suit>(e->main_suit(), 5, "suit");
            if (!suit) return std::unexpected(suit.error());
            return ExchangeStartedEvent{e->dealer(), *suit, FromFbRank(e->level())};
        }
        case gn::Event::Event_BottomCardsRevealed:
        {
            auto const* e = em->event_as_Event_BottomCardsRevealed();
            auto cards = CardsFromFb(e->cards());
            if (!cards) return std::unexpected(cards.error());
            return BottomCardsRevealedEvent{e->seat(), std::move(*cards)};
        }
        case gn::Event::Event_PlayStarted:
            return PlayStartedEvent{em->event_as_Event_PlayStarted()->leader()};
        case gn::Event::Event_PlayAccepted:
        {
            auto const* e = em->event_as_Event_PlayAccepted();
            auto cards = CardsFromFb(e->cards());
            if (!cards) return std::unexpected(cards.error());
            return PlayAcceptedEvent{e->seat(), std::move(*cards), e->next_turn()};
        }
        case gn::Event::Event_TrickResolved:
        {
            auto const* e = em->event_as_Event_TrickResolved();
            auto const scores = FixedArray<TeamScores>(e->scores(), "scores");
            if (!scores) return std::unexpected(scores.error());
            return TrickResolvedEvent{e->winner(), e->points(), *scores};
        }
        case gn::Event::Event_RoundFinished:
        {
            auto const* e = em->event_as_Event_RoundFinished();
            auto const scores = FixedArray<TeamScores>(e->scores(), "scores");
            if (!scores) return std::unexpected(scores.error());
            auto const levels = LevelsFromFb(e->levels());
            if (!levels) return std::unexpected(levels.error());
            auto const catching = ByteToOpt<TeamIdxT>(e->catching_winner(), constants::TeamCount, "team");
            if (!catching) return std::unexpected(catching.error());
            auto const winner = ByteToOpt<TeamIdxT>(e->match_winner(), constants::TeamCount, "team");
            if (!winner) return std::unexpected(winner.error());
            return RoundFinishedEvent{*scores, *levels, e->next_dealer(), e->bottom_points(),
                                      e->kou_di_bonus(), *catching, *winner};
        }
        case gn::Event::Event_ActionRejected:
        {
            auto const* e = em->event_as_Event_ActionRejected();
            if (e->code() > static_cast<uint16_t>(error::RuleViolationCode::Internal_Unreachable))
                return Fail("bad violation code");
            return ActionRejectedEvent{error::Viol(static_cast<error::RuleViolationCode>(e->code()))};
        }
        default:
            return Fail("unknown event variant");
        }
    }
} // namespace gunzi::core::net
