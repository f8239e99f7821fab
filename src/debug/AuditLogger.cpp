//
// AuditLogger.cpp
//
#include "AuditLogger.hpp"

#include <array>
#include <format>
#include <ranges>
#include <string_view>
#include <vector>

using namespace gunzi::core;

namespace
{

auto s_suit(Suit const s) -> std::string_view
{
    switch (s)
    {
        case Suit::Spades:   return "S";
        case Suit::Hearts:   return "H";
        case Suit::Clubs:    return "C";
        case Suit::Diamonds: return "D";
        case Suit::Joker:    return "";
    }
    return "?";
}

auto s_opt_suit(std::optional<Suit> const s) -> std::string
{
    return s ? std::string{s_suit(*s)} : std::string{"-"};
}

auto s_rank(Rank const r) -> std::string_view
{
    static constexpr std::array<std::string_view, 15> map{
        "2","3","4","5","6","7","8","9","T","J","Q","K","A","sj","BJ"
    };
    return map[static_cast<size_t>(r) - static_cast<size_t>(Rank::Two)];
}

auto s_seat(std::optional<SeatIdxT> const s) -> std::string
{
    return s ? std::format("P{}", static_cast<int>(*s)) : std::string{"-"};
}

auto s_cards(std::vector<CardVal> const& cards) -> std::string
{
    std::string body;
    for (size_t i{}; i < cards.size(); ++i)
    {
        body += (i ? "," : "");
        body += debug::CardText(cards[i]);
    }
    return body;
}

auto s_ids(std::vector<CardId> const& ids) -> std::string
{
    std::string body;
    for (size_t i{}; i < ids.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("{}", ids[i]);
    }
    return body;
}

auto s_scores(TeamScores const& s) -> std::string
{
    return std::format("{}/{}/{}", s[0], s[1], s[2]);
}

auto s_levels(TeamLevels const& l) -> std::string
{
    std::string out;
    for (size_t i{}; i < l.size(); ++i)
    {
        out += (i ? "/" : "");
        out += s_rank(l[i]);
    }
    return out;
}

auto s_event(Event const& e) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& ev) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SeatJoinedEvent>)
                return std::format("SeatJoined P{} team={} {}", static_cast<int>(ev.seat), static_cast<int>(ev.team), ev.name);
            else if constexpr (std::is_same_v<T, RoundStartedEvent>)
                return std::format("RoundStarted #{} dealer={} level={} levels={}", ev.round, s_seat(ev.dealer),
                                   s_rank(ev.level), s_levels(ev.team_levels));
            else if constexpr (std::is_same_v<T, PhaseChangedEvent>)
                return std::format("Phase {}", error::to_string(ev.phase));
            else if constexpr (std::is_same_v<T, CardDealtEvent>)
                return std::format("Dealt P{} {}", static_cast<int>(ev.seat), debug::CardText(ev.card));
            else if constexpr (std::is_same_v<T, MainDeclaredEvent>)
                return std::format("MainDeclared P{} suit={} strength={}", static_cast<int>(ev.by_seat),
                                   s_opt_suit(ev.suit), ev.strength);
            else if constexpr (std::is_same_v<T, ExchangeStartedEvent>)
                return std::format("ExchangeStarted dealer=P{} main={} level={}", static_cast<int>(ev.dealer),
                                   s_opt_suit(ev.main_suit), s_rank(ev.level));
            else if constexpr (std::is_same_v<T, BottomCardsRevealedEvent>)
                return std::format("Bottom P{} [{}]", static_cast<int>(ev.seat), s_cards(ev.cards));
            else if constexpr (std::is_same_v<T, PlayStartedEvent>)
                return std::format("PlayStarted leader=P{}", static_cast<int>(ev.leader));
            else if constexpr (std::is_same_v<T, PlayAcceptedEvent>)
                return std::format("Played P{} [{}] next=P{}", static_cast<int>(ev.seat), s_cards(ev.cards),
                                   static_cast<int>(ev.next_turn));
            else if constexpr (std::is_same_v<T, TrickResolvedEvent>)
                return std::format("Trick winner=P{} points={} scores={}", static_cast<int>(ev.winner), ev.points,
                                   s_scores(ev.scores));
            else if constexpr (std::is_same_v<T, RoundFinishedEvent>)
                return std::format("RoundFinished scores={} levels={} next_dealer=P{} bottom={} koudi={} match_winner={}",
                                   s_scores(ev.scores), s_levels(ev.levels), static_cast<int>(ev.next_dealer),
                                   ev.bottom_points, ev.kou_di_bonus,
                                   ev.match_winner ? std::format("{}", static_cast<int>(*ev.match_winner)) : "-");
            else
                return std::format("Rejected {}", error::describe(ev.reason));
        },
        e
    );
}

} // anonymous namespace

namespace gunzi::core::debug
{

auto CardText(CardVal const& c) -> std::string
{
    return std::format("{}{}#{}", s_rank(c.rank), s_suit(c.suit), c.id);
}

auto ActionText(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, JoinAction>)
                return std::format("Join({}, {})", s_seat(act.seat), act.name);
            else if constexpr (std::is_same_v<T, StartGameAction>)
                return "StartGame";
            else if constexpr (std::is_same_v<T, DeclareMainAction>)
                return std::format("Declare[{}] suit={}", s_ids(act.cards), s_opt_suit(act.suit));
            else if constexpr (std::is_same_v<T, ExchangeAction>)
                return std::format("Exchange[{}]", s_ids(act.cards));
            else if constexpr (std::is_same_v<T, PlayAction>)
                return std::format("Play[{}]", s_ids(act.cards));
            else if constexpr (std::is_same_v<T, StartNextRoundAction>)
                return "StartNextRound";
            else
                return "Deal";
        },
        a
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(RoomImpl const& room, uint64_t seed) -> void
{
    RoomConfig const& cfg = room.Config();
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Levels={}\n", s_levels(room.Levels()));
    out_ << std::format("CatchThreshold={} LevelStep={} KouDi=x{}\n",
                        cfg.catch_threshold, static_cast<int>(cfg.level_step), cfg.kou_di_multiplier);
    out_.flush();
}

auto AuditLogger::action(RoomImpl const& room,
                         std::optional<SeatIdxT> const actor,
                         PlayerAction const& a) -> void
{
    out_ << std::format(
        "Turn actor={} phase={} turn={} trick={}\n",
        s_seat(actor), error::to_string(room.PhaseNow()), s_seat(room.Turn()), room.CurrentTrick().Size()
    );
    out_ << std::format("Action: {}\n", ActionText(a));
}

auto AuditLogger::outcome(RoomImpl::SubmitResult const& res) -> void
{
    if (!res)
    {
        out_ << std::format("Outcome: Rejected ({})\n", error::describe(res.error()));
        return;
    }
    std::string_view name = "?";
    switch (res->outcome)
    {
        case MoveOutcome::Invalid:      name = "Invalid"; break;
        case MoveOutcome::Applied:      name = "Applied"; break;
        case MoveOutcome::DrawingEnded: name = "DrawingEnded"; break;
        case MoveOutcome::TrickEnded:   name = "TrickEnded"; break;
        case MoveOutcome::RoundEnded:   name = "RoundEnded"; break;
        case MoveOutcome::MatchEnded:   name = "MatchEnded"; break;
    }
    out_ << std::format("Outcome: {}\n", name);
}

auto AuditLogger::event(OutboundEvent const& ev) -> void
{
    out_ << std::format("  -> {} {}\n", ev.target ? s_seat(ev.target) : std::string{"*"}, s_event(ev.event));
}

auto AuditLogger::round_end(RoomImpl const& room) -> void
{
    std::string hands;
    for (SeatIdxT s{0}; s < constants::SeatCount; ++s)
        hands += std::format(" P{}={}", static_cast<int>(s), room.HandOf(s).Size());

    out_ << std::format("RoundEnd #{} hands:{} points={}", room.Round(), hands, s_scores(room.Points()));
    if (auto const& st = room.Settlement())
        out_ << std::format(" settled={} next_dealer=P{}", s_scores(st->team_points), static_cast<int>(st->next_dealer));
    out_ << "\n";
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace gunzi::core::debug
