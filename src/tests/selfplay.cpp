//
// selfplay.cpp
//
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <thread>

#include "../core/Arbiter.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingSink.hpp"
#include "RandomSeat.hpp"

using namespace gunzi::core;
using gunzi::test::RandomSeat;
using RVC = error::RuleViolationCode;

namespace
{

auto make_seats(std::uint64_t seed) -> std::vector<RandomSeat>
{
    std::vector<RandomSeat> seats;
    seats.reserve(constants::SeatCount);
    for (std::size_t i{}; i < constants::SeatCount; ++i)
    {
        seats.emplace_back(seed + static_cast<std::uint64_t>(i + 1));
    }
    return seats;
}

auto seat_everyone(Arbiter& arb) -> void
{
    for (std::size_t i{}; i < constants::SeatCount; ++i)
    {
        auto const r = arb.Submit(std::nullopt, JoinAction{std::nullopt, std::format("bot{}", i)});
        ASSERT_TRUE(r.has_value());
    }
}

auto check(Arbiter const& arb) -> void
{
    arb.WithRoom([](RoomImpl const& r) { debug::CheckInvariants(r); });
}

// Submits one action for `actor` with the transcript around it
auto submit_logged(Arbiter& arb, debug::AuditLogger& log, SeatIdxT const actor, PlayerAction const& a)
    -> Arbiter::SubmitResult
{
    arb.WithRoom([&](RoomImpl const& r) { log.action(r, actor, a); });
    Arbiter::SubmitResult res = arb.Submit(actor, a);
    log.outcome(res);
    return res;
}

} // anonymous namespace

TEST(SelfPlay, Rounds_Transcripts_And_Invariants)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    constexpr std::size_t kRounds = 3;

    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull, 1ull, 23ull, 44ull})
        {
            std::string const path = std::format("_artifacts/gunzi_{}.log", seed);
            debug::AuditLogger log(path);
            auto sink = std::make_shared<debug::RecordingSink>(&log);

            RoomConfig cfg{};
            cfg.seed = seed;
            Arbiter arb{cfg, sink};
            std::vector<RandomSeat> seats = make_seats(seed);

            seat_everyone(arb);
            arb.WithRoom([&](RoomImpl const& r) { log.start(r, seed); });

            std::size_t rounds{0};
            bool match_over = false;
            while (rounds < kRounds && !match_over)
            {
                ASSERT_TRUE(submit_logged(arb, log, 0, StartGameAction{}).has_value());

                // Drawing: one card at a time, every seat may bid after each card
                while (arb.Snapshot()->phase == Phase::Drawing)
                {
                    ASSERT_TRUE(arb.DealNext().has_value());
                    if (arb.Snapshot()->phase != Phase::Drawing) break;
                    for (SeatIdxT s{}; s < constants::SeatCount; ++s)
                    {
                        std::optional<PlayerAction> const bid = seats[s].Choose(*arb.SnapshotFor(s));
                        if (!bid) continue;
                        auto const res = submit_logged(arb, log, s, *bid);
                        ASSERT_TRUE(res.has_value()) << error::describe(res.error());
                    }
                    check(arb);
                }

                for (;;)
                {
                    auto const snap = arb.Snapshot();
                    if (snap->phase != Phase::Exchanging && snap->phase != Phase::Playing) break;
                    ASSERT_TRUE(snap->current_turn.has_value());
                    SeatIdxT const actor = *snap->current_turn;

                    std::optional<PlayerAction> const a = seats[actor].Choose(*arb.SnapshotFor(actor));
                    ASSERT_TRUE(a.has_value()) << "seat " << int(actor) << " had nothing to play";

                    auto const res = submit_logged(arb, log, actor, *a);
                    ASSERT_TRUE(res.has_value()) << debug::ActionText(*a) << ": " << error::describe(res.error());
                    check(arb);

                    if (res->outcome == MoveOutcome::RoundEnded || res->outcome == MoveOutcome::MatchEnded)
                        break;
                }

                auto const snap = arb.Snapshot();
                ASSERT_EQ(snap->phase, Phase::Finished);
                for (SeatInfo const& seat : snap->seats) EXPECT_EQ(seat.hand_count, 0);
                arb.WithRoom([&](RoomImpl const& r)
                {
                    log.round_end(r);
                    ASSERT_TRUE(r.Settlement().has_value());
                    RoundSettlement const& s = *r.Settlement();
                    // 400 card points plus the bonus on the bottom
                    uint32_t const total = s.team_points[0] + s.team_points[1] + s.team_points[2];
                    EXPECT_EQ(total, static_cast<uint32_t>(constants::TotalPoints + s.kou_di_bonus - s.bottom_points));
                });
                EXPECT_EQ(sink->OfType<RoundFinishedEvent>().size(), rounds + 1);

                match_over = snap->match_winner.has_value();
                ++rounds;
                if (!match_over)
                {
                    ASSERT_TRUE(submit_logged(arb, log, 1, StartNextRoundAction{}).has_value());
                    EXPECT_EQ(arb.Snapshot()->phase, Phase::Waiting);
                    EXPECT_EQ(arb.Snapshot()->round, rounds + 1);
                }
            }
            log.flush();

            ASSERT_TRUE(fs::exists(path));
            ASSERT_GT(fs::file_size(path), 0u);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        FAIL() << e.what() << "\n" << e.to_str();
    }
}

TEST(SelfPlay, ConcurrentSeatsFinishARound)
{
    using namespace std::chrono_literals;

    for (std::uint64_t seed : {7ull, 8ull})
    {
        auto sink = std::make_shared<debug::RecordingSink>();
        RoomConfig cfg{};
        cfg.seed = seed;
        Arbiter arb{cfg, sink};
        seat_everyone(arb);
        ASSERT_TRUE(arb.Submit(SeatIdxT{0}, StartGameAction{}).has_value());

        auto const deadline = std::chrono::steady_clock::now() + 30s;
        std::atomic<bool> failed{false};
        {
            std::vector<std::jthread> workers;

            // host: deals while the seats race to declare
            workers.emplace_back([&]
            {
                for (;;)
                {
                    auto const r = arb.DealNext();
                    if (!r)
                    {
                        EXPECT_EQ(r.error().code, RVC::InvalidPhase);
                        return;
                    }
                    if (r->outcome == MoveOutcome::DrawingEnded) return;
                }
            });

            for (SeatIdxT s{}; s < constants::SeatCount; ++s)
            {
                workers.emplace_back([&, s]
                {
                    RandomSeat me{seed * 31 + s};
                    while (std::chrono::steady_clock::now() < deadline && !failed)
                    {
                        auto const view = arb.SnapshotFor(s);
                        if (view->room->phase == Phase::Finished) return;

                        std::optional<PlayerAction> const a = me.Choose(*view);
                        if (!a)
                        {
                            std::this_thread::yield();
                            continue;
                        }
                        auto const res = arb.Submit(s, *a);
                        if (res) continue;

                        // a stale view may lose a race for the bid or the phase, never anything else
                        RVC const code = res.error().code;
                        if (code != RVC::DeclarationTooWeak && code != RVC::InvalidPhase)
                        {
                            ADD_FAILURE() << "seat " << int(s) << ": " << error::describe(res.error());
                            failed = true;
                        }
                    }
                });
            }
        }

        ASSERT_FALSE(failed);
        auto const snap = arb.Snapshot();
        ASSERT_EQ(snap->phase, Phase::Finished) << "seed " << seed;
        for (SeatInfo const& seat : snap->seats) EXPECT_EQ(seat.hand_count, 0);
        EXPECT_NO_THROW(check(arb));
        EXPECT_EQ(sink->OfType<RoundFinishedEvent>().size(), 1u);
        // 35 cards a seat: one trick per lead, at least one card per lead
        auto const tricks = sink->OfType<TrickResolvedEvent>().size();
        EXPECT_GE(tricks, 9u);
        EXPECT_LE(tricks, 35u);
    }
}
