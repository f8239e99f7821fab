//
// Exception.hpp
//

#ifndef GUNZI_EXCEPTION_HPP
#define GUNZI_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace gunzi::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not user invalid move)
        State, // state engine misuse, deck corruption
        InvalidAction, // user/remote proposed action cannot be applied
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define GZ_THROW(code_enum, msg) ::gunzi::core::error::fail((code_enum), (msg))
#define GZ_ASSERT(cond, msg) do { if(!(cond)) ::gunzi::core::error::fail(::gunzi::core::error::Code::Assertion, (msg)); } while(0)

    // Player-facing rejections. Never thrown; carried back to the submitting seat.
    enum class RuleViolationCode : std::uint16_t
    {
        // Flow
        InvalidPhase,
        NotYourTurn,
        NotDealer,
        NotSeated,

        // Seating
        InvalidSeat,
        RoomFull,
        SeatTaken,
        NotEnoughPlayers,

        // Card selection
        UnknownCard,
        DuplicateCard,

        // Play structure
        WrongCardCount,
        InvalidStructure,
        MustFollowSuit,
        MustExhaustSuit,
        DeadStick,

        // Declaration
        InvalidDeclaration,
        DeclarationTooWeak,

        // Match
        MatchOver,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<SeatIdxT> actor{};
        std::optional<SeatIdxT> turn{};
        std::optional<SeatIdxT> dealer{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> expected_count{};
        std::optional<std::uint8_t> attempted_count{};
        std::optional<std::uint8_t> required_size{}; // dead stick threshold
        std::optional<std::uint16_t> strength{};     // declaration strength to beat

        std::optional<CardId> card{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(std::optional<SeatIdxT> s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_turn(std::optional<SeatIdxT> s) -> RuleViolation&
        {
            turn = s;
            return *this;
        }

        auto with_dealer(std::optional<SeatIdxT> s) -> RuleViolation&
        {
            dealer = s;
            return *this;
        }

        auto with_expected(std::uint8_t v) -> RuleViolation&
        {
            expected_count = v;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_required(std::uint8_t v) -> RuleViolation&
        {
            required_size = v;
            return *this;
        }

        auto with_strength(std::uint16_t v) -> RuleViolation&
        {
            strength = v;
            return *this;
        }

        auto with_card(CardId c) -> RuleViolation&
        {
            card = c;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::InvalidPhase: return "Action not permitted in current phase";
        case E::NotYourTurn: return "Not your turn";
        case E::NotDealer: return "Only the dealer may exchange";
        case E::NotSeated: return "Connection holds no seat";

        // Seating
        case E::InvalidSeat: return "Seat index out of range";
        case E::RoomFull: return "Room full";
        case E::SeatTaken: return "Seat already taken";
        case E::NotEnoughPlayers: return "Need six seated players";

        // Cards
        case E::UnknownCard: return "Card not in hand";
        case E::DuplicateCard: return "Card referenced twice";

        // Play
        case E::WrongCardCount: return "Wrong number of cards";
        case E::InvalidStructure: return "Cards do not form a single/pair/triple/quad";
        case E::MustFollowSuit: return "Must follow the led suit";
        case E::MustExhaustSuit: return "Must play every card of the led suit";
        case E::DeadStick: return "Dead stick: must play the largest available structure";

        // Declaration
        case E::InvalidDeclaration: return "Cards cannot declare main";
        case E::DeclarationTooWeak: return "Declaration not stronger than current";

        case E::MatchOver: return "Match already decided";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Waiting: return "Waiting";
        case Phase::Drawing: return "Drawing";
        case Phase::Exchanging: return "Exchanging";
        case Phase::Playing: return "Playing";
        case Phase::Finished: return "Finished";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.turn) s += std::format(" | turn=P{}", static_cast<int>(*v.turn));
        if (v.dealer) s += std::format(" | dealer=P{}", static_cast<int>(*v.dealer));
        if (v.expected_count) s += std::format(" | expected={}", static_cast<int>(*v.expected_count));
        if (v.attempted_count) s += std::format(" | attempted={}", static_cast<int>(*v.attempted_count));
        if (v.required_size) s += std::format(" | required={}", static_cast<int>(*v.required_size));
        if (v.strength) s += std::format(" | strength={}", *v.strength);
        if (v.card) s += std::format(" | card={}", *v.card);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{ .code = code };
    }
}

#endif //GUNZI_EXCEPTION_HPP
