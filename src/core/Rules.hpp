//
// Rules.hpp
//

#ifndef GUNZI_RULES_HPP
#define GUNZI_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace gunzi::core
{
    //forward declaration
    class RoomImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        // `actor` is the submitting seat, nullopt for unseated connections and the host.
        virtual auto Validate(RoomImpl const& room,
                              std::optional<SeatIdxT> actor,
                              PlayerAction const& a) const -> CheckResult = 0;

        // Mutate authoritative state. Only called after Validate accepted the action.
        // Returns the seat bound by the action (joins), nullopt otherwise.
        virtual auto Apply(RoomImpl& room,
                           std::optional<SeatIdxT> actor,
                           PlayerAction const& a) -> std::optional<SeatIdxT> = 0;

        // Runs the automatic transitions that follow an applied action
        virtual auto Advance(RoomImpl& room) -> MoveOutcome = 0;
    };
}

#endif //GUNZI_RULES_HPP
