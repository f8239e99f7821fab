//
// GunziRules.hpp
//

#ifndef GUNZI_GUNZIRULES_HPP
#define GUNZI_GUNZIRULES_HPP

#include <array>
#include "Rules.hpp"

namespace gunzi::core
{
    class GunziRules final : public Rules
    {
    public:
        auto Validate(RoomImpl const& room,
                      std::optional<SeatIdxT> actor,
                      PlayerAction const& a) const -> CheckResult override;
        auto Apply(RoomImpl& room,
                   std::optional<SeatIdxT> actor,
                   PlayerAction const& a) -> std::optional<SeatIdxT> override;
        auto Advance(RoomImpl& room) -> MoveOutcome override;

        // [phase][action index] -> permitted
        using PhaseTable = std::array<std::array<bool, ActionKindCount>, PhaseCount>;
        static constexpr PhaseTable Permitted{{
            //  Join   Start  Declare Exchange Play   Next   Deal
            {{  true,  true,  false,  false,   false, false, false }}, // Waiting
            {{  false, false, true,   false,   false, false, true  }}, // Drawing
            {{  false, false, false,  true,    false, false, false }}, // Exchanging
            {{  false, false, false,  false,   true,  false, false }}, // Playing
            {{  false, false, false,  false,   false, true,  false }}, // Finished
        }};

        static constexpr auto IsPermitted(Phase const p, size_t const action_index) noexcept -> bool
        {
            return Permitted[static_cast<size_t>(p)][action_index];
        }
    };
}

#endif //GUNZI_GUNZIRULES_HPP
