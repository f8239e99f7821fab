//
// FollowRules.hpp
//

#ifndef GUNZI_FOLLOWRULES_HPP
#define GUNZI_FOLLOWRULES_HPP

#include <span>
#include "Types.hpp"
#include "Trump.hpp"
#include "Exception.hpp"

namespace gunzi::core
{
    // The lead must be a single, pair, triple or quad
    auto ValidateLead(std::span<CardSP const> submitted) -> error::ValidateResult;

    // `hand` is the follower's full hand before the submitted cards are removed.
    // Checks count, suit following, exhaustion, then the dead-stick structure requirement.
    auto ValidateFollow(std::span<CardSP const> leader,
                        std::span<CardSP const> submitted,
                        std::span<CardSP const> hand,
                        TrumpContext const& ctx) -> error::ValidateResult;
}

#endif //GUNZI_FOLLOWRULES_HPP
