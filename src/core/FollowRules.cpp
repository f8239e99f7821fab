//
// FollowRules.cpp
//

#include "FollowRules.hpp"

#include <algorithm>
#include <iterator>
#include "Structure.hpp"

namespace gunzi::core
{
    using RVC = error::RuleViolationCode;
    using error::Viol;

    static auto CountSuit(std::span<CardSP const> cards, LogicSuit const target, TrumpContext const& ctx) -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(
            cards, [&](CardSP const& c) { return EffectiveSuit(*c, ctx) == target; }));
    }

    auto ValidateLead(std::span<CardSP const> submitted) -> error::ValidateResult
    {
        if (submitted.empty())
            return std::unexpected(Viol(RVC::WrongCardCount).with_attempted(0));
        if (Classify(submitted) == Structure::Invalid)
            return std::unexpected(Viol(RVC::InvalidStructure)
                                   .with_attempted(static_cast<uint8_t>(submitted.size())));
        return {};
    }

    auto ValidateFollow(std::span<CardSP const> leader,
                        std::span<CardSP const> submitted,
                        std::span<CardSP const> hand,
                        TrumpContext const& ctx) -> error::ValidateResult
    {
        GZ_ASSERT(!leader.empty(), "Following an empty lead");
        size_t const leader_count = leader.size();

        if (submitted.size() != leader_count)
            return std::unexpected(Viol(RVC::WrongCardCount)
                                   .with_expected(static_cast<uint8_t>(leader_count))
                                   .with_attempted(static_cast<uint8_t>(submitted.size())));

        LogicSuit const target = EffectiveSuit(*leader.front(), ctx);
        size_t const hand_suit = CountSuit(hand, target, ctx);
        size_t const played_suit = CountSuit(submitted, target, ctx);

        if (hand_suit >= leader_count && played_suit < leader_count)
            return std::unexpected(Viol(RVC::MustFollowSuit)
                                   .with_expected(static_cast<uint8_t>(leader_count))
                                   .with_attempted(static_cast<uint8_t>(played_suit)));
        if (played_suit < hand_suit && played_suit < leader_count)
            return std::unexpected(Viol(RVC::MustExhaustSuit)
                                   .with_expected(static_cast<uint8_t>(hand_suit))
                                   .with_attempted(static_cast<uint8_t>(played_suit)));

        if (played_suit != leader_count) return {};

        // Dead stick: the follower must match the largest structure its suit cards can form,
        // searching down from the lead size to pairs.
        std::vector<CardSP> suit_cards;
        std::ranges::copy_if(hand, std::back_inserter(suit_cards),
                             [&](CardSP const& c) { return EffectiveSuit(*c, ctx) == target; });
        size_t const hand_group = LargestGroup(suit_cards);
        size_t const submitted_group = LargestGroup(submitted);

        for (size_t req = SizeOf(Classify(leader)); req >= 2; --req)
        {
            if (hand_group < req) continue;
            if (submitted_group < req)
                return std::unexpected(Viol(RVC::DeadStick)
                                       .with_required(static_cast<uint8_t>(req))
                                       .with_attempted(static_cast<uint8_t>(submitted_group)));
            break;
        }
        return {};
    }
}
