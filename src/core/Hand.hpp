//
// Hand.hpp
//

#ifndef GUNZI_HAND_HPP
#define GUNZI_HAND_HPP

#include <expected>
#include <span>
#include <unordered_map>
#include "Types.hpp"
#include "Exception.hpp"

namespace gunzi::core
{
    // Cards owned by one seat, keyed by instance id
    class Hand
    {
    public:
        using SelectResult = std::expected<std::vector<CardSP>, error::RuleViolation>;

        // Throws (Assertion) when the id is already held
        auto Add(CardSP card) -> void;

        [[nodiscard]] auto Contains(CardId id) const -> bool { return cards_.contains(id); }
        // nullptr if not held
        [[nodiscard]] auto Find(CardId id) const -> CardSP;

        // Resolves ids against the hand without removing anything.
        // UnknownCard for ids not held, DuplicateCard for repeated ids.
        [[nodiscard]] auto Select(std::span<CardId const> ids) const -> SelectResult;

        // Removes and returns the cards; every id must be held
        auto Take(std::span<CardId const> ids) -> std::vector<CardSP>;

        // Ordered by id so views are reproducible
        [[nodiscard]] auto Cards() const -> std::vector<CardSP>;
        [[nodiscard]] auto Values() const -> std::vector<CardVal>;

        [[nodiscard]] auto Size() const noexcept -> size_t { return cards_.size(); }
        [[nodiscard]] auto Empty() const noexcept -> bool { return cards_.empty(); }
        auto Clear() -> void { cards_.clear(); }

    private:
        std::unordered_map<CardId, CardSP> cards_;
    };
}

#endif //GUNZI_HAND_HPP
