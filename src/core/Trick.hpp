//
// Trick.hpp
//

#ifndef GUNZI_TRICK_HPP
#define GUNZI_TRICK_HPP

#include <span>
#include "Types.hpp"
#include "Trump.hpp"

namespace gunzi::core
{
    struct TrickPlay
    {
        SeatIdxT seat{};
        std::vector<CardSP> cards;
    };

    // Winner of a set of plays; plays[0] is the lead. Storage order of followers does not matter,
    // ties go to the seat closest clockwise to the leader.
    auto ResolveWinner(std::span<TrickPlay const> plays, TrumpContext const& ctx) -> SeatIdxT;

    // Owns the cards of the trick in progress
    class Trick
    {
    public:
        auto Add(SeatIdxT seat, std::vector<CardSP> cards) -> void;

        [[nodiscard]] auto Plays() const noexcept -> std::span<TrickPlay const> { return plays_; }
        [[nodiscard]] auto Leader() const -> TrickPlay const&;
        [[nodiscard]] auto Size() const noexcept -> size_t { return plays_.size(); }
        [[nodiscard]] auto Empty() const noexcept -> bool { return plays_.empty(); }
        [[nodiscard]] auto Full() const noexcept -> bool { return plays_.size() == constants::MaxTrickEntries; }
        [[nodiscard]] auto Points() const -> uint16_t;
        [[nodiscard]] auto Winner(TrumpContext const& ctx) const -> SeatIdxT;

        // Empties the trick and hands the cards back
        auto Release() -> std::vector<CardSP>;

    private:
        std::vector<TrickPlay> plays_;
    };
}

#endif //GUNZI_TRICK_HPP
