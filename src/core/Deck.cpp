//
// Deck.cpp
//

#include "Deck.hpp"

#include <algorithm>
#include <format>
#include <map>
#include <numeric>
#include "Exception.hpp"
#include "Util.hpp"

namespace gunzi::core
{
    auto BuildDeck(std::mt19937_64& rng) -> std::vector<CardSP>
    {
        std::vector<CardSP> deck;
        deck.reserve(constants::DeckSize);
        CardId next_id{0};
        for (size_t copy{}; copy < constants::DeckCopies; ++copy)
        {
            for (size_t s{}; s < 4; ++s)
            {
                for (size_t r{static_cast<size_t>(Rank::Two)}; r <= static_cast<size_t>(Rank::Ace); ++r)
                {
                    deck.emplace_back(std::make_shared<Card>(
                        next_id++, static_cast<Suit>(s), static_cast<Rank>(r)));
                }
            }
            deck.emplace_back(std::make_shared<Card>(next_id++, Suit::Joker, Rank::SmallJoker));
            deck.emplace_back(std::make_shared<Card>(next_id++, Suit::Joker, Rank::BigJoker));
        }
        std::ranges::shuffle(deck, rng);
        return deck;
    }

    auto VerifyDeck(std::span<CardSP const> deck) -> void
    {
        using error::Code;
        if (deck.size() != constants::DeckSize)
            GZ_THROW(Code::State, std::format("Deck holds {} cards, expected {}", deck.size(), constants::DeckSize));

        util::IdUniqueChecker ids{};
        std::map<std::pair<Suit, Rank>, size_t> copies;
        for (CardSP const& c : deck)
        {
            if (!c) GZ_THROW(Code::State, "Null card in deck");
            ids.Add(c->id);
            bool const joker = c->suit == Suit::Joker;
            bool const joker_rank = c->rank == Rank::SmallJoker || c->rank == Rank::BigJoker;
            if (joker != joker_rank)
                GZ_THROW(Code::State, std::format("Malformed card id={}", c->id));
            ++copies[{c->suit, c->rank}];
        }
        if (ids.ContainsDup() || ids.OutOfRange())
            GZ_THROW(Code::State, "Deck card ids are not unique within 0..215");
        if (copies.size() != constants::CardsPerDeck)
            GZ_THROW(Code::State, std::format("Deck holds {} distinct cards, expected 54", copies.size()));
        for (auto const& [key, n] : copies)
        {
            if (n != constants::DeckCopies)
                GZ_THROW(Code::State, std::format("Card with {} copies in deck", n));
        }
    }

    auto PointsOf(std::span<CardSP const> cards) -> uint16_t
    {
        return std::accumulate(cards.begin(), cards.end(), uint16_t{0},
                               [](uint16_t acc, CardSP const& c)
                               {
                                   return static_cast<uint16_t>(acc + PointValue(c->rank));
                               });
    }
}
