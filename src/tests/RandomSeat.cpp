//
// RandomSeat.cpp
//

#include "RandomSeat.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "../core/Declaration.hpp"

namespace gunzi::test
{
    using namespace gunzi::core;

    namespace
    {
        auto CtxOf(SeatView const& v) -> TrumpContext
        {
            return TrumpContext{v.room->main_suit, v.room->level};
        }

        auto SuitOf(CardVal const& c, TrumpContext const& ctx) -> LogicSuit
        {
            return EffectiveSuit(Card{c.id, c.suit, c.rank}, ctx);
        }

        // ids of identical cards
        auto Groups(std::vector<CardVal> const& cards) -> std::map<std::pair<Suit, Rank>, std::vector<CardId>>
        {
            std::map<std::pair<Suit, Rank>, std::vector<CardId>> out;
            for (CardVal const& c : cards) out[{c.suit, c.rank}].push_back(c.id);
            return out;
        }
    }

    RandomSeat::RandomSeat(uint64_t rng_seed):
        rng_(rng_seed) {}

    auto RandomSeat::Choose(SeatView const& v) -> std::optional<PlayerAction>
    {
        RoomSnapshot const& room = *v.room;
        switch (room.phase)
        {
        case Phase::Drawing:
            return DeclareMove(v);
        case Phase::Exchanging:
            if (room.dealer != v.seat) return std::nullopt;
            return ExchangeMove(v);
        case Phase::Playing:
            if (room.current_turn != v.seat || v.hand.empty()) return std::nullopt;
            return room.trick.empty() ? LeadMove(v) : FollowMove(v);
        default:
            return std::nullopt;
        }
    }

    auto RandomSeat::LeadMove(SeatView const& v) -> PlayerAction
    {
        CardVal const& c = v.hand[pick(v.hand)];
        auto const groups = Groups(v.hand);
        std::vector<CardId> const& same = groups.at({c.suit, c.rank});
        size_t const most = std::min(same.size(), constants::MaxStructure);
        size_t const n = std::uniform_int_distribution<size_t>{1, most}(rng_);
        return PlayAction{std::vector<CardId>(same.begin(), same.begin() + static_cast<std::ptrdiff_t>(n))};
    }

    auto RandomSeat::FollowMove(SeatView const& v) -> PlayerAction
    {
        TrumpContext const ctx = CtxOf(v);
        std::vector<CardVal> const& lead = v.room->trick.front().cards;
        size_t const n = lead.size();
        LogicSuit const target = SuitOf(lead.front(), ctx);

        std::vector<CardVal> suit, other;
        for (CardVal const& c : v.hand) (SuitOf(c, ctx) == target ? suit : other).push_back(c);
        std::ranges::shuffle(suit, rng_);
        std::ranges::shuffle(other, rng_);

        std::vector<CardId> out;
        if (suit.size() < n)
        {
            for (CardVal const& c : suit) out.push_back(c.id);
            for (size_t i{}; out.size() < n; ++i) out.push_back(other[i].id);
            return PlayAction{std::move(out)};
        }

        // largest structure the suit allows, capped by the lead
        auto const groups = Groups(suit);
        for (size_t req = n; req >= 2 && out.empty(); --req)
        {
            for (auto const& [key, ids] : groups)
            {
                if (ids.size() < req) continue;
                out.assign(ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(req));
                break;
            }
        }
        for (CardVal const& c : suit)
        {
            if (out.size() == n) break;
            if (std::ranges::find(out, c.id) == out.end()) out.push_back(c.id);
        }
        return PlayAction{std::move(out)};
    }

    auto RandomSeat::ExchangeMove(SeatView const& v) -> PlayerAction
    {
        std::vector<CardVal> hand = v.hand;
        std::ranges::shuffle(hand, rng_);
        std::vector<CardId> out;
        for (size_t i{}; i < constants::BottomSize; ++i) out.push_back(hand[i].id);
        return ExchangeAction{std::move(out)};
    }

    auto RandomSeat::DeclareMove(SeatView const& v) -> std::optional<PlayerAction>
    {
        if (std::uniform_int_distribution<int>{0, 3}(rng_) != 0) return std::nullopt;

        RoomSnapshot const& room = *v.room;
        std::optional<PlayerAction> best;
        uint16_t best_strength = room.declaration_strength;
        for (auto const& [key, ids] : Groups(v.hand))
        {
            bool const joker = key.first == Suit::Joker;
            if (!joker && key.second != room.level) continue;

            size_t const n = std::min(ids.size(), constants::MaxStructure);
            std::vector<CardSP> cards;
            for (size_t i{}; i < n; ++i) cards.push_back(std::make_shared<Card>(ids[i], key.first, key.second));

            uint16_t const strength = DeclarationStrength(cards, room.level);
            if (strength <= best_strength) continue;
            best_strength = strength;

            std::optional<Suit> requested;
            if (joker) requested = static_cast<Suit>(std::uniform_int_distribution<int>{0, 3}(rng_));
            best = DeclareMainAction{std::vector<CardId>(ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(n)),
                                     requested};
        }
        return best;
    }
}
