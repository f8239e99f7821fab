//
// Hand.cpp
//

#include "Hand.hpp"

#include <algorithm>
#include <format>
#include "Util.hpp"

namespace gunzi::core
{
    auto Hand::Add(CardSP card) -> void
    {
        GZ_ASSERT(card != nullptr, "Null card added to hand");
        CardId const id = card->id;
        auto const [it, inserted] = cards_.emplace(id, std::move(card));
        GZ_ASSERT(inserted, std::format("Card id {} already in hand", id));
    }

    auto Hand::Find(CardId const id) const -> CardSP
    {
        auto const it = cards_.find(id);
        return it != cards_.end() ? it->second : CardSP{};
    }

    auto Hand::Select(std::span<CardId const> ids) const -> SelectResult
    {
        using RVC = error::RuleViolationCode;
        util::IdUniqueChecker checker{};
        std::vector<CardSP> out;
        out.reserve(ids.size());
        for (CardId const id : ids)
        {
            checker.Add(id);
            if (checker.ContainsDup())
                return std::unexpected(error::Viol(RVC::DuplicateCard).with_card(id));
            CardSP c = Find(id);
            if (!c)
                return std::unexpected(error::Viol(RVC::UnknownCard).with_card(id));
            out.push_back(std::move(c));
        }
        return out;
    }

    auto Hand::Take(std::span<CardId const> ids) -> std::vector<CardSP>
    {
        std::vector<CardSP> out;
        out.reserve(ids.size());
        for (CardId const id : ids)
        {
            auto const it = cards_.find(id);
            if (it == cards_.end())
                GZ_THROW(error::Code::State, std::format("Card id {} not in hand", id));
            out.push_back(std::move(it->second));
            cards_.erase(it);
        }
        return out;
    }

    auto Hand::Cards() const -> std::vector<CardSP>
    {
        std::vector<CardSP> out;
        out.reserve(cards_.size());
        for (auto const& [id, c] : cards_) out.push_back(c);
        std::ranges::sort(out, {}, [](CardSP const& c) { return c->id; });
        return out;
    }

    auto Hand::Values() const -> std::vector<CardVal>
    {
        std::vector<CardSP> const cards = Cards();
        return util::ToVals(cards);
    }
}
