//
// HandEval.cpp
//

#include "HandEval.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <format>
#include <functional>
#include <utility>

#include "Exception.hpp"

namespace arena::core
{
    namespace
    {
        auto ValuesDescending(std::span<Card const> cards) -> std::vector<int>
        {
            std::vector<int> v;
            v.reserve(cards.size());
            for (Card const& c : cards) v.push_back(std::to_underlying(c.rank));
            std::ranges::sort(v, std::greater<>{});
            return v;
        }

        // Returns the straight's tiebreak (top card first) or empty when not a straight.
        // The wheel A-5-4-3-2 plays the Ace low.
        auto StraightSequence(std::vector<int> const& desc) -> std::vector<int>
        {
            if (std::ranges::adjacent_find(desc) != desc.end()) return {};
            if (desc.front() - desc.back() == 4) return desc;
            if (desc == std::vector<int>{14, 5, 4, 3, 2}) return {5, 4, 3, 2, 1};
            return {};
        }
    }

    auto CategoryName(HandCategory const c) noexcept -> std::string_view
    {
        switch (c)
        {
        case HandCategory::HighCard: return "High Card";
        case HandCategory::OnePair: return "One Pair";
        case HandCategory::TwoPair: return "Two Pair";
        case HandCategory::ThreeOfAKind: return "Three of a Kind";
        case HandCategory::Straight: return "Straight";
        case HandCategory::Flush: return "Flush";
        case HandCategory::FullHouse: return "Full House";
        case HandCategory::FourOfAKind: return "Four of a Kind";
        case HandCategory::StraightFlush: return "Straight Flush";
        case HandCategory::RoyalFlush: return "Royal Flush";
        }
        return "Unknown";
    }

    auto ScoreFive(std::span<Card const> five) -> HandScore
    {
        if (five.size() != constants::HandSize) [[unlikely]]
        {
            ARN_THROW(error::Code::State, std::format("ScoreFive given {} cards", five.size()));
        }

        std::vector<int> const desc = ValuesDescending(five);
        bool const flush = std::ranges::all_of(five, [&](Card const& c) { return c.suit == five[0].suit; });
        std::vector<int> const straight = StraightSequence(desc);

        if (flush && !straight.empty())
        {
            bool const royal = straight.front() == std::to_underlying(Rank::Ace);
            return {royal ? HandCategory::RoyalFlush : HandCategory::StraightFlush, straight};
        }

        // (count, value) groups, highest count then highest value first
        std::array<int, 15> counts{};
        for (int const v : desc) ++counts[v];

        std::vector<std::pair<int, int>> groups;
        for (int v = 14; v >= 2; --v)
        {
            if (counts[v]) groups.emplace_back(counts[v], v);
        }
        std::ranges::stable_sort(groups, [](auto const& l, auto const& r) { return l.first > r.first; });

        std::vector<int> grouped;
        grouped.reserve(groups.size());
        for (auto const& g : groups) grouped.push_back(g.second);

        int const top = groups[0].first;
        int const second = groups.size() > 1 ? groups[1].first : 0;

        if (top == 4) return {HandCategory::FourOfAKind, grouped};
        if (top == 3 && second == 2) return {HandCategory::FullHouse, grouped};
        if (flush) return {HandCategory::Flush, desc};
        if (!straight.empty()) return {HandCategory::Straight, straight};
        if (top == 3) return {HandCategory::ThreeOfAKind, grouped};
        if (top == 2 && second == 2) return {HandCategory::TwoPair, grouped};
        if (top == 2) return {HandCategory::OnePair, grouped};
        return {HandCategory::HighCard, desc};
    }

    auto Score(std::span<Card const> cards) -> HandScore
    {
        if (cards.size() > constants::MaxScoredCards) [[unlikely]]
        {
            ARN_THROW(error::Code::State, std::format("Score given {} cards, at most {} supported",
                                                      cards.size(), constants::MaxScoredCards));
        }
        if (cards.size() < constants::HandSize)
        {
            return {HandCategory::HighCard, ValuesDescending(cards)};
        }

        HandScore best{};
        bool have = false;
        std::array<Card, constants::HandSize> pick{};

        uint32_t const limit = uint32_t{1} << cards.size();
        for (uint32_t mask = 0; mask < limit; ++mask)
        {
            if (std::popcount(mask) != static_cast<int>(constants::HandSize)) continue;

            size_t k = 0;
            for (size_t i = 0; i < cards.size(); ++i)
            {
                if (mask & (uint32_t{1} << i)) pick[k++] = cards[i];
            }

            HandScore s = ScoreFive(pick);
            if (!have || s > best)
            {
                best = std::move(s);
                have = true;
            }
        }
        return best;
    }
}
