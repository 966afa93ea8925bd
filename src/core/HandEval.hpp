//
// HandEval.hpp
//

#ifndef ARENA_HANDEVAL_HPP
#define ARENA_HANDEVAL_HPP

#include <compare>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    enum class HandCategory : uint8_t
    {
        HighCard = 0,
        OnePair,
        TwoPair,
        ThreeOfAKind,
        Straight,
        Flush,
        FullHouse,
        FourOfAKind,
        StraightFlush,
        RoyalFlush
    };

    // Ordered by category, then lexicographically by tiebreak (most significant first)
    struct HandScore
    {
        HandCategory category{HandCategory::HighCard};
        std::vector<int> tiebreak{};

        auto operator<=>(HandScore const&) const = default;
        auto operator==(HandScore const&) const -> bool = default;
    };

    // "High Card" .. "Royal Flush"
    auto CategoryName(HandCategory c) noexcept -> std::string_view;

    // Exactly five cards. Throws StateError otherwise.
    auto ScoreFive(std::span<Card const> five) -> HandScore;

    // Best five of up to seven cards, by enumerating every 5-subset.
    // Fewer than five cards scores as high card over what was given.
    auto Score(std::span<Card const> cards) -> HandScore;
}

#endif //ARENA_HANDEVAL_HPP
