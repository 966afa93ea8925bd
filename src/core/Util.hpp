//
// Util.hpp
//

#ifndef ARENA_UTIL_HPP
#define ARENA_UTIL_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <utility>
#include "Types.hpp"

namespace arena::core::util
{
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(c.suit) * 13 + (static_cast<uint64_t>(c.rank) - 2);
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
        }
        auto AddAll(std::span<Card const> cs) -> void
        {
            for (Card const& c : cs) Add(c);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        uint64_t cards_;
        bool contains_dup_;
    };

    // Money comparisons tolerate the rounding left behind by repeated additions
    inline constexpr double Epsilon = 1e-9;

    inline auto NearlyEqual(double const a, double const b) noexcept -> bool
    {
        return std::fabs(a - b) <= Epsilon * std::max({1.0, std::fabs(a), std::fabs(b)});
    }

    inline auto Clamp(double const v, double const lo, double const hi) noexcept -> double
    {
        return std::min(std::max(v, lo), hi);
    }
}

#endif //ARENA_UTIL_HPP
