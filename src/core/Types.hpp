//
// Types.hpp
//

#ifndef ARENA_TYPES_HPP
#define ARENA_TYPES_HPP

#define ARN_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace arena::core::constants
{
    inline constexpr size_t DeckSize = 52;
    inline constexpr size_t HoleCards = 2;
    inline constexpr size_t BoardCards = 5;
    inline constexpr size_t HandSize = 5;
    // Largest input the evaluator enumerates (2 hole + 5 board)
    inline constexpr size_t MaxScoredCards = 7;
    inline constexpr size_t Seats = 2;
}

namespace arena::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };

    // Underlying value is the poker value, 11=Jack .. 14=Ace
    enum class Rank : uint8_t
    {
        Two = 2,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    struct Card
    {
        Rank rank{Rank::Two};
        Suit suit{Suit::Hearts};

        auto operator==(Card const&) const -> bool = default;
    };

    enum class GameType : uint8_t
    {
        Poker = 0,
        Auction,
        Combat
    };

    // Seat A is always the first player handed to Play(); it owns every fixed tie-break.
    enum class Seat : uint8_t
    {
        A = 0,
        B = 1
    };

    inline auto Other(Seat const s) noexcept -> Seat { return s == Seat::A ? Seat::B : Seat::A; }
    inline auto Index(Seat const s) noexcept -> size_t { return static_cast<size_t>(s); }

    using PlayerId = std::string;

    inline auto ToString(GameType const g) -> std::string_view
    {
        switch (g)
        {
        case GameType::Poker: return "poker";
        case GameType::Auction: return "auction";
        case GameType::Combat: return "combat";
        }
        return "unknown";
    }
}

#endif //ARENA_TYPES_HPP
