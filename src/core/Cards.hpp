//
// Cards.hpp
//

#ifndef ARENA_CARDS_HPP
#define ARENA_CARDS_HPP

#include <cstdint>
#include <expected>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    auto RankChar(Rank r) noexcept -> char;
    auto SuitChar(Suit s) noexcept -> char;

    // "Ah", "Td"
    auto ToString(Card const& c) -> std::string;
    // Cards joined with ", "; empty input gives an empty string
    auto ToString(std::span<Card const> cards) -> std::string;

    auto ParseCard(std::string_view text) -> std::expected<Card, std::string>;
    // Accepts cards separated by spaces and/or commas: "Ah Kd", "Ah,Kd", "Ah, Kd"
    auto ParseCards(std::string_view text) -> std::expected<std::vector<Card>, std::string>;

    class Deck
    {
    public:
        Deck();

        // Restores all 52 cards in suit-major order
        auto Reset() -> void;
        auto Shuffle(std::mt19937_64& rng) -> void;

        // Removes n cards from the top. Throws StateError when fewer than n remain.
        [[nodiscard]]
        auto Deal(size_t n) -> std::vector<Card>;

        [[nodiscard]]
        auto Remaining() const noexcept -> size_t { return cards_.size(); }

        [[nodiscard]]
        auto Cards() const noexcept -> std::span<Card const> { return cards_; }

    private:
        std::vector<Card> cards_;
    };
}

#endif //ARENA_CARDS_HPP
