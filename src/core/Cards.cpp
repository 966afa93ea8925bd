//
// Cards.cpp
//

#include "Cards.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>

#include "Exception.hpp"

namespace arena::core
{
    auto RankChar(Rank const r) noexcept -> char
    {
        static constexpr std::array<char, 13> map{
            '2', '3', '4', '5', '6', '7', '8', '9', 'T', 'J', 'Q', 'K', 'A'
        };
        return map[std::to_underlying(r) - 2];
    }

    auto SuitChar(Suit const s) noexcept -> char
    {
        switch (s)
        {
        case Suit::Hearts: return 'h';
        case Suit::Diamonds: return 'd';
        case Suit::Clubs: return 'c';
        case Suit::Spades: return 's';
        }
        return '?';
    }

    auto ToString(Card const& c) -> std::string
    {
        return std::format("{}{}", RankChar(c.rank), SuitChar(c.suit));
    }

    auto ToString(std::span<Card const> cards) -> std::string
    {
        std::string out;
        for (size_t i{}; i < cards.size(); ++i)
        {
            out += (i ? ", " : "");
            out += ToString(cards[i]);
        }
        return out;
    }

    auto ParseCard(std::string_view const text) -> std::expected<Card, std::string>
    {
        if (text.size() != 2)
            return std::unexpected(std::format("bad card '{}': expected rank and suit", text));

        Card c{};
        switch (text[0])
        {
        case '2': c.rank = Rank::Two; break;
        case '3': c.rank = Rank::Three; break;
        case '4': c.rank = Rank::Four; break;
        case '5': c.rank = Rank::Five; break;
        case '6': c.rank = Rank::Six; break;
        case '7': c.rank = Rank::Seven; break;
        case '8': c.rank = Rank::Eight; break;
        case '9': c.rank = Rank::Nine; break;
        case 'T': case 't': c.rank = Rank::Ten; break;
        case 'J': case 'j': c.rank = Rank::Jack; break;
        case 'Q': case 'q': c.rank = Rank::Queen; break;
        case 'K': case 'k': c.rank = Rank::King; break;
        case 'A': case 'a': c.rank = Rank::Ace; break;
        default: return std::unexpected(std::format("bad rank in '{}'", text));
        }

        switch (text[1])
        {
        case 'h': case 'H': c.suit = Suit::Hearts; break;
        case 'd': case 'D': c.suit = Suit::Diamonds; break;
        case 'c': case 'C': c.suit = Suit::Clubs; break;
        case 's': case 'S': c.suit = Suit::Spades; break;
        default: return std::unexpected(std::format("bad suit in '{}'", text));
        }
        return c;
    }

    auto ParseCards(std::string_view text) -> std::expected<std::vector<Card>, std::string>
    {
        std::vector<Card> out;
        auto const is_sep = [](char const ch) { return ch == ' ' || ch == ','; };

        size_t i = 0;
        while (i < text.size())
        {
            while (i < text.size() && is_sep(text[i])) ++i;
            size_t j = i;
            while (j < text.size() && !is_sep(text[j])) ++j;
            if (j > i)
            {
                auto c = ParseCard(text.substr(i, j - i));
                if (!c) return std::unexpected(c.error());
                out.push_back(*c);
            }
            i = j;
        }
        return out;
    }

    Deck::Deck()
    {
        Reset();
    }

    auto Deck::Reset() -> void
    {
        cards_.clear();
        cards_.reserve(constants::DeckSize);
        for (uint8_t s = 0; s < 4; ++s)
        {
            for (uint8_t r = std::to_underlying(Rank::Two); r <= std::to_underlying(Rank::Ace); ++r)
            {
                cards_.push_back(Card{static_cast<Rank>(r), static_cast<Suit>(s)});
            }
        }
    }

    auto Deck::Shuffle(std::mt19937_64& rng) -> void
    {
        std::ranges::shuffle(cards_, rng);
    }

    auto Deck::Deal(size_t const n) -> std::vector<Card>
    {
        if (n > cards_.size()) [[unlikely]]
        {
            ARN_THROW(error::Code::State,
                      std::format("Cannot deal {} card(s), {} remaining", n, cards_.size()));
        }
        // top of the deck is the back of the vector
        std::vector<Card> out(cards_.end() - static_cast<std::ptrdiff_t>(n), cards_.end());
        std::ranges::reverse(out);
        cards_.resize(cards_.size() - n);
        return out;
    }
}
