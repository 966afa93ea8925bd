#include <gtest/gtest.h>
#include <random>
#include <string_view>
#include <vector>

#include "../core/Cards.hpp"
#include "../core/Exception.hpp"
#include "../core/HandEval.hpp"
#include "../core/Util.hpp"

using namespace arena::core;

namespace
{
    auto H(std::string_view text) -> std::vector<Card>
    {
        auto cs = ParseCards(text);
        EXPECT_TRUE(cs.has_value()) << text;
        return cs.value_or(std::vector<Card>{});
    }

    // independent best-of-21 by nested loops, used as the reference for Score()
    auto BruteForceBest(std::vector<Card> const& cards) -> HandScore
    {
        HandScore best{};
        bool have = false;
        size_t const n = cards.size();
        for (size_t a = 0; a < n; ++a)
            for (size_t b = a + 1; b < n; ++b)
                for (size_t c = b + 1; c < n; ++c)
                    for (size_t d = c + 1; d < n; ++d)
                        for (size_t e = d + 1; e < n; ++e)
                        {
                            std::vector<Card> const five{cards[a], cards[b], cards[c], cards[d], cards[e]};
                            HandScore s = ScoreFive(five);
                            if (!have || s > best)
                            {
                                best = s;
                                have = true;
                            }
                        }
        return best;
    }
}

TEST(HandEval, CategoriesFromHighCardToRoyal)
{
    EXPECT_EQ(ScoreFive(H("2h 5d 9c Js Kh")).category, HandCategory::HighCard);
    EXPECT_EQ(ScoreFive(H("2h 2d 9c Js Kh")).category, HandCategory::OnePair);
    EXPECT_EQ(ScoreFive(H("2h 2d 9c 9s Kh")).category, HandCategory::TwoPair);
    EXPECT_EQ(ScoreFive(H("2h 2d 2c 9s Kh")).category, HandCategory::ThreeOfAKind);
    EXPECT_EQ(ScoreFive(H("5h 6d 7c 8s 9h")).category, HandCategory::Straight);
    EXPECT_EQ(ScoreFive(H("2h 5h 9h Jh Kh")).category, HandCategory::Flush);
    EXPECT_EQ(ScoreFive(H("2h 2d 2c 9s 9h")).category, HandCategory::FullHouse);
    EXPECT_EQ(ScoreFive(H("2h 2d 2c 2s 9h")).category, HandCategory::FourOfAKind);
    EXPECT_EQ(ScoreFive(H("5s 6s 7s 8s 9s")).category, HandCategory::StraightFlush);
    EXPECT_EQ(ScoreFive(H("Td Jd Qd Kd Ad")).category, HandCategory::RoyalFlush);

    EXPECT_LT(ScoreFive(H("Ah Kd Qc Js 9h")), ScoreFive(H("2h 2d 3c 4s 5h")));
    EXPECT_LT(ScoreFive(H("Ah Ad Kc Ks Qh")), ScoreFive(H("2h 2d 2c 3s 4h")));
    EXPECT_LT(ScoreFive(H("Ah Kh Qh Jh 9h")), ScoreFive(H("2h 2d 2c 3s 3h")));
}

TEST(HandEval, CategoryNames)
{
    EXPECT_EQ(CategoryName(HandCategory::HighCard), "High Card");
    EXPECT_EQ(CategoryName(HandCategory::ThreeOfAKind), "Three of a Kind");
    EXPECT_EQ(CategoryName(HandCategory::RoyalFlush), "Royal Flush");
}

TEST(HandEval, FullHouseTiebreakIsTripsThenPair)
{
    HandScore const s = ScoreFive(H("Ah Ad Ac Kh Kd"));
    EXPECT_EQ(s.category, HandCategory::FullHouse);
    EXPECT_EQ(s.tiebreak, (std::vector<int>{14, 13}));

    // kings full of aces loses to aces full of kings
    EXPECT_LT(ScoreFive(H("Kh Kd Kc Ah Ad")), s);
}

TEST(HandEval, RoyalFlushOutOfSeven)
{
    HandScore const s = Score(H("Ah Kh Qh Jh Th 2c 3d"));
    EXPECT_EQ(s.category, HandCategory::RoyalFlush);
    EXPECT_EQ(s.tiebreak, (std::vector<int>{14, 13, 12, 11, 10}));
}

TEST(HandEval, WheelPlaysAceLow)
{
    HandScore const wheel = ScoreFive(H("Ah 2d 3c 4s 5h"));
    EXPECT_EQ(wheel.category, HandCategory::Straight);
    EXPECT_EQ(wheel.tiebreak, (std::vector<int>{5, 4, 3, 2, 1}));

    HandScore const nine_high = ScoreFive(H("5h 6d 7c 8s 9h"));
    EXPECT_LT(wheel, nine_high);
}

TEST(HandEval, SteelWheelIsNotRoyal)
{
    HandScore const s = ScoreFive(H("As 2s 3s 4s 5s"));
    EXPECT_EQ(s.category, HandCategory::StraightFlush);
    EXPECT_EQ(s.tiebreak.front(), 5);
    EXPECT_LT(s, ScoreFive(H("2s 3s 4s 5s 6s")));
}

TEST(HandEval, KickersDecideEqualPairs)
{
    HandScore const a = ScoreFive(H("Qh Qd 9c 5s 3h"));
    HandScore const b = ScoreFive(H("Qs Qc 9d 5h 2h"));
    EXPECT_GT(a, b);
    EXPECT_EQ(a.tiebreak, (std::vector<int>{12, 9, 5, 3}));

    // same ranks, different suits tie exactly
    EXPECT_EQ(ScoreFive(H("Qh Qd 9c 5s 3h")), ScoreFive(H("Qs Qc 9h 5d 3c")));
}

TEST(HandEval, BestOfSevenMatchesExhaustiveSearch)
{
    for (uint64_t seed : {1ull, 2ull, 3ull, 42ull, 777ull, 9001ull})
    {
        std::mt19937_64 rng{seed};
        Deck deck;
        deck.Shuffle(rng);

        for (int hand = 0; hand < 7; ++hand)
        {
            std::vector<Card> const seven = deck.Deal(7);
            EXPECT_EQ(Score(seven), BruteForceBest(seven)) << ToString(seven);
        }

        std::vector<Card> const six = deck.Deal(3);
        std::vector<Card> hand6 = deck.Deal(3);
        hand6.insert(hand6.end(), six.begin(), six.end());
        EXPECT_EQ(Score(hand6), BruteForceBest(hand6)) << ToString(hand6);
    }
}

TEST(HandEval, SevenCardsPickTheFlushOverTheStraight)
{
    HandScore const s = Score(H("4h 5d 6h 7c 8h Kh 2h"));
    EXPECT_EQ(s.category, HandCategory::Flush);
    EXPECT_EQ(s.tiebreak, (std::vector<int>{13, 8, 6, 4, 2}));
}

TEST(HandEval, FewerThanFiveCardsIsHighCard)
{
    HandScore const s = Score(H("3h Kd 7c"));
    EXPECT_EQ(s.category, HandCategory::HighCard);
    EXPECT_EQ(s.tiebreak, (std::vector<int>{13, 7, 3}));

    EXPECT_EQ(Score(std::vector<Card>{}).tiebreak.size(), 0u);
}

TEST(HandEval, RejectsTooManyCards)
{
    EXPECT_THROW((void)Score(H("2h 3h 4h 5h 6h 7h 8h 9h")), error::StateError);
    EXPECT_THROW((void)ScoreFive(H("2h 3h 4h 5h")), error::StateError);
}

TEST(Cards, ParseAndPrint)
{
    auto const cs = ParseCards("Ah, Td 2c,9s");
    ASSERT_TRUE(cs.has_value());
    ASSERT_EQ(cs->size(), 4u);
    EXPECT_EQ(ToString(*cs), "Ah, Td, 2c, 9s");
    EXPECT_EQ(ToString(std::vector<Card>{}), "");

    EXPECT_FALSE(ParseCard("1h").has_value());
    EXPECT_FALSE(ParseCard("Ax").has_value());
    EXPECT_FALSE(ParseCard("Ahh").has_value());
}

TEST(Cards, DeckDealsUniqueCards)
{
    std::mt19937_64 rng{7};
    Deck deck;
    deck.Shuffle(rng);

    std::vector<Card> const all = deck.Deal(constants::DeckSize);
    EXPECT_EQ(deck.Remaining(), 0u);

    util::CardUniqueChecker checker;
    checker.AddAll(all);
    EXPECT_FALSE(checker.ContainsDup());

    EXPECT_THROW((void)deck.Deal(1), error::StateError);
}
