//
// Created by Malik T on 12/10/2025.
//
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../core/Evaluator.hpp"
#include "../core/Exception.hpp"
#include "TestTables.hpp"

using namespace holdem::core;

namespace
{
auto eval(std::string const& text) -> HandScore
{
    std::vector<Card> const cs = holdem::test::Cards(text);
    return StandardEvaluator::Evaluate(cs);
}
} // anonymous namespace

TEST(Evaluator, CategoriesAndNames)
{
    struct Case
    {
        std::string hand;
        HandCategory cat;
        std::string name;
    };
    std::vector<Case> const cases{
        {"Ah Kh Qh Jh Th 2c 3d", HandCategory::StraightFlush, "Royal Flush"},
        {"9s 8s 7s 6s 5s Ad Ac", HandCategory::StraightFlush, "Straight Flush, Nine high"},
        {"Kc Kd Kh Ks 7d 2c 3d", HandCategory::Quads, "Four of a Kind, Kings"},
        {"Kc Kd Kh 7s 7d 2c 3d", HandCategory::FullHouse, "Full House, Kings full of Sevens"},
        {"Ad 9d 7d 4d 2d Kc Qs", HandCategory::Flush, "Flush, Ace high"},
        {"Th 9d 8c 7s 6h 2c 2d", HandCategory::Straight, "Straight, Ten high"},
        {"7c 7d 7h As Kd 2c 4d", HandCategory::Trips, "Three of a Kind, Sevens"},
        {"Ac Ad 4h 4s Kd 2c 9d", HandCategory::TwoPair, "Two Pair, Aces and Fours"},
        {"Jc Jd 4h 8s Kd 2c 9d", HandCategory::Pair, "Pair of Jacks"},
        {"Ac 3d 4h 8s Kd 2c 9d", HandCategory::HighCard, "High Card, Ace"},
    };

    for (Case const& c : cases)
    {
        HandScore const s = eval(c.hand);
        EXPECT_EQ(s.category, c.cat) << c.hand;
        EXPECT_EQ(s.description, c.name) << c.hand;
    }
}

TEST(Evaluator, CategoryOrderIsRespected)
{
    std::vector<std::string> const best_to_worst{
        "Ah Kh Qh Jh Th",
        "9s 8s 7s 6s 5s",
        "Kc Kd Kh Ks 7d",
        "Kc Kd Kh 7s 7d",
        "Ad 9d 7d 4d 2d",
        "Th 9d 8c 7s 6h",
        "7c 7d 7h As Kd",
        "Ac Ad 4h 4s Kd",
        "Jc Jd 4h 8s Kd",
        "Ac 3d 4h 8s Kd",
    };
    for (size_t i{1}; i < best_to_worst.size(); ++i)
    {
        EXPECT_LT(eval(best_to_worst[i - 1]).rank, eval(best_to_worst[i]).rank)
            << best_to_worst[i - 1] << " vs " << best_to_worst[i];
    }
}

TEST(Evaluator, WheelIsTheLowestStraight)
{
    HandScore const wheel = eval("Ah 2d 3c 4s 5h Kd Kc");
    HandScore const six_high = eval("2d 3c 4s 5h 6c Kd Kc");

    EXPECT_EQ(wheel.category, HandCategory::Straight);
    EXPECT_EQ(wheel.description, "Straight, Five high");
    EXPECT_LT(six_high.rank, wheel.rank);
}

TEST(Evaluator, KickersBreakTies)
{
    EXPECT_LT(eval("Ac Ad Kh 8s 4d").rank, eval("Ac Ad Qh 8s 4d").rank);
    EXPECT_LT(eval("9c 9d 5h 5s Ad").rank, eval("9c 9d 5h 5s Kd").rank);
    // only the best five count
    EXPECT_EQ(eval("Ac Ad Kh Qs Jd 3c 2d").rank, eval("Ah As Kd Qc Jh 4c 5s").rank);
}

TEST(Evaluator, BoardPlaysForBoth)
{
    StandardEvaluator const ev{};
    std::vector<Card> const board = holdem::test::Cards("Ah Kh Qh Jh Th");
    HoleCards const a{Card{Suit::Clubs, Rank::Two}, Card{Suit::Diamonds, Rank::Three}};
    HoleCards const b{Card{Suit::Spades, Rank::Four}, Card{Suit::Clubs, Rank::Five}};

    EXPECT_EQ(ev.Score(a, board).rank, ev.Score(b, board).rank);
}

TEST(Evaluator, ThreePairsUseTheBestKicker)
{
    HandScore const s = eval("Ac Ad 9h 9s 5d 5c Kd");
    EXPECT_EQ(s.category, HandCategory::TwoPair);
    EXPECT_LT(s.rank, eval("Ac Ad 9h 9s 5d 5c Qd").rank);
}

TEST(Evaluator, PartialBoards)
{
    EXPECT_EQ(eval("Ac Ad").category, HandCategory::Pair);
    EXPECT_EQ(eval("").description, "High Card");
    EXPECT_EQ(to_string(HandCategory::FullHouse), "Full House");
}

TEST(Evaluator, OversizedBoardIsRejected)
{
    StandardEvaluator const ev{};
    std::vector<Card> const board = holdem::test::Cards("2c 3c 4c 5c 6c 7c");
    HoleCards const h{Card{Suit::Spades, Rank::Ace}, Card{Suit::Hearts, Rank::Ace}};
    EXPECT_THROW((void)ev.Score(h, board), error::AssertionError);
}
