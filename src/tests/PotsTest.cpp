//
// Created by Malik T on 11/10/2025.
//
#include <gtest/gtest.h>
#include <map>
#include <vector>

#include "../core/Pots.hpp"
#include "../core/Exception.hpp"

using namespace holdem::core;

namespace
{
auto paid_to(std::vector<Payout> const& payouts) -> std::map<SeatIdxT, ChipT>
{
    std::map<SeatIdxT, ChipT> out;
    for (Payout const& p : payouts) out[p.seat] += p.amount;
    return out;
}
} // anonymous namespace

TEST(Pots, ThreeAllInsBuildTwoSidePots)
{
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 100},
        {.seat = 1, .amount = 300},
        {.seat = 2, .amount = 500},
    };

    std::vector<Pot> const pots = PotManager::Compute(cs);
    ASSERT_EQ(pots.size(), 3u);

    EXPECT_EQ(pots[0].amount, 300);
    EXPECT_EQ(pots[0].eligible, (std::vector<SeatIdxT>{0, 1, 2}));
    EXPECT_EQ(pots[1].amount, 400);
    EXPECT_EQ(pots[1].eligible, (std::vector<SeatIdxT>{1, 2}));
    EXPECT_EQ(pots[2].amount, 200);
    EXPECT_EQ(pots[2].eligible, (std::vector<SeatIdxT>{2}));
    EXPECT_EQ(PotManager::Total(pots), 900);
}

TEST(Pots, ShortStackWinsOnlyTheMainPot)
{
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 100},
        {.seat = 1, .amount = 300},
        {.seat = 2, .amount = 500},
    };
    std::vector<Pot> const pots = PotManager::Compute(cs);

    // seat 0 best, then seat 2, then seat 1
    std::map<SeatIdxT, uint32_t> const rank{{0, 1}, {1, 30}, {2, 20}};
    auto const payouts = PotManager::Distribute(pots, [&](SeatIdxT s) { return rank.at(s); }, 0, 3);
    auto const paid = paid_to(payouts);

    EXPECT_EQ(paid.at(0), 300);
    EXPECT_EQ(paid.at(2), 600);
    EXPECT_FALSE(paid.contains(1));
}

TEST(Pots, OddChipGoesLeftOfTheDealer)
{
    // seat 0 folded after putting in a single chip
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 1, .folded = true},
        {.seat = 2, .amount = 100},
        {.seat = 4, .amount = 100},
        {.seat = 5, .amount = 100},
    };
    std::vector<Pot> const pots = PotManager::Compute(cs);
    ASSERT_EQ(pots.size(), 1u);
    ASSERT_EQ(pots[0].amount, 301);
    EXPECT_EQ(pots[0].eligible, (std::vector<SeatIdxT>{2, 4, 5}));

    auto const payouts = PotManager::Distribute(pots, [](SeatIdxT) { return 7u; }, 1, 6);
    auto const paid = paid_to(payouts);

    EXPECT_EQ(paid.at(2), 101);
    EXPECT_EQ(paid.at(4), 100);
    EXPECT_EQ(paid.at(5), 100);
}

TEST(Pots, OddChipsWrapPastTheLastSeat)
{
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 50},
        {.seat = 1, .amount = 50},
        {.seat = 3, .amount = 50},
        {.seat = 4, .amount = 3, .folded = true},
    };
    std::vector<Pot> const pots = PotManager::Compute(cs);
    ASSERT_EQ(PotManager::Total(pots), 153);

    // dealer 3: clockwise the winners come 0, 1, 3
    auto const payouts = PotManager::Distribute(pots, [](SeatIdxT s) { return s == 1 ? 9u : 2u; }, 3, 5);
    auto const paid = paid_to(payouts);

    EXPECT_EQ(paid.at(0), 77);
    EXPECT_EQ(paid.at(3), 76);
    EXPECT_FALSE(paid.contains(1));
}

TEST(Pots, FoldedChipsNeverBuyEligibility)
{
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 400, .folded = true},
        {.seat = 1, .amount = 200},
        {.seat = 2, .amount = 200},
    };
    std::vector<Pot> const pots = PotManager::Compute(cs);

    ASSERT_EQ(pots.size(), 1u);
    EXPECT_EQ(pots[0].amount, 800);
    EXPECT_EQ(pots[0].eligible, (std::vector<SeatIdxT>{1, 2}));
}

TEST(Pots, UncontestedPotNeedsNoRanking)
{
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 30, .folded = true},
        {.seat = 1, .amount = 60},
    };
    std::vector<Pot> const pots = PotManager::Compute(cs);

    auto const payouts = PotManager::Distribute(pots, [](SeatIdxT) -> uint32_t
    {
        ADD_FAILURE() << "rank requested for an uncontested pot";
        return 0;
    }, 0, 2);

    ASSERT_EQ(payouts.size(), 1u);
    EXPECT_EQ(payouts[0].seat, 1);
    EXPECT_EQ(payouts[0].amount, 90);
}

TEST(Pots, ContributionsAreConserved)
{
    std::vector<Contribution> const cs{
        {.seat = 0, .amount = 35},
        {.seat = 1, .amount = 900, .folded = true},
        {.seat = 2, .amount = 120},
        {.seat = 3, .amount = 120},
        {.seat = 4, .amount = 640},
        {.seat = 5, .amount = 0, .folded = true},
    };
    std::vector<Pot> const pots = PotManager::Compute(cs);
    EXPECT_EQ(PotManager::Total(pots), 35 + 900 + 120 + 120 + 640);

    auto const payouts = PotManager::Distribute(pots, [](SeatIdxT s) { return static_cast<uint32_t>(10 - s); }, 0, 6);
    ChipT paid{0};
    for (Payout const& p : payouts) paid += p.amount;
    EXPECT_EQ(paid, PotManager::Total(pots));
}
