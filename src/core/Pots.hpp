//
// Created by Malik T on 05/10/2025.
//

#ifndef HOLDEMSNG_POTS_HPP
#define HOLDEMSNG_POTS_HPP

#include <functional>
#include <span>
#include "State.hpp"

namespace holdem::core
{
    struct Contribution
    {
        SeatIdxT seat{};
        ChipT amount{};
        bool folded{false};
    };

    class PotManager
    {
    public:
        // Lower rank wins; only called for seats eligible for a contested pot
        using RankFn = std::function<uint32_t(SeatIdxT)>;

        // Main pot first, then side pots. Each tier is capped at a distinct contribution level
        // of a non-folded seat; folded chips feed the tiers they reached but never eligibility.
        static auto Compute(std::span<Contribution const> contributions) -> std::vector<Pot>;

        // Splits every pot among its best-ranked eligible seats. Odd chips go one at a time
        // to the winners nearest the dealer's left.
        static auto Distribute(std::span<Pot const> pots, RankFn const& rank_of, SeatIdxT dealer,
                               size_t seat_count) -> std::vector<Payout>;

        static auto Total(std::span<Pot const> pots) -> ChipT;
    };
}

#endif //HOLDEMSNG_POTS_HPP
