//
// Created by Malik T on 05/10/2025.
//

#include "Pots.hpp"

#include <algorithm>
#include <format>
#include <numeric>
#include <ranges>
#include "Exception.hpp"
#include "Util.hpp"

namespace holdem::core
{
    auto PotManager::Compute(std::span<Contribution const> contributions) -> std::vector<Pot>
    {
        ChipT const total = std::accumulate(contributions.begin(), contributions.end(), ChipT{0},
                                            [](ChipT acc, Contribution const& c) { return acc + c.amount; });

        std::vector<ChipT> tiers = contributions
            | std::views::filter([](Contribution const& c) { return !c.folded && c.amount > 0; })
            | std::views::transform([](Contribution const& c) { return c.amount; })
            | std::ranges::to<std::vector>();
        std::ranges::sort(tiers);
        auto const dup = std::ranges::unique(tiers);
        tiers.erase(dup.begin(), dup.end());

        std::vector<Pot> pots;
        if (tiers.empty())
        {
            // no live money in yet; a single pot keeps whatever was posted
            Pot main{.amount = total};
            for (Contribution const& c : contributions)
            {
                if (!c.folded) main.eligible.push_back(c.seat);
            }
            std::ranges::sort(main.eligible);
            pots.push_back(std::move(main));
            return pots;
        }

        ChipT previous{0};
        for (ChipT const cap : tiers)
        {
            Pot pot{};
            for (Contribution const& c : contributions)
            {
                pot.amount += std::clamp(c.amount, previous, cap) - previous;
                if (!c.folded && c.amount >= cap) pot.eligible.push_back(c.seat);
            }
            std::ranges::sort(pot.eligible);
            pots.push_back(std::move(pot));
            previous = cap;
        }

        // folded money above the highest live level belongs to the last pot
        for (Contribution const& c : contributions)
        {
            if (c.amount > previous) pots.back().amount += c.amount - previous;
        }

        HLD_INVARIANT(Total(pots) == total,
                      std::format("Pots hold {} but {} was contributed", Total(pots), total));
        for (size_t i{1}; i < pots.size(); ++i)
        {
            HLD_INVARIANT(std::ranges::includes(pots[i - 1].eligible, pots[i].eligible),
                          "Side pot eligibility is not nested");
        }
        return pots;
    }

    auto PotManager::Distribute(std::span<Pot const> pots, RankFn const& rank_of, SeatIdxT const dealer,
                                size_t const seat_count) -> std::vector<Payout>
    {
        std::vector<Payout> out;
        for (size_t idx{}; idx < pots.size(); ++idx)
        {
            Pot const& pot = pots[idx];
            if (pot.amount == 0) continue;
            HLD_INVARIANT(!pot.eligible.empty(), std::format("Pot {} has no eligible seat", idx));

            if (pot.eligible.size() == 1)
            {
                out.push_back(Payout{.pot_index = idx, .seat = pot.eligible.front(), .amount = pot.amount});
                continue;
            }

            std::vector<std::pair<SeatIdxT, uint32_t>> ranked;
            ranked.reserve(pot.eligible.size());
            for (SeatIdxT const seat : pot.eligible) ranked.emplace_back(seat, rank_of(seat));

            uint32_t const best = std::ranges::min(ranked | std::views::values);
            std::vector<SeatIdxT> winners = ranked
                | std::views::filter([best](auto const& r) { return r.second == best; })
                | std::views::keys
                | std::ranges::to<std::vector>();

            std::ranges::sort(winners, {}, [&](SeatIdxT const s)
            {
                return util::ClockwiseDistance(dealer, s, seat_count);
            });

            auto const k = static_cast<ChipT>(winners.size());
            ChipT const share = pot.amount / k;
            ChipT const odd = pot.amount % k;
            for (ChipT i{}; i < k; ++i)
            {
                ChipT const amount = share + (i < odd ? 1 : 0);
                if (amount > 0)
                    out.push_back(Payout{.pot_index = idx, .seat = winners[static_cast<size_t>(i)], .amount = amount});
            }
        }
        return out;
    }

    auto PotManager::Total(std::span<Pot const> pots) -> ChipT
    {
        ChipT sum{0};
        for (Pot const& p : pots) sum += p.amount;
        return sum;
    }
}
