//
// Created by Malik T on 04/10/2025.
//

#include "Turn.hpp"

#include <algorithm>
#include "Exception.hpp"

namespace holdem::core
{
    auto TurnManager::NextLive(SeatIdxT const from, std::span<PlayerState const> players) -> SeatIdxT
    {
        auto const next = FirstAfter(from, players, [](PlayerState const& p) { return !p.eliminated; });
        HLD_INVARIANT(next.has_value(), "No live seat at the table");
        return *next;
    }

    auto TurnManager::LiveCount(std::span<PlayerState const> players) -> size_t
    {
        return std::ranges::count_if(players, [](PlayerState const& p) { return !p.eliminated; });
    }

    auto TurnManager::AdvanceDealer(SeatIdxT const current, std::span<PlayerState const> players) -> SeatIdxT
    {
        return NextLive(current, players);
    }

    auto TurnManager::Blinds(SeatIdxT const dealer, std::span<PlayerState const> players) -> BlindSeats
    {
        HLD_ASSERT(dealer < players.size() && !players[dealer].eliminated, "Dealer seat is not live");
        HLD_ASSERT(LiveCount(players) >= constants::MinSeats, "Blinds need two live seats");

        if (LiveCount(players) == 2)
        {
            return BlindSeats{.small_blind = dealer, .big_blind = NextLive(dealer, players)};
        }
        SeatIdxT const sb = NextLive(dealer, players);
        return BlindSeats{.small_blind = sb, .big_blind = NextLive(sb, players)};
    }

    auto TurnManager::DealOrder(SeatIdxT const dealer, std::span<PlayerState const> players) -> std::vector<SeatIdxT>
    {
        std::vector<SeatIdxT> out;
        size_t const n = players.size();
        for (size_t step{1}; step <= n; ++step)
        {
            auto const seat = static_cast<SeatIdxT>((dealer + step) % n);
            if (!players[seat].eliminated) out.push_back(seat);
        }
        return out;
    }

    auto TurnManager::StreetAnchor(Phase const phase, SeatIdxT const dealer, SeatIdxT const big_blind) -> SeatIdxT
    {
        return phase == Phase::PreFlop ? big_blind : dealer;
    }

    auto TurnManager::ActingOrder(SeatIdxT const anchor, std::span<PlayerState const> players)
        -> std::vector<SeatIdxT>
    {
        std::vector<SeatIdxT> out;
        size_t const n = players.size();
        for (size_t step{1}; step <= n; ++step)
        {
            auto const seat = static_cast<SeatIdxT>((anchor + step) % n);
            if (players[seat].CanAct()) out.push_back(seat);
        }
        return out;
    }
}
