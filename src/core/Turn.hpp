//
// Created by Malik T on 04/10/2025.
//

#ifndef HOLDEMSNG_TURN_HPP
#define HOLDEMSNG_TURN_HPP

#include <span>
#include "State.hpp"

namespace holdem::core
{
    // Seat arithmetic around the table. "Live" means not eliminated.
    class TurnManager
    {
    public:
        struct BlindSeats
        {
            SeatIdxT small_blind{};
            SeatIdxT big_blind{};
        };

        static auto NextLive(SeatIdxT from, std::span<PlayerState const> players) -> SeatIdxT;
        static auto LiveCount(std::span<PlayerState const> players) -> size_t;

        // Button moves one live seat clockwise
        static auto AdvanceDealer(SeatIdxT current, std::span<PlayerState const> players) -> SeatIdxT;

        // Heads-up the dealer posts the small blind
        static auto Blinds(SeatIdxT dealer, std::span<PlayerState const> players) -> BlindSeats;

        // Live seats starting left of the dealer, dealer last
        static auto DealOrder(SeatIdxT dealer, std::span<PlayerState const> players) -> std::vector<SeatIdxT>;

        // Seat whose position the first actor of a street follows: BB pre-flop, dealer afterwards
        static auto StreetAnchor(Phase phase, SeatIdxT dealer, SeatIdxT big_blind) -> SeatIdxT;

        // Seats that can still act, in acting order after `anchor` (anchor last)
        static auto ActingOrder(SeatIdxT anchor, std::span<PlayerState const> players) -> std::vector<SeatIdxT>;

        // First seat clockwise after `from` (wrapping round to `from` itself) matching pred
        template <typename Pred>
        static auto FirstAfter(SeatIdxT const from, std::span<PlayerState const> players, Pred&& pred)
            -> std::optional<SeatIdxT>
        {
            size_t const n = players.size();
            for (size_t step{1}; step <= n; ++step)
            {
                auto const seat = static_cast<SeatIdxT>((from + step) % n);
                if (pred(players[seat])) return seat;
            }
            return std::nullopt;
        }
    };
}

#endif //HOLDEMSNG_TURN_HPP
