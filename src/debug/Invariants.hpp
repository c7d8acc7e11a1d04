//
// Created by Malik T on 19/08/2025.
//

#ifndef HOLDEMSNG_INVARIANTS_HPP
#define HOLDEMSNG_INVARIANTS_HPP

#include "../core/Tournament.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"
#include <ranges>
#include <vector>

namespace holdem::core::debug
{
    // A second layer of checks on top of the engine's own, reaching into private state
    inline auto CheckInvariants(TournamentEngine const& g) -> void
    {
#if HLD_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(g);

        // 1) Chips are never created or destroyed
        {
            ChipT sum{0};
            for (PlayerState const& p : s.players) sum += p.stack + p.total_contributed;
            HLD_ASSERT(sum == s.total_chips, "Chip total drifted");
        }

        // 2) Every card is in exactly one place and all 52 are accounted for
        if (s.hand_open)
        {
            util::CardUniqueChecker checker{};
            checker.AddAll(s.undealt);
            checker.AddAll(s.burned);
            checker.AddAll(s.community);
            for (auto const& h : s.hole)
            {
                if (h) checker.AddAll(*h);
            }
            HLD_ASSERT(!checker.ContainsDup(), "Duplicate card across zones");
            HLD_ASSERT(checker.Count() == constants::DeckSize, "Materialized card count != 52");
        }

        // 3) Board size matches the street, one burn per dealt street
        if (s.hand_open)
        {
            size_t const board = s.community.size();
            switch (s.phase)
            {
            case Phase::PreFlop: HLD_ASSERT(board == 0, "Board dealt pre-flop");
                break;
            case Phase::Flop: HLD_ASSERT(board == 3, "Flop is not three cards");
                break;
            case Phase::Turn: HLD_ASSERT(board == 4, "Turn board is not four cards");
                break;
            case Phase::River: HLD_ASSERT(board == 5, "River board is not five cards");
                break;
            default: break;
            }
            HLD_ASSERT(s.burned.size() == (board == 0 ? 0 : board - 2), "Burn count out of step with the board");
        }

        // 4) The acting seat can act, and nobody owes more than the bet to match
        if (s.actor)
        {
            PlayerState const& a = s.players.at(*s.actor);
            HLD_ASSERT(a.CanAct(), "Actor cannot act");
            for (PlayerState const& p : s.players)
            {
                HLD_ASSERT(p.current_bet <= s.bet_to_match, "A street bet exceeds the bet to match");
            }
        }

        // 5) Dealer sits at a live seat
        if (s.hand_open)
        {
            HLD_ASSERT(!s.players.at(s.dealer).eliminated, "Dealer is eliminated");
        }
#endif // HLD_ENABLE_TEST_HOOKS == true
    }
}
#endif //HOLDEMSNG_INVARIANTS_HPP
