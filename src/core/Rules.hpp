//
// Created by Malik T on 03/10/2025.
//

#ifndef HOLDEMSNG_RULES_HPP
#define HOLDEMSNG_RULES_HPP

#include <span>
#include "Actions.hpp"
#include "Types.hpp"
#include "State.hpp"
#include "Exception.hpp"

namespace holdem::core
{
    // Betting state of one street
    struct BettingRound
    {
        ChipT bet_to_match{};
        // Size of the last full raise; starts at the big blind
        ChipT min_raise{};
    };

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        virtual auto Legal(BettingRound const& round, PlayerState const& actor) const -> LegalActions = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(BettingRound const& round, PlayerState const& actor, Decision const& d) const
            -> CheckResult = 0;

        // Moves chips from the actor's stack and updates the round. A full raise reopens
        // action for every other seat that can still act. Sequence is left to the caller.
        virtual auto Apply(BettingRound& round, std::span<PlayerState> players, SeatIdxT actor,
                           Decision const& d) -> Action = 0;

        // Forced bet; a short stack goes all-in for what it has
        virtual auto PostBlind(PlayerState& player, ChipT amount) -> Action = 0;

        // True when no seat still owes a decision on this street
        virtual auto IsClosed(BettingRound const& round, std::span<PlayerState const> players) const -> bool = 0;

        virtual auto OwesDecision(BettingRound const& round, PlayerState const& p) const -> bool = 0;
    };
}

#endif //HOLDEMSNG_RULES_HPP
