//
// Created by Malik T on 03/10/2025.
//

#ifndef HOLDEMSNG_NOLIMITRULES_HPP
#define HOLDEMSNG_NOLIMITRULES_HPP
#include "Rules.hpp"

namespace holdem::core
{
    class NoLimitRules final : public Rules
    {
    public:
        auto Legal(BettingRound const& round, PlayerState const& actor) const -> LegalActions override;
        auto Validate(BettingRound const& round, PlayerState const& actor, Decision const& d) const
            -> CheckResult override;
        auto Apply(BettingRound& round, std::span<PlayerState> players, SeatIdxT actor,
                   Decision const& d) -> Action override;
        auto PostBlind(PlayerState& player, ChipT amount) -> Action override;
        auto IsClosed(BettingRound const& round, std::span<PlayerState const> players) const -> bool override;
        auto OwesDecision(BettingRound const& round, PlayerState const& p) const -> bool override;

        // Moves up to `chips` from stack to the pot; returns what actually moved
        static auto Commit(PlayerState& p, ChipT chips) -> ChipT;
    };
}

#endif //HOLDEMSNG_NOLIMITRULES_HPP
