//
// Created by Malik T on 03/10/2025.
//

#include "NoLimitRules.hpp"

#include <algorithm>
#include <ranges>

namespace
{
    inline auto Viol(holdem::core::error::RuleViolationCode code) -> holdem::core::error::RuleViolation
    {
        return holdem::core::error::RuleViolation{.code = code};
    }
}

namespace holdem::core
{
    auto NoLimitRules::Commit(PlayerState& p, ChipT const chips) -> ChipT
    {
        ChipT const moved = std::clamp<ChipT>(chips, 0, p.stack);
        p.stack -= moved;
        p.current_bet += moved;
        p.total_contributed += moved;
        if (p.stack == 0) p.all_in = true;
        return moved;
    }

    auto NoLimitRules::Legal(BettingRound const& round, PlayerState const& actor) const -> LegalActions
    {
        LegalActions out{};
        if (!actor.CanAct()) return out;

        ChipT const shortfall = std::max<ChipT>(0, round.bet_to_match - actor.current_bet);
        ChipT const all_in_level = actor.current_bet + actor.stack;

        out.can_fold = true;
        out.can_check = shortfall == 0;
        out.can_call = shortfall > 0;
        out.call_amount = std::min(shortfall, actor.stack);
        // an incomplete all-in raise leaves has_acted set, so the seat may only call or fold
        out.can_raise = actor.stack > shortfall && !actor.has_acted;
        if (out.can_raise)
        {
            out.min_raise_to = std::min(round.bet_to_match + round.min_raise, all_in_level);
            out.max_raise_to = all_in_level;
        }
        return out;
    }

    auto NoLimitRules::Validate(BettingRound const& round, PlayerState const& actor, Decision const& d) const
        -> CheckResult
    {
        using RVC = ::holdem::core::error::RuleViolationCode;

        if (actor.eliminated)
            return std::unexpected(Viol(RVC::ActorEliminated).with_actor(actor.seat));
        if (!actor.hole)
            return std::unexpected(Viol(RVC::NoHandInProgress).with_actor(actor.seat));
        if (actor.folded)
            return std::unexpected(Viol(RVC::ActorFolded).with_actor(actor.seat));
        if (actor.all_in)
            return std::unexpected(Viol(RVC::ActorAllIn).with_actor(actor.seat));

        ChipT const shortfall = std::max<ChipT>(0, round.bet_to_match - actor.current_bet);

        return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, FoldAction>)
            {
                return {};
            }
            else if constexpr (std::is_same_v<T, CheckAction>)
            {
                if (shortfall > 0)
                    return std::unexpected(Viol(RVC::Check_BetOutstanding)
                                           .with_actor(actor.seat)
                                           .with_bet(round.bet_to_match, actor.current_bet));
                return {};
            }
            else if constexpr (std::is_same_v<T, CallAction>)
            {
                if (shortfall == 0)
                    return std::unexpected(Viol(RVC::Call_NothingToCall)
                                           .with_actor(actor.seat)
                                           .with_bet(round.bet_to_match, actor.current_bet));
                return {};
            }
            else if constexpr (std::is_same_v<T, RaiseAction>)
            {
                ChipT const all_in_level = actor.current_bet + actor.stack;

                if (actor.stack <= shortfall)
                    return std::unexpected(Viol(RVC::Raise_StackTooShort)
                                           .with_actor(actor.seat)
                                           .with_stack(actor.stack)
                                           .with_bet(round.bet_to_match, actor.current_bet));

                if (actor.has_acted)
                    return std::unexpected(Viol(RVC::Raise_ActionNotReopened)
                                           .with_actor(actor.seat)
                                           .with_bet(round.bet_to_match, actor.current_bet));

                if (act.to > all_in_level)
                    return std::unexpected(Viol(RVC::Raise_ExceedsStack)
                                           .with_actor(actor.seat)
                                           .with_stack(actor.stack)
                                           .with_attempted(act.to));

                if (act.to <= round.bet_to_match)
                    return std::unexpected(Viol(RVC::Raise_NotAboveBet)
                                           .with_actor(actor.seat)
                                           .with_bet(round.bet_to_match, actor.current_bet)
                                           .with_attempted(act.to));

                ChipT const minimum = round.bet_to_match + round.min_raise;
                if (act.to < minimum && act.to != all_in_level)
                    return std::unexpected(Viol(RVC::Raise_BelowMinimum)
                                           .with_actor(actor.seat)
                                           .with_attempted(act.to)
                                           .with_minimum(minimum));
                return {};
            }
            else
            {
                return std::unexpected(Viol(RVC::Internal_Unreachable));
            }
        }, d);
    }

    auto NoLimitRules::Apply(BettingRound& round, std::span<PlayerState> players, SeatIdxT const actor,
                             Decision const& d) -> Action
    {
        HLD_ASSERT(actor < players.size(), "Apply: seat out of range");
        PlayerState& p = players[actor];

        Action out{.seat = actor, .type = TypeOf(d)};

        std::visit([&]<typename T0>(T0 const& act)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, FoldAction>)
            {
                p.folded = true;
            }
            else if constexpr (std::is_same_v<T, CheckAction>)
            {
                HLD_ASSERT(p.current_bet >= round.bet_to_match, "Check applied with a bet outstanding");
            }
            else if constexpr (std::is_same_v<T, CallAction>)
            {
                out.chips = Commit(p, round.bet_to_match - p.current_bet);
                out.amount = out.chips;
            }
            else if constexpr (std::is_same_v<T, RaiseAction>)
            {
                HLD_ASSERT(act.to > round.bet_to_match, "Raise applied at or below the bet to match");
                out.chips = Commit(p, act.to - p.current_bet);
                out.amount = p.current_bet;

                ChipT const increment = p.current_bet - round.bet_to_match;
                round.bet_to_match = p.current_bet;
                if (increment >= round.min_raise)
                {
                    // full raise: everyone still able to act must respond again
                    round.min_raise = increment;
                    for (PlayerState& other : players)
                    {
                        if (other.seat != actor && other.CanAct()) other.has_acted = false;
                    }
                }
            }
        }, d);

        p.has_acted = true;
        out.all_in = p.all_in;
        return out;
    }

    auto NoLimitRules::PostBlind(PlayerState& player, ChipT const amount) -> Action
    {
        Action out{.seat = player.seat, .type = ActionType::PostBlind};
        out.chips = Commit(player, amount);
        out.amount = out.chips;
        out.all_in = player.all_in;
        return out;
    }

    auto NoLimitRules::OwesDecision(BettingRound const& round, PlayerState const& p) const -> bool
    {
        return p.CanAct() && (!p.has_acted || p.current_bet < round.bet_to_match);
    }

    auto NoLimitRules::IsClosed(BettingRound const& round, std::span<PlayerState const> players) const -> bool
    {
        auto actionable = players | std::views::filter([](PlayerState const& p) { return p.CanAct(); });
        auto const count = std::ranges::distance(actionable);

        if (count == 0) return true;
        // nobody left to bet against: the lone seat only has to match what is already in
        if (count == 1)
        {
            PlayerState const& last = *actionable.begin();
            size_t const in_hand = std::ranges::count_if(players, [](PlayerState const& p) { return p.InHand(); });
            if (in_hand > 1 && last.current_bet >= round.bet_to_match) return true;
        }
        return std::ranges::none_of(actionable, [&](PlayerState const& p) { return OwesDecision(round, p); });
    }
}
