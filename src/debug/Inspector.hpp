//
// Created by Malik T on 19/08/2025.
//

#ifndef HOLDEMSNG_INSPECTOR_HPP
#define HOLDEMSNG_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Tournament.hpp"
#include "../core/Turn.hpp"

namespace holdem::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Card> undealt;
            std::vector<Card> burned;
            std::vector<Card> community;
            std::vector<std::optional<HoleCards>> hole;
            std::vector<PlayerState> players;

            Phase phase{};
            GameStatus status{};
            SeatIdxT dealer{};
            std::optional<SeatIdxT> actor{};
            ChipT total_chips{};
            ChipT bet_to_match{};
            ChipT min_raise{};
            bool hand_open{false};
        };

        static inline auto Gather(TournamentEngine const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.phase = g.phase_;
            ret.status = g.status_;
            ret.dealer = g.dealer_;
            ret.total_chips = g.total_chips_;
            ret.players = g.players_;
            ret.hand_open = g.HandInProgress();

            for (PlayerState const& p : g.players_) ret.hole.push_back(p.hole);

            if (g.hand_)
            {
                Deck const& d = g.hand_->deck;
                ret.undealt.assign(d.cards_.begin() + static_cast<std::ptrdiff_t>(d.next_), d.cards_.end());
                ret.burned = d.burned_;
                ret.community = g.hand_->community;
                ret.actor = g.hand_->actor;
                ret.bet_to_match = g.hand_->round.bet_to_match;
                ret.min_raise = g.hand_->round.min_raise;
            }
            return ret;
        }

        // Test-only: overwrite stacks before the next hand starts (total is recomputed)
        static inline auto SetStacks(TournamentEngine& g, std::vector<ChipT> const& stacks) -> void
        {
            HLD_ASSERT(!g.HandInProgress(), "SetStacks mid-hand");
            HLD_ASSERT(stacks.size() == g.players_.size(), "SetStacks size mismatch");
            g.total_chips_ = 0;
            for (size_t i{}; i < stacks.size(); ++i)
            {
                g.players_[i].stack = stacks[i];
                g.total_chips_ += stacks[i];
            }
        }

        // Test-only: deal the next hand from this exact deck
        static inline auto StartHandWithDeck(TournamentEngine& g, std::vector<Card> order) -> void
        {
            HLD_ASSERT(g.status_ == GameStatus::Active && !g.HandInProgress(), "StartHandWithDeck out of turn");
            SeatIdxT const dealer = g.first_hand_ ? g.cfg_.initial_dealer : TurnManager::AdvanceDealer(g.dealer_, g.players_);
            g.first_hand_ = false;
            uint32_t const level = g.blinds_.LevelFor(g.hands_played_);
            g.BeginHand(TournamentEngine::HandSetup{
                .number = g.hands_played_ + 1,
                .dealer = dealer,
                .level = level,
                .blinds = g.blinds_.Blinds(level),
                .deck = Deck::FromOrder(std::move(order))
            });
        }
    };
}

#endif //HOLDEMSNG_INSPECTOR_HPP
