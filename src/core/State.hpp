//
// Created by Malik T on 02/10/2025.
//

#ifndef HOLDEMSNG_STATE_HPP
#define HOLDEMSNG_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"

namespace holdem::core
{
    // Authoritative per-seat state, owned by the engine
    struct PlayerState
    {
        SeatIdxT seat{};
        std::string name;
        ActorKind kind{ActorKind::Automated};

        ChipT stack{};
        ChipT stack_at_hand_start{};
        ChipT current_bet{}; // this street
        ChipT total_contributed{}; // this hand

        std::optional<HoleCards> hole{};

        bool folded{false};
        bool all_in{false};
        bool eliminated{false};
        bool has_acted{false}; // since the last full raise on this street

        [[nodiscard]] auto InHand() const noexcept -> bool { return !eliminated && !folded && hole.has_value(); }
        [[nodiscard]] auto CanAct() const noexcept -> bool { return InHand() && !all_in; }
    };

    struct Pot
    {
        ChipT amount{};
        std::vector<SeatIdxT> eligible; // ascending seat order
    };

    // What the current actor may do right now
    struct LegalActions
    {
        bool can_fold{false};
        bool can_check{false};
        bool can_call{false};
        bool can_raise{false};
        ChipT call_amount{}; // chips a call would commit
        ChipT min_raise_to{};
        ChipT max_raise_to{}; // all-in level
    };

    struct ShowdownEntry
    {
        SeatIdxT seat{};
        uint32_t rank{}; // lower is better
        std::string description;
    };

    struct Payout
    {
        size_t pot_index{};
        SeatIdxT seat{};
        ChipT amount{};
    };

    struct PlayerView
    {
        SeatIdxT seat{};
        std::string name;
        ActorKind kind{ActorKind::Automated};
        ChipT stack{};
        ChipT current_bet{};
        ChipT total_contributed{};
        std::optional<HoleCards> hole{}; // empty when hidden from the viewer
        bool folded{false};
        bool all_in{false};
        bool eliminated{false};
        bool has_acted{false};
        bool is_dealer{false};
    };

    // Immutable snapshot exposed to sinks and decision sources (value copy)
    struct TableSnapshot
    {
        uint32_t hand_number{};
        uint64_t sequence{}; // strictly increasing within a hand
        std::optional<SeatIdxT> viewer{}; // empty for the full (unredacted) view

        GameStatus status{GameStatus::Waiting};
        GameMode mode{GameMode::Player};
        Phase phase{Phase::BetweenHands};
        bool aborted{false};

        SeatIdxT dealer{};
        std::optional<SeatIdxT> small_blind_seat{};
        std::optional<SeatIdxT> big_blind_seat{};
        uint32_t blind_level{};
        ChipT small_blind{};
        ChipT big_blind{};
        uint32_t hands_played{};

        std::vector<PlayerView> players;
        std::vector<Card> community;
        std::vector<Pot> pots;
        ChipT bet_to_match{};
        ChipT min_raise{};

        std::optional<SeatIdxT> current_actor{};
        std::optional<LegalActions> legal{}; // for the current actor

        std::vector<Action> actions; // this hand, append-only

        // Result of the last finished hand, kept until the next hand starts
        std::vector<ShowdownEntry> showdown;
        std::vector<Payout> payouts;
    };

    // Archived, read-only record handed to persistence at the close of a hand
    struct HandRecord
    {
        uint32_t hand_number{};
        SeatIdxT dealer{};
        SeatIdxT small_blind_seat{};
        SeatIdxT big_blind_seat{};
        uint32_t blind_level{};
        ChipT small_blind{};
        ChipT big_blind{};
        ChipT min_raise{}; // opening raise increment (the level's big blind)

        std::vector<ChipT> initial_stacks; // by seat, before blinds
        std::vector<bool> eliminated_before; // by seat
        std::vector<std::optional<HoleCards>> hole_cards; // by seat
        std::vector<Card> deck_order; // top of deck first, as shuffled
        std::vector<Card> community;

        std::vector<Action> actions;
        std::vector<Pot> pots;
        std::vector<Payout> payouts;
        std::vector<SeatIdxT> winners; // seats that received chips
        std::vector<ShowdownEntry> showdown;
        bool went_to_showdown{false};

        std::vector<ChipT> final_stacks; // by seat
        std::vector<SeatIdxT> eliminated; // in elimination order
    };

    struct Standing
    {
        SeatIdxT seat{};
        std::string name;
        uint32_t finish_position{}; // 1 = winner
        uint32_t hands_survived{};
        ChipT chips{};
    };

    struct TournamentStats
    {
        uint32_t total_hands{};
        ChipT biggest_pot{};
        uint32_t biggest_pot_hand{};
        std::string best_hand_name;
        std::optional<uint32_t> best_hand_rank{};
        std::optional<SeatIdxT> best_hand_seat{};
        uint32_t best_hand_number{};
        uint32_t total_folds{};
        uint32_t total_raises{};
        uint32_t total_all_ins{};
        uint32_t showdowns{};
        uint32_t hands_won_without_showdown{};
    };

    struct TournamentResult
    {
        std::optional<Standing> winner{};
        std::vector<Standing> standings;
        TournamentStats stats{};
        bool aborted{false};
    };
} // namespace holdem::core

#endif //HOLDEMSNG_STATE_HPP
