//
// Created by Malik T on 02/10/2025.
//

#ifndef HOLDEMSNG_ACTIONS_HPP
#define HOLDEMSNG_ACTIONS_HPP

#include <string_view>
#include <type_traits>
#include <variant>
#include "Types.hpp"

namespace holdem::core
{
    // What a decision source may answer with
    struct FoldAction  {};
    struct CheckAction {};
    struct CallAction  {};
    // Total bet for the street after the raise ("raise to"), not the increment
    struct RaiseAction { ChipT to{}; };

    using Decision = std::variant<FoldAction, CheckAction, CallAction, RaiseAction>;

    enum class ActionType : uint8_t
    {
        Fold,
        Check,
        Call,
        Raise,
        PostBlind
    };

    // Immutable log entry. sequence is the sole ordering key for replay.
    struct Action
    {
        SeatIdxT seat{};
        ActionType type{ActionType::Fold};
        // Raise: the raise-to level. Call/PostBlind: chips committed. Fold/Check: empty.
        std::optional<ChipT> amount{};
        // Chips that moved from stack to pot with this action
        ChipT chips{0};
        bool all_in{false};
        uint32_t sequence{};
    };

    enum class Phase : uint8_t
    {
        BetweenHands,
        PreFlop,
        Flop,
        Turn,
        River,
        Showdown,
        Completed
    };

    inline auto to_string(ActionType t) -> std::string_view
    {
        switch (t)
        {
        case ActionType::Fold: return "fold";
        case ActionType::Check: return "check";
        case ActionType::Call: return "call";
        case ActionType::Raise: return "raise";
        case ActionType::PostBlind: return "post_blind";
        }
        return "?";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::BetweenHands: return "between_hands";
        case Phase::PreFlop: return "pre_flop";
        case Phase::Flop: return "flop";
        case Phase::Turn: return "turn";
        case Phase::River: return "river";
        case Phase::Showdown: return "showdown";
        case Phase::Completed: return "completed";
        }
        return "?";
    }

    inline auto to_string(GameStatus s) -> std::string_view
    {
        switch (s)
        {
        case GameStatus::Waiting: return "waiting";
        case GameStatus::Active: return "active";
        case GameStatus::Paused: return "paused";
        case GameStatus::Completed: return "completed";
        }
        return "?";
    }

    inline auto TypeOf(Decision const& d) -> ActionType
    {
        return std::visit([]<typename T0>(T0 const&) -> ActionType
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, FoldAction>) return ActionType::Fold;
            else if constexpr (std::is_same_v<T, CheckAction>) return ActionType::Check;
            else if constexpr (std::is_same_v<T, CallAction>) return ActionType::Call;
            else return ActionType::Raise;
        }, d);
    }
} // namespace holdem::core

#endif //HOLDEMSNG_ACTIONS_HPP
