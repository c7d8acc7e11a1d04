//
// Created by Malik T on 05/10/2025.
//

#ifndef HOLDEMSNG_EVALUATOR_HPP
#define HOLDEMSNG_EVALUATOR_HPP

#include <span>
#include <string_view>
#include "Types.hpp"

namespace holdem::core
{
    enum class HandCategory : uint8_t
    {
        HighCard,
        Pair,
        TwoPair,
        Trips,
        Straight,
        Flush,
        FullHouse,
        Quads,
        StraightFlush
    };

    struct HandScore
    {
        uint32_t rank{}; // lower is better, ties are equal hands
        HandCategory category{HandCategory::HighCard};
        std::string description;
    };

    class HandEvaluator
    {
    public:
        virtual ~HandEvaluator() = default;
        // Best five of hole + board (board may hold 0..5 cards)
        virtual auto Score(HoleCards const& hole, std::span<Card const> board) const -> HandScore = 0;
    };

    class StandardEvaluator final : public HandEvaluator
    {
    public:
        auto Score(HoleCards const& hole, std::span<Card const> board) const -> HandScore override;

        // Any 0..7 cards
        static auto Evaluate(std::span<Card const> cards) -> HandScore;
    };

    auto to_string(HandCategory c) -> std::string_view;
}

#endif //HOLDEMSNG_EVALUATOR_HPP
