//
// Created by Malik T on 04/10/2025.
//

#include "Blinds.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"

namespace holdem::core
{
    BlindManager::BlindManager(std::vector<BlindLevel> levels, uint32_t const hands_per_level) :
        levels_(std::move(levels)),
        hands_per_level_(hands_per_level)
    {
        if (levels_.empty()) HLD_THROW(error::Code::State, "Blind schedule is empty");
        if (hands_per_level_ == 0) HLD_THROW(error::Code::State, "hands_per_level must be positive");
        for (size_t i{}; i < levels_.size(); ++i)
        {
            BlindLevel const& l = levels_[i];
            if (l.small_blind <= 0 || l.big_blind < l.small_blind)
                HLD_THROW(error::Code::State,
                          std::format("Blind level {} is malformed ({}/{})", i, l.small_blind, l.big_blind));
        }
    }

    auto BlindManager::LevelFor(uint32_t const hands_played) const noexcept -> uint32_t
    {
        return std::min(hands_played / hands_per_level_, MaxLevel());
    }

    auto BlindManager::Blinds(uint32_t const level) const -> BlindLevel
    {
        HLD_ASSERT(level < levels_.size(), "Blind level out of range");
        return levels_[level];
    }

    auto BlindManager::HandsUntilIncrease(uint32_t const hands_played) const noexcept -> uint32_t
    {
        if (LevelFor(hands_played) == MaxLevel()) return 0;
        return hands_per_level_ - hands_played % hands_per_level_;
    }
}
