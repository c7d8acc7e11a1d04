//
// Created by Malik T on 04/10/2025.
//

#ifndef HOLDEMSNG_BLINDS_HPP
#define HOLDEMSNG_BLINDS_HPP

#include <algorithm>
#include "Types.hpp"

namespace holdem::core
{
    // Escalating blind schedule. The last level holds once reached.
    class BlindManager
    {
    public:
        BlindManager(std::vector<BlindLevel> levels, uint32_t hands_per_level);

        [[nodiscard]] auto LevelFor(uint32_t hands_played) const noexcept -> uint32_t;
        [[nodiscard]] auto Blinds(uint32_t level) const -> BlindLevel;
        [[nodiscard]] auto BlindsFor(uint32_t hands_played) const -> BlindLevel { return Blinds(LevelFor(hands_played)); }
        [[nodiscard]] auto MaxLevel() const noexcept -> uint32_t { return static_cast<uint32_t>(levels_.size() - 1); }
        [[nodiscard]] auto HandsPerLevel() const noexcept -> uint32_t { return hands_per_level_; }

        // Hands left at the current level; 0 on the last level
        [[nodiscard]] auto HandsUntilIncrease(uint32_t hands_played) const noexcept -> uint32_t;

        // What a seat actually posts: the blind or its whole stack
        static auto PostingAmount(ChipT blind, ChipT stack) noexcept -> ChipT { return std::min(blind, stack); }

    private:
        std::vector<BlindLevel> levels_;
        uint32_t hands_per_level_;
    };
}

#endif //HOLDEMSNG_BLINDS_HPP
