//
// Created by Malik T on 05/10/2025.
//

#include "Evaluator.hpp"

#include <algorithm>
#include <bit>
#include <format>
#include <initializer_list>
#include "Exception.hpp"

namespace
{
    using holdem::core::HandCategory;

    // Strength = category in bits 20+, up to five kicker ranks as nibbles below it
    constexpr uint32_t kWorstStrength = (static_cast<uint32_t>(HandCategory::StraightFlush) + 1) << 20;

    constexpr std::array<std::string_view, 15> kRankName{
        "", "", "Two", "Three", "Four", "Five", "Six", "Seven", "Eight", "Nine", "Ten",
        "Jack", "Queen", "King", "Ace"
    };
    constexpr std::array<std::string_view, 15> kRankPlural{
        "", "", "Twos", "Threes", "Fours", "Fives", "Sixes", "Sevens", "Eights", "Nines", "Tens",
        "Jacks", "Queens", "Kings", "Aces"
    };

    auto Pack(HandCategory const cat, std::initializer_list<int> kickers) -> uint32_t
    {
        uint32_t strength = static_cast<uint32_t>(cat) << 20;
        int shift = 16;
        for (int const k : kickers)
        {
            strength |= static_cast<uint32_t>(k) << shift;
            shift -= 4;
        }
        return strength;
    }

    // bit r set for each rank r present (2..14)
    auto StraightHigh(uint32_t mask) -> int
    {
        if (mask & (1u << 14)) mask |= (1u << 1); // wheel
        for (int high = 14; high >= 5; --high)
        {
            uint32_t const want = 0x1Fu << (high - 4);
            if ((mask & want) == want) return high;
        }
        return 0;
    }

    // Highest `n` ranks of `mask`, skipping the excluded ones
    auto TopRanks(uint32_t const mask, size_t const n, std::initializer_list<int> exclude = {}) -> std::vector<int>
    {
        std::vector<int> out;
        for (int r = 14; r >= 2 && out.size() < n; --r)
        {
            if (!(mask & (1u << r))) continue;
            if (std::ranges::find(exclude, r) != exclude.end()) continue;
            out.push_back(r);
        }
        return out;
    }

    auto At(std::vector<int> const& v, size_t i) -> int { return i < v.size() ? v[i] : 0; }
}

namespace holdem::core
{
    auto to_string(HandCategory const c) -> std::string_view
    {
        switch (c)
        {
        case HandCategory::HighCard: return "High Card";
        case HandCategory::Pair: return "Pair";
        case HandCategory::TwoPair: return "Two Pair";
        case HandCategory::Trips: return "Three of a Kind";
        case HandCategory::Straight: return "Straight";
        case HandCategory::Flush: return "Flush";
        case HandCategory::FullHouse: return "Full House";
        case HandCategory::Quads: return "Four of a Kind";
        case HandCategory::StraightFlush: return "Straight Flush";
        }
        return "?";
    }

    auto StandardEvaluator::Score(HoleCards const& hole, std::span<Card const> board) const -> HandScore
    {
        HLD_ASSERT(board.size() <= constants::BoardSize, "Board holds more than five cards");
        std::vector<Card> cards(hole.begin(), hole.end());
        cards.insert(cards.end(), board.begin(), board.end());
        return Evaluate(cards);
    }

    auto StandardEvaluator::Evaluate(std::span<Card const> cards) -> HandScore
    {
        std::array<uint8_t, 15> counts{};
        std::array<uint32_t, 4> suit_mask{};
        uint32_t rank_mask{0};

        for (Card const& c : cards)
        {
            auto const r = static_cast<int>(c.rank);
            ++counts[r];
            suit_mask[static_cast<size_t>(c.suit)] |= 1u << r;
            rank_mask |= 1u << r;
        }

        std::vector<int> quads, trips, pairs;
        for (int r = 14; r >= 2; --r)
        {
            if (counts[r] == 4) quads.push_back(r);
            else if (counts[r] == 3) trips.push_back(r);
            else if (counts[r] == 2) pairs.push_back(r);
        }

        std::optional<uint32_t> flush_mask{};
        for (uint32_t const m : suit_mask)
        {
            if (std::popcount(m) >= 5) flush_mask = m;
        }

        auto make = [](HandCategory const cat, uint32_t const strength, std::string desc) -> HandScore
        {
            return HandScore{.rank = kWorstStrength - strength, .category = cat, .description = std::move(desc)};
        };

        if (flush_mask)
        {
            if (int const high = StraightHigh(*flush_mask))
            {
                std::string desc = high == 14
                                       ? std::string{"Royal Flush"}
                                       : std::format("Straight Flush, {} high", kRankName[high]);
                return make(HandCategory::StraightFlush, Pack(HandCategory::StraightFlush, {high}), std::move(desc));
            }
        }

        if (!quads.empty())
        {
            int const q = quads.front();
            int const kicker = At(TopRanks(rank_mask, 1, {q}), 0);
            return make(HandCategory::Quads, Pack(HandCategory::Quads, {q, kicker}),
                        std::format("Four of a Kind, {}", kRankPlural[q]));
        }

        if (!trips.empty() && (trips.size() >= 2 || !pairs.empty()))
        {
            int const t = trips.front();
            int const p = std::max(trips.size() >= 2 ? trips[1] : 0, pairs.empty() ? 0 : pairs.front());
            return make(HandCategory::FullHouse, Pack(HandCategory::FullHouse, {t, p}),
                        std::format("Full House, {} full of {}", kRankPlural[t], kRankPlural[p]));
        }

        if (flush_mask)
        {
            auto const top = TopRanks(*flush_mask, 5);
            return make(HandCategory::Flush,
                        Pack(HandCategory::Flush, {At(top, 0), At(top, 1), At(top, 2), At(top, 3), At(top, 4)}),
                        std::format("Flush, {} high", kRankName[At(top, 0)]));
        }

        if (int const high = StraightHigh(rank_mask))
        {
            return make(HandCategory::Straight, Pack(HandCategory::Straight, {high}),
                        std::format("Straight, {} high", kRankName[high]));
        }

        if (!trips.empty())
        {
            int const t = trips.front();
            auto const k = TopRanks(rank_mask, 2, {t});
            return make(HandCategory::Trips, Pack(HandCategory::Trips, {t, At(k, 0), At(k, 1)}),
                        std::format("Three of a Kind, {}", kRankPlural[t]));
        }

        if (pairs.size() >= 2)
        {
            int const hi = pairs[0];
            int const lo = pairs[1];
            int const kicker = At(TopRanks(rank_mask, 1, {hi, lo}), 0);
            return make(HandCategory::TwoPair, Pack(HandCategory::TwoPair, {hi, lo, kicker}),
                        std::format("Two Pair, {} and {}", kRankPlural[hi], kRankPlural[lo]));
        }

        if (!pairs.empty())
        {
            int const p = pairs.front();
            auto const k = TopRanks(rank_mask, 3, {p});
            return make(HandCategory::Pair, Pack(HandCategory::Pair, {p, At(k, 0), At(k, 1), At(k, 2)}),
                        std::format("Pair of {}", kRankPlural[p]));
        }

        auto const top = TopRanks(rank_mask, 5);
        return make(HandCategory::HighCard,
                    Pack(HandCategory::HighCard, {At(top, 0), At(top, 1), At(top, 2), At(top, 3), At(top, 4)}),
                    top.empty() ? std::string{"High Card"} : std::format("High Card, {}", kRankName[At(top, 0)]));
    }
}
